/**
 * @file test_search_engine.cpp
 * @brief Unit tests for the stochastic allocation search
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/search_engine.hpp"
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/sector_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

class SearchFixture
{
protected:
    data::SectorMapping sectors_;
    data::MarketData prices_;
    analytics::MetricsEngine metrics_;
    analytics::SectorBalanceEvaluator evaluator_;
    SearchSettings settings_;

    SearchFixture()
        : sectors_({"AAPL", "MSFT", "NVDA", "JPM", "BAC", "CAT", "JNJ", "PFE", "PG", "KO", "NEE", "XOM"},
                   {"Information Technology", "Information Technology", "Information Technology",
                    "Financials", "Financials", "Industrials", "Health Care", "Health Care",
                    "Consumer Staples", "Consumer Staples", "Utilities", "Energy"}),
          prices_(data::DataLoader::generate_synthetic_data(sectors_.all_tickers(), 400, "2021-01-01",
                                                            0.012, 0.0004, 11)),
          evaluator_(sectors_)
    {
        settings_.max_retries = 3;
        settings_.local_batch_size = 8;
        settings_.global_batch_size = 8;
        settings_.time_budget_seconds = 120.0;
    }

    SearchEngine make_engine() const
    {
        return SearchEngine(metrics_, evaluator_, settings_);
    }

    static OptimizationRequest request(const data::Holdings &holdings,
                                       RiskTolerance tolerance = RiskTolerance::MODERATE)
    {
        OptimizationRequest r;
        r.holdings = holdings;
        r.risk_tolerance = tolerance;
        return r;
    }

    static double largest(const data::Holdings &holdings)
    {
        double result = 0.0;
        for (const auto &h : holdings)
        {
            result = std::max(result, h.allocation);
        }
        return result;
    }

    static Candidate candidate(double ret, double vol, int score)
    {
        Candidate c;
        c.holdings = {{"AAPL", 100.0}};
        c.metrics.annualized_return = ret;
        c.metrics.volatility = vol;
        c.metrics.sharpe_ratio = (ret - 2.0) / vol;
        c.sector_score = score;
        return c;
    }
};

// ============================================================================
// Search loop
// ============================================================================

TEST_CASE_METHOD(SearchFixture, "Search produces a valid allocation", "[SearchEngine]")
{
    auto engine = make_engine();
    std::mt19937_64 rng(settings_.seed);
    auto outcome = engine.optimize(request({{"AAPL", 40.0}, {"JPM", 30.0}, {"JNJ", 30.0}}), prices_, rng);

    REQUIRE_FALSE(outcome.pool.empty());
    REQUIRE_FALSE(outcome.stop_reason.empty());
    REQUIRE(outcome.iterations >= 1);
    REQUIRE(outcome.iterations <= settings_.max_retries);
    REQUIRE(outcome.holdings_cap == 12);
    REQUIRE_FALSE(outcome.must_include.empty());

    for (const auto &c : outcome.pool)
    {
        REQUIRE_THAT(data::total_allocation(c.holdings), WithinAbs(100.0, 0.01));
        REQUIRE(c.holdings.size() <= outcome.holdings_cap);
        REQUIRE(c.sector_score >= 0);
        REQUIRE(c.sector_score <= 100);
    }

    REQUIRE_THAT(data::total_allocation(outcome.selected.holdings), WithinAbs(100.0, 0.01));
    REQUIRE(outcome.selected_report == evaluator_.check(outcome.selected.holdings));

    SECTION("Changes are measured against the request")
    {
        REQUIRE_FALSE(outcome.sector_rebalancing_applied);
        for (const auto &h : outcome.holdings)
        {
            double before = data::allocation_of(outcome.reference, h.ticker);
            REQUIRE_THAT(h.change, WithinAbs(h.allocation - before, 1e-9));
        }
    }
}

TEST_CASE_METHOD(SearchFixture, "Conservative candidates respect the position cap", "[SearchEngine]")
{
    auto engine = make_engine();
    std::mt19937_64 rng(5);
    auto outcome = engine.optimize(request({{"AAPL", 80.0}, {"XOM", 20.0}}, RiskTolerance::CONSERVATIVE),
                                   prices_, rng);

    for (const auto &c : outcome.pool)
    {
        REQUIRE(largest(c.holdings) <= settings_.conservative_cap + 1e-6);
        REQUIRE(c.holdings.size() >= 4);
    }
    REQUIRE(largest(outcome.selected.holdings) <= settings_.conservative_cap + 1e-6);
}

TEST_CASE_METHOD(SearchFixture, "Conservative cap shortfall is reported on a small universe", "[SearchEngine]")
{
    // Three tickers cannot hold 100% with none above 30%
    data::MarketData small = prices_.select_assets({"AAPL", "JPM", "JNJ"});
    auto engine = make_engine();
    std::mt19937_64 rng(5);
    auto outcome = engine.optimize(request({{"AAPL", 60.0}, {"JPM", 40.0}}, RiskTolerance::CONSERVATIVE),
                                   small, rng);

    REQUIRE(outcome.pool.size() == 1);
    REQUIRE(largest(outcome.selected.holdings) > settings_.conservative_cap);
    REQUIRE_FALSE(outcome.conservative_cap_met);
    REQUIRE(outcome.stop_reason.find("conservative cap not met") != std::string::npos);

    SECTION("A universe wide enough keeps the flag clear")
    {
        std::mt19937_64 again(5);
        auto wide = engine.optimize(request({{"AAPL", 60.0}, {"JPM", 40.0}}, RiskTolerance::CONSERVATIVE),
                                    prices_, again);
        REQUIRE(wide.conservative_cap_met);
        REQUIRE(wide.stop_reason.find("conservative cap not met") == std::string::npos);
    }
}

TEST_CASE_METHOD(SearchFixture, "Same seed gives the same outcome", "[SearchEngine]")
{
    auto engine = make_engine();
    data::Holdings holdings = {{"MSFT", 50.0}, {"PG", 25.0}, {"CAT", 25.0}};

    std::mt19937_64 first(99);
    std::mt19937_64 second(99);
    auto a = engine.optimize(request(holdings, RiskTolerance::AGGRESSIVE), prices_, first);
    auto b = engine.optimize(request(holdings, RiskTolerance::AGGRESSIVE), prices_, second);

    REQUIRE(a.pool.size() == b.pool.size());
    REQUIRE(a.selected.holdings == b.selected.holdings);
    REQUIRE(a.stop_reason == b.stop_reason);
}

TEST_CASE_METHOD(SearchFixture, "Sector rebalancing", "[SearchEngine]")
{
    auto engine = make_engine();

    SECTION("Non-compliant holdings are rebalanced first")
    {
        auto r = request({{"AAPL", 50.0}, {"MSFT", 30.0}, {"NVDA", 20.0}});
        r.rebalance_sectors = true;
        std::mt19937_64 rng(3);
        auto outcome = engine.optimize(r, prices_, rng);

        REQUIRE(outcome.sector_rebalancing_applied);
        REQUIRE(outcome.current_sector_balance.has_value());
        REQUIRE(outcome.current_sector_balance->overall_score == 40);
        REQUIRE(outcome.sector_balanced.has_value());
        REQUIRE(outcome.sector_balanced_metrics.has_value());
        REQUIRE(outcome.reference == *outcome.sector_balanced);
        REQUIRE_FALSE(outcome.target_adjustments.empty());
        int best_score = 0;
        for (const auto &c : outcome.pool)
        {
            best_score = std::max(best_score, c.sector_score);
        }
        REQUIRE(best_score > outcome.current_sector_balance->overall_score);
    }

    SECTION("Compliant holdings are left as the reference")
    {
        auto r = request({{"AAPL", 20.0}, {"JPM", 20.0}, {"JNJ", 20.0}, {"PG", 20.0}, {"NEE", 20.0}});
        r.rebalance_sectors = true;
        std::mt19937_64 rng(3);
        auto outcome = engine.optimize(r, prices_, rng);

        REQUIRE_FALSE(outcome.sector_rebalancing_applied);
        REQUIRE(outcome.current_sector_balance.has_value());
        REQUIRE_FALSE(outcome.sector_balanced.has_value());
        REQUIRE(outcome.reference == data::normalize(r.holdings));
    }

    SECTION("Compliant holdings do not stop on sector score")
    {
        auto r = request({{"AAPL", 20.0}, {"JPM", 20.0}, {"JNJ", 20.0}, {"PG", 20.0}, {"NEE", 20.0}});
        r.rebalance_sectors = true;
        std::mt19937_64 rng(3);
        auto outcome = engine.optimize(r, prices_, rng);

        REQUIRE_FALSE(outcome.sector_rebalancing_applied);
        REQUIRE(outcome.stop_reason != "sector score 100 reached");
        REQUIRE((outcome.stop_reason == "Sharpe improvement reached" ||
                 outcome.stop_reason == "retry limit reached"));
    }
}

TEST_CASE_METHOD(SearchFixture, "Unknown holdings are rejected", "[SearchEngine]")
{
    auto engine = make_engine();
    std::mt19937_64 rng(1);
    try
    {
        engine.optimize(request({{"AAPL", 50.0}, {"ZZZZ", 50.0}}), prices_, rng);
        FAIL("expected MissingInstrumentError");
    }
    catch (const data::MissingInstrumentError &e)
    {
        REQUIRE(e.missing_tickers() == std::vector<std::string>{"ZZZZ"});
    }

    OptimizationRequest empty;
    REQUIRE_THROWS_AS(engine.optimize(empty, prices_, rng), std::invalid_argument);
}

// ============================================================================
// Building blocks
// ============================================================================

TEST_CASE("Holdings cap", "[SearchEngine]")
{
    REQUIRE(SearchEngine::holdings_cap(3, 100) == 15);
    REQUIRE(SearchEngine::holdings_cap(10, 100) == 20);
    REQUIRE(SearchEngine::holdings_cap(40, 100) == 50);
    REQUIRE(SearchEngine::holdings_cap(3, 8) == 8);
}

TEST_CASE_METHOD(SearchFixture, "Must-include tickers", "[SearchEngine]")
{
    // UP trends upward, DOWN loses about half its value
    const Eigen::Index n = 300;
    Eigen::MatrixXd matrix(n, 2);
    std::vector<std::string> dates;
    for (Eigen::Index i = 0; i < n; ++i)
    {
        double wiggle = (i % 2 == 0) ? 1.01 : 0.99;
        matrix(i, 0) = 100.0 * std::pow(1.002, static_cast<double>(i)) * wiggle;
        matrix(i, 1) = 100.0 * std::pow(0.997, static_cast<double>(i)) * wiggle;
        dates.push_back(data::DataLoader::add_days("2021-01-01", static_cast<int>(i)));
    }
    data::MarketData trend(matrix, dates, {"UP", "DOWN"});
    auto engine = make_engine();

    REQUIRE(engine.must_include({{"UP", 50.0}, {"DOWN", 50.0}}, trend, 10) == std::vector<std::string>{"UP"});

    // Nothing qualifies: the best performer is kept
    REQUIRE(engine.must_include({{"DOWN", 100.0}}, trend, 10) == std::vector<std::string>{"DOWN"});
}

TEST_CASE_METHOD(SearchFixture, "Selection policy", "[SearchEngine]")
{
    settings_.top_score_fraction = 1.0;
    auto engine = make_engine();
    analytics::PerformanceMetrics baseline;

    std::vector<Candidate> pool = {
        candidate(10.0, 20.0, 100),
        candidate(14.0, 30.0, 100),
        candidate(8.0, 10.0, 100),
        candidate(12.0, 15.0, 100),
    };

    REQUIRE(engine.select(pool, baseline, request({{"AAPL", 100.0}}, RiskTolerance::CONSERVATIVE)) == 2);
    REQUIRE(engine.select(pool, baseline, request({{"AAPL", 100.0}}, RiskTolerance::AGGRESSIVE)) == 1);
    REQUIRE(engine.select(pool, baseline, request({{"AAPL", 100.0}}, RiskTolerance::MODERATE)) == 3);

    SECTION("Target return picks the calmest candidate within tolerance")
    {
        auto r = request({{"AAPL", 100.0}});
        r.target_return = 11.0;
        // 10 and 12 are both within 2 points; 12 has the lower volatility
        REQUIRE(engine.select(pool, baseline, r) == 3);

        r.target_return = 20.0;
        REQUIRE(engine.select(pool, baseline, r) == 1);
    }

    SECTION("Empty pool")
    {
        REQUIRE_THROWS_AS(engine.select({}, baseline, request({{"AAPL", 100.0}})), std::invalid_argument);
    }
}

TEST_CASE_METHOD(SearchFixture, "Selection narrows by sector score", "[SearchEngine]")
{
    auto engine = make_engine();
    analytics::PerformanceMetrics baseline;

    // Top 20% of five candidates by sector score is a single candidate
    std::vector<Candidate> pool = {
        candidate(20.0, 10.0, 40),
        candidate(15.0, 10.0, 70),
        candidate(9.0, 10.0, 100),
        candidate(18.0, 10.0, 55),
        candidate(16.0, 10.0, 85),
    };
    REQUIRE(engine.select(pool, baseline, request({{"AAPL", 100.0}})) == 2);

    SECTION("Candidates below the viable Sharpe floor are ignored")
    {
        baseline.sharpe_ratio = 1.0;
        // Floor 0.8 drops the 9% candidate; the best remaining score is 85
        REQUIRE(engine.select(pool, baseline, request({{"AAPL", 100.0}})) == 4);
    }
}

TEST_CASE("Search settings validation", "[SearchEngine]")
{
    SearchSettings settings;
    REQUIRE_NOTHROW(settings.validate());

    settings.max_retries = 0;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    settings = SearchSettings();
    settings.local_batch_size = 0;
    settings.global_batch_size = 0;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    settings = SearchSettings();
    settings.mutation_rate = 1.5;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    auto loaded = SearchSettings::from_json({{"seed", 7}, {"time_budget_seconds", 5.0}});
    REQUIRE(loaded.seed == 7);
    REQUIRE_THAT(loaded.time_budget_seconds, WithinAbs(5.0, 1e-12));
    REQUIRE(loaded.to_json()["seed"].get<std::uint64_t>() == 7);
}

/**
 * @file test_efficient_frontier.cpp
 * @brief Unit tests for the frontier builder and the recommendation diff
 *
 * Tests frontier sampling and marker points, CSV export, and the
 * recommendation actions derived from a reference and an optimized
 * allocation.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>

#include "optimizer/efficient_frontier.hpp"

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * @class FrontierTestFixture
 * @brief Candidate pool with increasing volatility, inserted out of order
 */
class FrontierTestFixture
{
protected:
    std::vector<Candidate> pool_;
    analytics::PerformanceMetrics current_;
    analytics::PerformanceMetrics optimal_;

    FrontierTestFixture()
    {
        pool_ = make_pool(120);

        current_.annualized_return = 8.0;
        current_.volatility = 20.0;
        current_.sharpe_ratio = 0.3;

        optimal_.annualized_return = 12.0;
        optimal_.volatility = 15.0;
        optimal_.sharpe_ratio = 0.67;
    }

    static std::vector<Candidate> make_pool(size_t n)
    {
        std::vector<Candidate> pool;
        for (size_t i = 0; i < n; ++i)
        {
            // Reverse order so the builder has to sort
            double vol = 5.0 + static_cast<double>(n - i);
            Candidate c;
            c.holdings = {{"A", 100.0}};
            c.metrics.volatility = vol;
            c.metrics.annualized_return = vol * 0.5;
            c.metrics.sharpe_ratio = (c.metrics.annualized_return - 2.0) / vol;
            pool.push_back(c);
        }
        return pool;
    }

    static size_t count(const EfficientFrontierResult &result, bool FrontierPoint::*flag)
    {
        return static_cast<size_t>(std::count_if(result.points.begin(), result.points.end(),
                                                 [flag](const FrontierPoint &p)
                                                 { return p.*flag; }));
    }
};

// ============================================================================
// Frontier Builder
// ============================================================================

TEST_CASE_METHOD(FrontierTestFixture, "Frontier sampling stride", "[Frontier]")
{
    FrontierBuilder builder(50);
    auto result = builder.build(pool_, current_, optimal_);

    // 120 candidates / 50 points -> stride 2 -> 60 samples
    REQUIRE(result.num_samples() == 60);
    REQUIRE(result.points.size() == 62);

    SECTION("Samples are sorted by volatility")
    {
        for (size_t i = 1; i < result.num_samples(); ++i)
        {
            REQUIRE(result.points[i].volatility >= result.points[i - 1].volatility);
        }
        REQUIRE_THAT(result.points.front().volatility, WithinAbs(6.0, 1e-12));
    }

    SECTION("Exactly one current and one optimal marker")
    {
        REQUIRE(count(result, &FrontierPoint::is_current) == 1);
        REQUIRE(count(result, &FrontierPoint::is_optimal) == 1);
        REQUIRE(count(result, &FrontierPoint::is_sector_balanced) == 0);

        const auto &current = result.points[result.points.size() - 2];
        REQUIRE(current.is_current);
        REQUIRE_THAT(current.expected_return, WithinAbs(8.0, 1e-12));
        REQUIRE_THAT(result.points.back().sharpe_ratio, WithinAbs(0.67, 1e-12));
    }
}

TEST_CASE_METHOD(FrontierTestFixture, "Sector-balanced marker", "[Frontier]")
{
    analytics::PerformanceMetrics balanced;
    balanced.annualized_return = 10.0;
    balanced.volatility = 14.0;

    FrontierBuilder builder(50);
    auto result = builder.build(pool_, current_, optimal_, balanced);

    REQUIRE(count(result, &FrontierPoint::is_sector_balanced) == 1);
    REQUIRE(result.points.back().is_sector_balanced);
    REQUIRE_THAT(result.points.back().volatility, WithinAbs(14.0, 1e-12));
}

TEST_CASE_METHOD(FrontierTestFixture, "Small pools keep every candidate", "[Frontier]")
{
    FrontierBuilder builder(50);

    auto small = builder.build(make_pool(7), current_, optimal_);
    REQUIRE(small.num_samples() == 7);

    auto empty = builder.build({}, current_, optimal_);
    REQUIRE(empty.num_samples() == 0);
    REQUIRE(empty.points.size() == 2);
}

TEST_CASE("Frontier builder rejects a non-positive point count", "[Frontier]")
{
    REQUIRE_THROWS_AS(FrontierBuilder(0), std::invalid_argument);
    REQUIRE(FrontierBuilder(10).get_num_points() == 10);
}

TEST_CASE_METHOD(FrontierTestFixture, "Frontier CSV export", "[Frontier]")
{
    FrontierBuilder builder(50);
    auto result = builder.build(make_pool(3), current_, optimal_);

    const std::string path = "test_frontier_export.csv";
    result.export_to_csv(path);

    std::ifstream file(path);
    REQUIRE(file.is_open());
    std::string line;
    std::getline(file, line);
    REQUIRE(line == "return,volatility,sharpe_ratio,is_current,is_optimal,is_sector_balanced");

    size_t rows = 0;
    while (std::getline(file, line))
    {
        ++rows;
    }
    REQUIRE(rows == 5);

    file.close();
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(result.export_to_csv("/nonexistent/dir/frontier.csv"), std::runtime_error);
}

TEST_CASE("Frontier point JSON", "[Frontier]")
{
    FrontierPoint p;
    p.expected_return = 9.5;
    p.is_optimal = true;

    nlohmann::json j = p;
    REQUIRE(j["expected_return"].get<double>() == 9.5);
    REQUIRE(j["is_optimal"].get<bool>());
    REQUIRE_FALSE(j["is_current"].get<bool>());
}

// ============================================================================
// Recommendations
// ============================================================================

TEST_CASE("Recommendation actions and ordering", "[Recommendations]")
{
    data::Holdings reference = {{"AAPL", 50.0}, {"MSFT", 30.0}, {"GOOGL", 20.0}};
    data::Holdings optimized = {{"AAPL", 25.0}, {"MSFT", 30.5}, {"JNJ", 24.5}, {"PG", 20.0}};

    auto recs = make_recommendations(reference, optimized, RiskTolerance::MODERATE);

    // MSFT moves by 0.5 and is skipped
    REQUIRE(recs.size() == 4);

    REQUIRE(recs[0].ticker == "AAPL");
    REQUIRE(recs[0].action == "Decrease allocation");
    REQUIRE_THAT(recs[0].change, WithinAbs(-25.0, 1e-12));

    REQUIRE(recs[1].ticker == "JNJ");
    REQUIRE(recs[1].action == "Add position");
    REQUIRE_THAT(recs[1].current_allocation, WithinAbs(0.0, 1e-12));

    // GOOGL (-20) precedes PG (+20): equal magnitude keeps first-seen order
    REQUIRE(recs[2].ticker == "GOOGL");
    REQUIRE(recs[2].action == "Remove position");
    REQUIRE(recs[3].ticker == "PG");
    REQUIRE(recs[3].action == "Add position");

    for (const auto &r : recs)
    {
        REQUIRE_FALSE(r.rationale.empty());
    }
}

TEST_CASE("Increase allocation action", "[Recommendations]")
{
    auto recs = make_recommendations({{"AAPL", 40.0}, {"JNJ", 60.0}},
                                     {{"AAPL", 60.0}, {"JNJ", 40.0}},
                                     RiskTolerance::CONSERVATIVE);
    REQUIRE(recs.size() == 2);
    REQUIRE(recs[0].ticker == "AAPL");
    REQUIRE(recs[0].action == "Increase allocation");
    REQUIRE(recs[1].action == "Decrease allocation");
    REQUIRE(recs[0].rationale != recs[1].rationale);
}

TEST_CASE("Holding diff against the reference", "[Recommendations]")
{
    auto diff = diff_holdings({{"AAPL", 60.0}, {"MSFT", 40.0}}, {{"AAPL", 70.0}, {"JNJ", 30.0}});

    REQUIRE(diff.size() == 3);
    REQUIRE(diff[0].ticker == "AAPL");
    REQUIRE_THAT(diff[0].change, WithinAbs(10.0, 1e-12));
    REQUIRE(diff[1].ticker == "JNJ");
    REQUIRE_THAT(diff[1].change, WithinAbs(30.0, 1e-12));
    REQUIRE(diff[2].ticker == "MSFT");
    REQUIRE_THAT(diff[2].allocation, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(diff[2].change, WithinAbs(-40.0, 1e-12));
}

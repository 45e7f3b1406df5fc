/**
 * @file test_candidate_generator.cpp
 * @brief Unit tests for candidate sampling, mutation and risk-tolerance post-processing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/candidate_generator.hpp"
#include "data/sector_mapper.hpp"

#include <algorithm>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

class GeneratorFixture {
protected:
    GeneratorFixture()
        : sectors({"AAPL", "MSFT", "NVDA", "JPM", "BAC", "JNJ", "PFE", "PG", "KO", "NEE", "XOM", "PLD"},
                  {"Information Technology", "Information Technology", "Information Technology",
                   "Financials", "Financials", "Health Care", "Health Care", "Consumer Staples",
                   "Consumer Staples", "Utilities", "Energy", "Real Estate"}),
          generator(sectors),
          universe(sectors.all_tickers()),
          rng(7)
    {
    }

    data::SectorMapping sectors;
    CandidateGenerator generator;
    std::vector<std::string> universe;
    std::mt19937_64 rng;
};

bool holds(const data::Holdings& holdings, const std::string& ticker)
{
    return std::any_of(holdings.begin(), holdings.end(),
                       [&ticker](const data::Holding& h) { return h.ticker == ticker; });
}

double largest(const data::Holdings& holdings)
{
    double result = 0.0;
    for (const auto& h : holdings)
        result = std::max(result, h.allocation);
    return result;
}

} // anonymous namespace

TEST_CASE_METHOD(GeneratorFixture, "Unbiased sampling", "[CandidateGenerator]") {
    SECTION("Allocations sum to 100 and must-include tickers are present") {
        for (int trial = 0; trial < 25; ++trial) {
            auto holdings = generator.unbiased(universe, 5, {"JNJ", "XOM"}, rng);
            REQUIRE(holdings.size() == 5);
            REQUIRE_THAT(data::total_allocation(holdings), WithinAbs(100.0, 0.01));
            REQUIRE(holds(holdings, "JNJ"));
            REQUIRE(holds(holdings, "XOM"));
            for (const auto& h : holdings)
                REQUIRE(h.allocation >= 0.0);
        }
    }

    SECTION("Target size is capped by the universe") {
        auto holdings = generator.unbiased({"AAPL", "MSFT"}, 10, {}, rng);
        REQUIRE(holdings.size() == 2);
    }

    SECTION("Target size grows to fit every must-include ticker") {
        auto holdings = generator.unbiased(universe, 1, {"AAPL", "JPM", "PG"}, rng);
        REQUIRE(holdings.size() == 3);
    }

    SECTION("Empty universe") {
        REQUIRE_THROWS_AS(generator.unbiased({}, 3, {}, rng), std::invalid_argument);
    }

    SECTION("Same seed gives the same sample") {
        std::mt19937_64 a(99);
        std::mt19937_64 b(99);
        REQUIRE(generator.unbiased(universe, 6, {}, a) == generator.unbiased(universe, 6, {}, b));
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Sector-biased sampling", "[CandidateGenerator]") {
    analytics::TargetAdjustments adjustments;
    adjustments["Information Technology"] = {80.0, 25.0, -55.0, analytics::Priority::HIGH};
    adjustments["Utilities"] = {0.0, 8.0, 8.0, analytics::Priority::HIGH};

    SECTION("Underweight sectors are seeded into the subset") {
        CandidateGenerator keep_all(sectors, 0.0);
        for (int trial = 0; trial < 10; ++trial) {
            auto holdings = keep_all.sector_biased(universe, 3, {}, adjustments, 0.8, rng);
            REQUIRE(holds(holdings, "NEE"));
            REQUIRE_THAT(data::total_allocation(holdings), WithinAbs(100.0, 0.01));
        }
    }

    SECTION("Must-include tickers survive the small-allocation filter") {
        for (int trial = 0; trial < 10; ++trial) {
            auto holdings = generator.sector_biased(universe, 12, {"AAPL"}, adjustments, 0.8, rng);
            REQUIRE(holds(holdings, "AAPL"));
            for (const auto& h : holdings) {
                if (h.ticker != "AAPL")
                    REQUIRE(h.allocation >= 0.5 - 1e-9);
            }
        }
    }
}

TEST_CASE_METHOD(GeneratorFixture, "Mutation operators", "[CandidateGenerator]") {
    data::Holdings parent = {{"AAPL", 40.0}, {"JPM", 30.0}, {"JNJ", 30.0}};

    SECTION("Weight mutation keeps tickers and the total") {
        auto child = generator.mutate_weights(parent, 0.2, rng);
        REQUIRE(data::tickers_of(child) == data::tickers_of(parent));
        REQUIRE_THAT(data::total_allocation(child), WithinAbs(100.0, 0.01));
        for (size_t i = 0; i < child.size(); ++i) {
            // +/-20% before renormalization bounds the move
            REQUIRE(child[i].allocation > parent[i].allocation * 0.6);
            REQUIRE(child[i].allocation < parent[i].allocation * 1.5);
        }
    }

    SECTION("Swap replaces one holding with an unheld ticker") {
        auto child = generator.swap_holding(parent, universe, {"AAPL"}, rng);
        REQUIRE(child.size() == parent.size());
        REQUIRE(holds(child, "AAPL"));
        size_t fresh = 0;
        for (const auto& h : child) {
            if (!holds(parent, h.ticker))
                ++fresh;
        }
        REQUIRE(fresh == 1);
        REQUIRE_THAT(data::total_allocation(child), WithinAbs(100.0, 0.01));
    }

    SECTION("Swap is a no-op when everything is held") {
        auto child = generator.swap_holding(parent, {"AAPL", "JPM", "JNJ"}, {}, rng);
        REQUIRE(data::tickers_of(child) == data::tickers_of(parent));
    }

    SECTION("Parent is never modified") {
        data::Holdings copy = parent;
        generator.mutate_weights(parent, 0.5, rng);
        generator.swap_holding(parent, universe, {}, rng);
        REQUIRE(parent == copy);
    }
}

TEST_CASE("Holdings limit", "[CandidateGenerator]") {
    data::Holdings holdings = {{"A", 5.0}, {"B", 40.0}, {"C", 10.0}, {"D", 45.0}};

    auto limited = CandidateGenerator::limit_holdings(holdings, 2, {"A"});
    REQUIRE(limited.size() == 2);
    REQUIRE(limited[0].ticker == "A");
    REQUIRE(limited[1].ticker == "D");
    REQUIRE_THAT(data::total_allocation(limited), WithinAbs(100.0, 1e-9));

    REQUIRE(CandidateGenerator::limit_holdings(holdings, 10, {}).size() == 4);
}

TEST_CASE("Risk tolerance post-processing", "[CandidateGenerator]") {
    SECTION("Conservative caps every allocation at 30") {
        data::Holdings holdings = {{"A", 70.0}, {"B", 10.0}, {"C", 10.0}, {"D", 5.0}, {"E", 5.0}};
        auto adjusted = CandidateGenerator::apply_risk_tolerance(holdings, RiskTolerance::CONSERVATIVE);
        REQUIRE(largest(adjusted) <= 30.0 + 1e-6);
        REQUIRE_THAT(data::total_allocation(adjusted), WithinAbs(100.0, 0.01));
        REQUIRE_THAT(data::allocation_of(adjusted, "A"), WithinAbs(30.0, 1e-6));
        // Excess shared in proportion to the uncapped weights
        REQUIRE_THAT(data::allocation_of(adjusted, "B"), WithinAbs(data::allocation_of(adjusted, "C"), 1e-9));
        REQUIRE(data::allocation_of(adjusted, "B") > data::allocation_of(adjusted, "D"));
    }

    SECTION("Conservative with too few holdings falls back to equal weight") {
        auto adjusted = CandidateGenerator::apply_risk_tolerance({{"A", 90.0}, {"B", 10.0}},
                                                                 RiskTolerance::CONSERVATIVE);
        REQUIRE_THAT(adjusted[0].allocation, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(adjusted[1].allocation, WithinAbs(50.0, 1e-9));
    }

    SECTION("Aggressive raises the two largest to 1.5x equal weight") {
        data::Holdings holdings = {{"A", 25.0}, {"B", 25.0}, {"C", 25.0}, {"D", 25.0}};
        auto adjusted = CandidateGenerator::apply_risk_tolerance(holdings, RiskTolerance::AGGRESSIVE);
        REQUIRE_THAT(data::total_allocation(adjusted), WithinAbs(100.0, 0.01));
        // 37.5 / 37.5 / 25 / 25 renormalized over 125
        REQUIRE_THAT(adjusted[0].allocation, WithinAbs(30.0, 1e-9));
        REQUIRE_THAT(adjusted[1].allocation, WithinAbs(30.0, 1e-9));
        REQUIRE_THAT(adjusted[2].allocation, WithinAbs(20.0, 1e-9));
    }

    SECTION("Moderate only normalizes") {
        auto adjusted = CandidateGenerator::apply_risk_tolerance({{"A", 3.0}, {"B", 1.0}},
                                                                 RiskTolerance::MODERATE);
        REQUIRE_THAT(adjusted[0].allocation, WithinAbs(75.0, 1e-9));
    }
}

/**
 * @file test_sector_adjuster.cpp
 * @brief Unit tests for the iterative sector reweighting loop
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/sector_adjuster.hpp"
#include "data/sector_mapper.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace allocation;
using namespace allocation::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

data::SectorMapping make_sectors()
{
    return data::SectorMapping(
        {"AAPL", "MSFT", "GOOGL", "JPM", "BAC", "CAT", "JNJ", "PFE", "PG", "KO", "NEE", "DUK", "XOM", "PLD"},
        {"Information Technology", "Information Technology", "Information Technology",
         "Financials", "Financials", "Industrials", "Health Care", "Health Care",
         "Consumer Staples", "Consumer Staples", "Utilities", "Utilities", "Energy", "Real Estate"});
}

data::SectorMapping make_full_sectors()
{
    const std::vector<std::string> names = {
        "Information Technology", "Communication Services", "Consumer Discretionary",
        "Consumer Staples", "Health Care", "Financials", "Industrials", "Energy",
        "Materials", "Utilities", "Real Estate"};
    std::vector<std::string> tickers;
    std::vector<std::string> sectors;
    for (size_t i = 0; i < names.size(); ++i) {
        for (int k = 0; k < 3; ++k) {
            tickers.push_back("S" + std::to_string(i) + "_" + std::to_string(k));
            sectors.push_back(names[i]);
        }
    }
    return data::SectorMapping(tickers, sectors);
}

// Spreads @p weight evenly over every ticker of @p sector
void add_sector(data::Holdings& holdings, const data::SectorMapping& mapping,
                const std::string& sector, double weight)
{
    auto tickers = mapping.tickers_by_sector(sector);
    for (const auto& t : tickers)
        holdings.push_back({t, weight / static_cast<double>(tickers.size())});
}

} // anonymous namespace

TEST_CASE("Adjuster brings a concentrated portfolio into compliance", "[SectorAdjuster]") {
    auto sectors = make_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    data::Holdings holdings = {{"AAPL", 50.0}, {"MSFT", 30.0}, {"GOOGL", 20.0}};
    auto result = adjuster.adjust(holdings);

    REQUIRE(result.converged);
    REQUIRE(result.report.compliant());
    REQUIRE(result.iterations >= 1);
    REQUIRE(result.iterations <= adjuster.settings().max_iterations);
    REQUIRE_THAT(data::total_allocation(result.holdings), WithinAbs(100.0, 0.01));
    REQUIRE(result.report == evaluator.check(result.holdings));

    SECTION("Defensive sectors were added from the sector pools") {
        double defensive = 0.0;
        for (const auto& s : evaluator.sector_distribution(result.holdings)) {
            for (const auto& d : analytics::SectorBalanceEvaluator::defensive_sectors()) {
                if (s.sector == d)
                    defensive += s.allocation;
            }
        }
        REQUIRE(defensive >= 10.0);
    }

    SECTION("No allocation below the minimum") {
        for (const auto& h : result.holdings)
            REQUIRE(h.allocation >= adjuster.settings().min_allocation - 1e-9);
    }
}

TEST_CASE("Adjuster converges on concentrated portfolios over a full sector pool", "[SectorAdjuster]") {
    auto sectors = make_full_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    std::vector<std::pair<std::string, data::Holdings>> cases;
    for (const char* single : {"Health Care", "Utilities", "Real Estate", "Information Technology", "Energy"}) {
        data::Holdings holdings;
        add_sector(holdings, sectors, single, 100.0);
        cases.emplace_back(single, holdings);
    }
    {
        data::Holdings holdings;
        add_sector(holdings, sectors, "Energy", 60.0);
        add_sector(holdings, sectors, "Materials", 40.0);
        cases.emplace_back("Energy + Materials", holdings);
    }
    {
        data::Holdings holdings;
        add_sector(holdings, sectors, "Information Technology", 40.0);
        add_sector(holdings, sectors, "Communication Services", 30.0);
        add_sector(holdings, sectors, "Consumer Discretionary", 20.0);
        add_sector(holdings, sectors, "Financials", 10.0);
        cases.emplace_back("Technology and communication heavy", holdings);
    }
    {
        data::Holdings holdings;
        add_sector(holdings, sectors, "Consumer Staples", 45.0);
        add_sector(holdings, sectors, "Health Care", 45.0);
        add_sector(holdings, sectors, "Real Estate", 10.0);
        cases.emplace_back("Defensive pair heavy", holdings);
    }

    for (const auto& [name, holdings] : cases) {
        INFO(name);
        auto result = adjuster.adjust(holdings);
        REQUIRE(result.converged);
        REQUIRE(result.iterations <= 20);
        REQUIRE(result.report.hard_violations == 0);
        REQUIRE(result.report.soft_warnings == 0);
        REQUIRE_THAT(data::total_allocation(result.holdings), WithinAbs(100.0, 0.01));
    }
}

TEST_CASE("Freed weight stays clear of every soft limit", "[SectorAdjuster]") {
    auto sectors = make_full_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    data::Holdings holdings;
    add_sector(holdings, sectors, "Health Care", 100.0);
    auto result = adjuster.adjust(holdings);

    REQUIRE(result.converged);
    REQUIRE(result.iterations == 1);

    double weight_hc = 0.0;
    double weight_cs = 0.0;
    for (const auto& s : evaluator.sector_distribution(result.holdings)) {
        REQUIRE(s.allocation <= 25.0 + 1e-6);
        if (s.sector == "Health Care")
            weight_hc = s.allocation;
        if (s.sector == "Consumer Staples")
            weight_cs = s.allocation;
    }
    // Health Care trimmed to 25 * 0.9; Consumer Staples stops at the 45% group headroom
    REQUIRE_THAT(weight_hc, WithinAbs(22.5, 1e-6));
    REQUIRE_THAT(weight_cs, WithinAbs(22.5, 1e-6));
}

TEST_CASE("Adjuster never modifies its input", "[SectorAdjuster]") {
    auto sectors = make_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    data::Holdings holdings = {{"AAPL", 60.0}, {"XOM", 40.0}};
    data::Holdings copy = holdings;
    adjuster.adjust(holdings);
    REQUIRE(holdings == copy);
}

TEST_CASE("Compliant holdings pass through unchanged", "[SectorAdjuster]") {
    auto sectors = make_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    data::Holdings holdings = {
        {"AAPL", 20.0}, {"JPM", 20.0}, {"JNJ", 20.0}, {"PG", 20.0}, {"NEE", 20.0}};
    auto result = adjuster.adjust(holdings);

    REQUIRE(result.iterations == 0);
    REQUIRE(result.converged);
    REQUIRE(data::tickers_of(result.holdings) == data::tickers_of(holdings));
    for (const auto& h : result.holdings)
        REQUIRE_THAT(h.allocation, WithinAbs(20.0, 1e-9));
}

TEST_CASE("Additions are restricted to the available tickers", "[SectorAdjuster]") {
    auto sectors = make_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);
    SectorAdjuster adjuster(evaluator);

    data::Holdings holdings = {{"AAPL", 50.0}, {"MSFT", 50.0}};
    std::vector<std::string> available = {"AAPL", "MSFT", "KO", "DUK", "PFE"};
    auto result = adjuster.adjust(holdings, available);

    for (const auto& h : result.holdings) {
        bool allowed = std::find(available.begin(), available.end(), h.ticker) != available.end();
        REQUIRE(allowed);
    }
}

TEST_CASE("Adjuster settings validation", "[SectorAdjuster]") {
    auto sectors = make_sectors();
    analytics::SectorBalanceEvaluator evaluator(sectors);

    SectorAdjusterSettings settings;
    settings.max_iterations = 0;
    REQUIRE_THROWS_AS(SectorAdjuster(evaluator, settings), std::invalid_argument);

    settings = SectorAdjusterSettings();
    settings.hard_aggressiveness = 1.5;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    settings = SectorAdjusterSettings();
    settings.headroom_margin = -1.0;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    auto loaded = SectorAdjusterSettings::from_json({{"max_iterations", 5}, {"headroom_margin", 2.5}});
    REQUIRE(loaded.max_iterations == 5);
    REQUIRE_THAT(loaded.min_allocation, WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(loaded.headroom_margin, WithinAbs(2.5, 1e-12));
}

/**
 * @file test_sector_balance.cpp
 * @brief Unit tests for the sector concentration rules
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/sector_balance.hpp"
#include "data/sector_mapper.hpp"

using namespace allocation;
using namespace allocation::analytics;
using Catch::Matchers::WithinAbs;

namespace {

data::SectorMapping make_sectors()
{
    return data::SectorMapping(
        {"AAPL", "MSFT", "GOOGL", "META", "AMZN", "JPM", "CAT", "JNJ", "PG", "NEE", "XOM", "LIN", "PLD", "AMT"},
        {"Information Technology", "Information Technology", "Information Technology",
         "Communication Services", "Consumer Discretionary", "Financials", "Industrials",
         "Health Care", "Consumer Staples", "Utilities", "Energy", "Materials",
         "Real Estate", "Real Estate"});
}

const SectorBalanceCheck& rule(const SectorBalanceReport& report, int number)
{
    for (const auto& c : report.checks) {
        if (c.rule == number)
            return c;
    }
    FAIL("rule " << number << " missing from report");
    return report.checks.front();
}

bool has_rule(const SectorBalanceReport& report, int number)
{
    for (const auto& c : report.checks) {
        if (c.rule == number)
            return true;
    }
    return false;
}

} // anonymous namespace

TEST_CASE("Single-sector portfolio fails concentration and defensive rules", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings holdings = {{"AAPL", 50.0}, {"MSFT", 30.0}, {"GOOGL", 20.0}};
    auto report = evaluator.check(holdings);

    REQUIRE(report.overall_score == 40);
    REQUIRE(report.hard_violations == 2);
    REQUIRE(report.soft_warnings == 0);
    REQUIRE(report.advisories == 0);
    REQUIRE_FALSE(report.compliant());

    const auto& single = rule(report, 1);
    REQUIRE(single.status == CheckStatus::HARD_VIOLATION);
    REQUIRE(single.sector == "Information Technology");
    REQUIRE_THAT(single.value, WithinAbs(100.0, 1e-9));

    REQUIRE(rule(report, 3).status == CheckStatus::HARD_VIOLATION);
    REQUIRE(rule(report, 4).status == CheckStatus::OK);
    REQUIRE(rule(report, 5).status == CheckStatus::OK);
    REQUIRE_FALSE(has_rule(report, 2));
}

TEST_CASE("Diversified portfolio scores 100", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings holdings = {
        {"AAPL", 20.0}, {"JNJ", 15.0}, {"PG", 10.0}, {"JPM", 15.0}, {"CAT", 10.0},
        {"NEE", 10.0}, {"XOM", 5.0}, {"LIN", 5.0}, {"PLD", 5.0}, {"META", 5.0}};
    auto report = evaluator.check(holdings);

    REQUIRE(report.overall_score == 100);
    REQUIRE(report.compliant());
    REQUIRE(report.checks.size() == 4);
    REQUIRE_THAT(rule(report, 3).value, WithinAbs(35.0, 1e-9));
}

TEST_CASE("Correlated group concentration", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    // IT, Communication Services and Consumer Discretionary form one component
    data::Holdings holdings = {
        {"AAPL", 28.0}, {"META", 20.0}, {"AMZN", 15.0},
        {"PG", 12.0}, {"JNJ", 10.0}, {"NEE", 5.0}, {"JPM", 10.0}};
    auto report = evaluator.check(holdings);

    const auto& group = rule(report, 2);
    REQUIRE(group.status == CheckStatus::HARD_VIOLATION);
    REQUIRE_THAT(group.value, WithinAbs(63.0, 1e-9));
    REQUIRE(group.members.size() == 3);
    REQUIRE(report.hard_violations == 1);
    REQUIRE(report.overall_score == 70);

    SECTION("Heavy members are reduced toward the floor") {
        auto adjustments = evaluator.target_adjustments(report, holdings);
        REQUIRE(adjustments.count("Information Technology") == 1);
        REQUIRE_THAT(adjustments["Information Technology"].target, WithinAbs(19.6, 1e-9));
        REQUIRE_THAT(adjustments["Communication Services"].target, WithinAbs(15.0, 1e-9));
        REQUIRE(adjustments["Communication Services"].priority == Priority::HIGH);
        // Members at or below the floor are left alone
        REQUIRE(adjustments.count("Consumer Discretionary") == 0);
    }
}

TEST_CASE("Energy and Materials advisory band", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings holdings = {
        {"XOM", 10.0}, {"LIN", 8.0}, {"AAPL", 22.0}, {"JPM", 20.0},
        {"JNJ", 20.0}, {"NEE", 20.0}};
    auto report = evaluator.check(holdings);

    REQUIRE(rule(report, 5).status == CheckStatus::ADVISORY);
    REQUIRE(report.advisories == 1);
    REQUIRE(report.compliant());
    REQUIRE(report.overall_score == 95);
}

TEST_CASE("REIT ceiling", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings holdings = {
        {"PLD", 15.0}, {"AMT", 10.0}, {"AAPL", 25.0}, {"JPM", 25.0}, {"JNJ", 25.0}};
    auto report = evaluator.check(holdings);

    REQUIRE(rule(report, 4).status == CheckStatus::HARD_VIOLATION);

    auto adjustments = evaluator.target_adjustments(report, holdings);
    REQUIRE(adjustments.count("Real Estate") == 1);
    REQUIRE_THAT(adjustments["Real Estate"].target, WithinAbs(15.0, 1e-9));
    REQUIRE_THAT(adjustments["Real Estate"].delta, WithinAbs(-10.0, 1e-9));
}

TEST_CASE("Target adjustments for a single-sector portfolio", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings holdings = {{"AAPL", 50.0}, {"MSFT", 30.0}, {"GOOGL", 20.0}};
    auto adjustments = evaluator.target_adjustments(evaluator.check(holdings), holdings);

    REQUIRE(adjustments.size() == 4);
    REQUIRE_THAT(adjustments["Information Technology"].target, WithinAbs(25.0, 1e-9));
    REQUIRE_THAT(adjustments["Information Technology"].delta, WithinAbs(-75.0, 1e-9));
    for (const auto& sector : SectorBalanceEvaluator::defensive_sectors()) {
        REQUIRE(adjustments.count(sector) == 1);
        REQUIRE_THAT(adjustments[sector].target, WithinAbs(8.0, 1e-9));
        REQUIRE(adjustments[sector].priority == Priority::HIGH);
    }
}

TEST_CASE("Sector distribution", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    SECTION("Normalized and sorted largest first") {
        auto dist = evaluator.sector_distribution({{"AAPL", 10.0}, {"JNJ", 30.0}, {"MSFT", 10.0}});
        REQUIRE(dist.size() == 2);
        REQUIRE(dist[0].sector == "Health Care");
        REQUIRE_THAT(dist[0].allocation, WithinAbs(60.0, 1e-9));
        REQUIRE_THAT(dist[1].allocation, WithinAbs(40.0, 1e-9));
    }

    SECTION("Unmapped tickers fall under Unknown") {
        auto dist = evaluator.sector_distribution({{"ZZZ", 50.0}, {"AAPL", 50.0}});
        REQUIRE(dist.size() == 2);
        bool found = false;
        for (const auto& s : dist) {
            if (s.sector == data::UNKNOWN_SECTOR)
                found = true;
        }
        REQUIRE(found);
    }

    SECTION("Zero total gives an empty distribution") {
        REQUIRE(evaluator.sector_distribution({{"AAPL", 0.0}}).empty());
    }
}

TEST_CASE("Sector checks are deterministic", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);
    data::Holdings holdings = {{"AAPL", 40.0}, {"META", 25.0}, {"XOM", 20.0}, {"PLD", 15.0}};

    REQUIRE(evaluator.check(holdings) == evaluator.check(holdings));
}

TEST_CASE("Score never increases when a violation is added", "[SectorBalance]") {
    auto sectors = make_sectors();
    SectorBalanceEvaluator evaluator(sectors);

    data::Holdings balanced = {
        {"AAPL", 20.0}, {"JNJ", 15.0}, {"PG", 10.0}, {"JPM", 15.0}, {"CAT", 10.0},
        {"NEE", 10.0}, {"XOM", 5.0}, {"LIN", 5.0}, {"PLD", 5.0}, {"META", 5.0}};
    int previous = evaluator.check(balanced).overall_score;

    // Shift weight into Technology step by step
    for (double extra : {10.0, 20.0, 40.0, 80.0}) {
        data::Holdings tilted = balanced;
        tilted[0].allocation += extra;
        int score = evaluator.check(tilted).overall_score;
        REQUIRE(score <= previous);
        REQUIRE(score >= 0);
        previous = score;
    }
}

TEST_CASE("Correlated groups are connected components", "[SectorBalance]") {
    auto groups = SectorBalanceEvaluator::correlated_groups(
        {"Information Technology", "Consumer Discretionary", "Communication Services", "Utilities"});
    REQUIRE(groups.size() == 1);
    REQUIRE(groups[0].size() == 3);
    REQUIRE(groups[0].front() == "Information Technology");

    REQUIRE(SectorBalanceEvaluator::correlated_groups({"Energy", "Utilities"}).empty());
}

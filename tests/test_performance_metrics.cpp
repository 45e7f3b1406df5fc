/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for the MetricsEngine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/performance_metrics.hpp"
#include "data/market_data.hpp"
#include <cmath>
#include <limits>

using namespace allocation;
using namespace allocation::analytics;
using Catch::Matchers::WithinAbs;

namespace {

ValueSeries series(const std::vector<double>& values, const std::string& start = "2020-01-0")
{
    ValueSeries result;
    for (size_t i = 0; i < values.size(); ++i) {
        result.push_back({start + std::to_string(i + 1), values[i]});
    }
    return result;
}

bool all_finite(const PerformanceMetrics& m)
{
    for (double v : {m.total_return, m.annualized_return, m.volatility, m.sharpe_ratio,
                     m.sortino_ratio, m.downside_deviation, m.max_drawdown, m.best_year,
                     m.worst_year, m.beta, m.alpha, m.information_ratio, m.tracking_error,
                     m.r_squared}) {
        if (!std::isfinite(v))
            return false;
    }
    return true;
}

} // anonymous namespace

TEST_CASE("Flat value series gives zero metrics", "[MetricsEngine]") {
    MetricsEngine engine;
    auto m = engine.compute(series({100.0, 100.0, 100.0, 100.0}));

    REQUIRE_THAT(m.total_return, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.volatility, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.sharpe_ratio, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.max_drawdown, WithinAbs(0.0, 1e-12));
    REQUIRE(all_finite(m));
}

TEST_CASE("Max drawdown is measured from the running peak", "[MetricsEngine]") {
    MetricsEngine engine;
    auto values = series({100.0, 120.0, 90.0});
    auto m = engine.compute(values);

    REQUIRE_THAT(m.max_drawdown, WithinAbs(-25.0, 1e-9));
    REQUIRE_THAT(m.total_return, WithinAbs(-10.0, 1e-9));

    auto dd = engine.drawdowns(values);
    REQUIRE(dd.size() == 3);
    REQUIRE_THAT(dd[0].drawdown, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(dd[1].drawdown, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(dd[2].drawdown, WithinAbs(-25.0, 1e-9));
}

TEST_CASE("Fewer than two points gives the zero record", "[MetricsEngine]") {
    MetricsEngine engine;

    SECTION("Empty series") {
        auto m = engine.compute(ValueSeries{});
        REQUIRE(m.total_return == 0.0);
        REQUIRE(m.positive_years == 0);
    }

    SECTION("Single point") {
        auto m = engine.compute(series({100.0}));
        REQUIRE(m.volatility == 0.0);
        REQUIRE(m.annualized_return == 0.0);
    }
}

TEST_CASE("Volatility uses the sample standard deviation", "[MetricsEngine]") {
    MetricsEngine engine;
    // Daily returns +10% and -10%: sample stdev = sqrt(0.02)
    auto m = engine.compute(series({100.0, 110.0, 99.0}));
    double expected = std::sqrt(0.02) * std::sqrt(252.0) * 100.0;
    REQUIRE_THAT(m.volatility, WithinAbs(expected, 1e-6));
}

TEST_CASE("Yearly returns run from first to last value of each year", "[MetricsEngine]") {
    MetricsEngine engine;
    ValueSeries values = {
        {"2020-01-02", 100.0},
        {"2020-06-30", 130.0},
        {"2020-12-31", 110.0},
        {"2021-01-04", 110.0},
        {"2021-12-31", 99.0},
    };

    auto yearly = engine.yearly_returns(values);
    REQUIRE(yearly.size() == 2);
    REQUIRE(yearly[0].year == 2020);
    REQUIRE_THAT(yearly[0].return_pct, WithinAbs(10.0, 1e-9));
    REQUIRE(yearly[1].year == 2021);
    REQUIRE_THAT(yearly[1].return_pct, WithinAbs(-10.0, 1e-9));

    auto m = engine.compute(values);
    REQUIRE_THAT(m.best_year, WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(m.worst_year, WithinAbs(-10.0, 1e-9));
    REQUIRE(m.positive_years == 1);
    REQUIRE(m.negative_years == 1);
}

TEST_CASE("Annualized return uses the calendar span", "[MetricsEngine]") {
    MetricsEngine engine;
    ValueSeries values = {{"2020-01-01", 100.0}, {"2020-07-01", 105.0}, {"2021-12-31", 121.0}};

    double years = engine.period_years(values);
    REQUIRE_THAT(years, WithinAbs(730.0 / 365.25, 1e-9));

    auto m = engine.compute(values);
    double expected = (std::pow(1.21, 1.0 / years) - 1.0) * 100.0;
    REQUIRE_THAT(m.annualized_return, WithinAbs(expected, 1e-9));
}

TEST_CASE("Benchmark-relative metrics", "[MetricsEngine]") {
    MetricsEngine engine;
    auto bench = series({100.0, 101.0, 99.0, 102.0, 103.0, 101.0});

    SECTION("Portfolio equal to the benchmark") {
        auto m = engine.compute(bench, bench);
        REQUIRE_THAT(m.beta, WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(m.r_squared, WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(m.tracking_error, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(m.information_ratio, WithinAbs(0.0, 1e-9));
        REQUIRE(all_finite(m));
    }

    SECTION("Benchmark of a different length is ignored") {
        auto values = series({100.0, 102.0, 101.0});
        auto m = engine.compute(values, bench);
        REQUIRE(m.beta == 0.0);
        REQUIRE(m.alpha == 0.0);
    }

    SECTION("Flat benchmark leaves relative metrics at zero") {
        auto flat = series({100.0, 100.0, 100.0, 100.0, 100.0, 100.0});
        auto m = engine.compute(bench, flat);
        REQUIRE(m.beta == 0.0);
        REQUIRE(m.alpha == 0.0);
        REQUIRE(m.r_squared == 0.0);
        REQUIRE(all_finite(m));
    }
}

TEST_CASE("Portfolio value simulation", "[MetricsEngine]") {
    Eigen::MatrixXd prices(3, 2);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    prices << 10.0, nan,
              20.0, 50.0,
              nan, 100.0;
    data::MarketData market(prices, {"2020-01-01", "2020-01-02", "2020-01-03"}, {"A", "B"});

    MetricsEngine engine;

    SECTION("Shares bought at the first available price, last price carried forward") {
        auto values = engine.portfolio_values(market, {{"A", 50.0}, {"B", 50.0}});
        REQUIRE(values.size() == 3);
        // A: 500 shares; B: 100 shares bought on day 2
        REQUIRE_THAT(values[0].value, WithinAbs(5000.0, 1e-9));
        REQUIRE_THAT(values[1].value, WithinAbs(15000.0, 1e-9));
        REQUIRE_THAT(values[2].value, WithinAbs(20000.0, 1e-9));
    }

    SECTION("Dates with zero value are skipped") {
        auto values = engine.portfolio_values(market, {{"B", 100.0}});
        REQUIRE(values.size() == 2);
        REQUIRE(values.front().date == "2020-01-02");
        REQUIRE_THAT(values.front().value, WithinAbs(10000.0, 1e-9));
    }

    SECTION("Unknown ticker") {
        REQUIRE_THROWS_AS(engine.portfolio_values(market, {{"ZZZ", 100.0}}), data::MissingInstrumentError);
    }
}

TEST_CASE("Risk-free rate from quotes", "[MetricsEngine]") {
    REQUIRE_THAT(MetricsEngine::risk_free_rate_from({}, 2.0), WithinAbs(2.0, 1e-12));
    data::PriceSeries quotes = {{"2020-01-01", 1.0}, {"2020-01-02", 3.0}};
    REQUIRE_THAT(MetricsEngine::risk_free_rate_from(quotes, 2.0), WithinAbs(2.0, 1e-12));
    quotes.push_back({"2020-01-03", 5.0});
    REQUIRE_THAT(MetricsEngine::risk_free_rate_from(quotes, 2.0), WithinAbs(3.0, 1e-12));
}

TEST_CASE("MetricsSettings validation", "[MetricsEngine]") {
    MetricsSettings settings;
    settings.initial_capital = 0.0;
    REQUIRE_THROWS_AS(MetricsEngine(settings), std::invalid_argument);

    settings = MetricsSettings();
    settings.trading_days_per_year = 0;
    REQUIRE_THROWS_AS(settings.validate(), std::invalid_argument);

    auto loaded = MetricsSettings::from_json({{"risk_free_rate", 3.5}});
    REQUIRE_THAT(loaded.risk_free_rate, WithinAbs(3.5, 1e-12));
    REQUIRE_THAT(loaded.initial_capital, WithinAbs(10000.0, 1e-12));
}

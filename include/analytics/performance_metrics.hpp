/**
 * @file performance_metrics.hpp
 * @brief Risk/return performance metrics for portfolio value series.
 *
 * The MetricsEngine turns a daily value series (and an optional benchmark
 * value series of the same length) into a PerformanceMetrics record. All
 * rates are expressed in percent. Annualization uses 252 trading days per
 * year by default; the CAGR horizon is the calendar span of the series.
 *
 * No NaN or infinity ever leaves the engine: every non-finite intermediate
 * result is replaced with 0.
 */

#ifndef ALLOCATION_ANALYTICS_PERFORMANCE_METRICS_HPP
#define ALLOCATION_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "data/holding.hpp"
#include "data/price_source.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace allocation
{

    namespace data
    {
        class MarketData;
    }

    namespace analytics
    {

        /**
         * @struct ValuePoint
         * @brief Portfolio value on one date.
         */
        struct ValuePoint
        {
            std::string date;
            double value;
        };

        using ValueSeries = std::vector<ValuePoint>;

        /**
         * @struct YearlyReturn
         * @brief Calendar-year return in percent.
         */
        struct YearlyReturn
        {
            int year;
            double return_pct;
        };

        /**
         * @struct DrawdownPoint
         * @brief Distance below the running peak on one date, in percent (<= 0).
         */
        struct DrawdownPoint
        {
            std::string date;
            double drawdown;
        };

        /**
         * @struct PerformanceMetrics
         * @brief Immutable record of portfolio performance statistics.
         *
         * A default-constructed record (all zeros) is the "insufficient data"
         * sentinel returned for series with fewer than two points.
         */
        struct PerformanceMetrics
        {
            double total_return = 0.0;       ///< Percent
            double annualized_return = 0.0;  ///< CAGR, percent
            double volatility = 0.0;         ///< Annualized stdev of daily returns, percent
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;
            double downside_deviation = 0.0; ///< Daily, in percentage points
            double max_drawdown = 0.0;       ///< Percent, <= 0
            double best_year = 0.0;          ///< Percent
            double worst_year = 0.0;         ///< Percent
            int positive_years = 0;
            int negative_years = 0;
            double beta = 0.0;
            double alpha = 0.0;              ///< Annualized, percent
            double information_ratio = 0.0;
            double tracking_error = 0.0;     ///< Annualized, percent
            double r_squared = 0.0;

            /**
             * @brief Formatted multi-line summary.
             */
            std::string summary() const;
        };

        void to_json(nlohmann::json &j, const PerformanceMetrics &m);
        void to_json(nlohmann::json &j, const ValuePoint &p);
        void to_json(nlohmann::json &j, const YearlyReturn &r);
        void to_json(nlohmann::json &j, const DrawdownPoint &d);

        /**
         * @struct MetricsSettings
         * @brief Parameters of the metrics computation.
         */
        struct MetricsSettings
        {
            double initial_capital = 10000.0; ///< Starting value of every simulated portfolio
            double risk_free_rate = 2.0;      ///< Annualized, percent
            int trading_days_per_year = 252;

            /**
             * @throws std::invalid_argument on non-positive capital or trading days.
             */
            void validate() const;

            /**
             * @brief Load from the "analytics" configuration section (validated).
             */
            static MetricsSettings from_json(const nlohmann::json &j);
        };

        /**
         * @class MetricsEngine
         * @brief Computes value series and performance metrics.
         *
         * Usage:
         * @code
         *   MetricsEngine engine;
         *   auto values = engine.portfolio_values(aligned_prices, holdings);
         *   PerformanceMetrics m = engine.compute(values, benchmark_values);
         * @endcode
         *
         * Thread safety: all methods are const and reentrant.
         */
        class MetricsEngine
        {
        public:
            /**
             * @throws std::invalid_argument if @p settings fail validation.
             */
            explicit MetricsEngine(const MetricsSettings &settings = MetricsSettings());

            /**
             * @brief Simulate a buy-and-hold portfolio over an aligned price block.
             *
             * Each holding buys shares worth initial_capital * allocation / 100
             * at its first available price. On each date the value is the sum of
             * shares times the most recent known price; tickers without a price
             * yet contribute nothing. Dates where the total value is 0 are skipped.
             *
             * @param prices Date-aligned price block.
             * @param holdings Holdings whose tickers must all be in @p prices.
             * @throws data::MissingInstrumentError if a holding is not in @p prices.
             */
            ValueSeries portfolio_values(const data::MarketData &prices,
                                         const data::Holdings &holdings) const;

            /**
             * @brief Compute all metrics for a value series.
             *
             * Benchmark-relative metrics (beta, alpha, R-squared, tracking
             * error, information ratio) are computed only when @p benchmark has
             * exactly as many points as @p values; otherwise they stay 0.
             *
             * @param values Portfolio value series.
             * @param benchmark Optional benchmark value series.
             * @return Metrics record; all zeros when @p values has fewer than 2 points.
             */
            PerformanceMetrics compute(const ValueSeries &values,
                                       const ValueSeries &benchmark = ValueSeries()) const;

            /**
             * @brief Same as compute() with an explicit risk-free rate (percent).
             */
            PerformanceMetrics compute(const ValueSeries &values,
                                       const ValueSeries &benchmark,
                                       double risk_free_rate) const;

            /**
             * @brief Calendar-year returns, ascending by year.
             *
             * Each year runs from its first observed value to its last.
             */
            std::vector<YearlyReturn> yearly_returns(const ValueSeries &values) const;

            /**
             * @brief Running-peak drawdown series.
             */
            std::vector<DrawdownPoint> drawdowns(const ValueSeries &values) const;

            /**
             * @brief Simple daily returns, size values.size() - 1.
             */
            static std::vector<double> daily_returns(const ValueSeries &values);

            /**
             * @brief Span of a value series in years (calendar days / 365.25).
             *
             * Falls back to (n - 1) / trading_days_per_year when the dates are
             * missing or identical.
             */
            double period_years(const ValueSeries &values) const;

            /**
             * @brief Mean quote of a risk-free series (percent), or @p fallback if empty.
             */
            static double risk_free_rate_from(const data::PriceSeries &quotes, double fallback);

            const MetricsSettings &settings() const { return settings_; }

        private:
            MetricsSettings settings_;
        };

    } // namespace analytics
} // namespace allocation

#endif // ALLOCATION_ANALYTICS_PERFORMANCE_METRICS_HPP

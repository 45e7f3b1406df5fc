/**
 * @file benchmark_analysis.hpp
 * @brief Relative performance analysis against a benchmark.
 *
 * Computes beta, alpha, R-squared, tracking error and information ratio by
 * comparing daily portfolio returns against daily benchmark returns of the
 * same length.
 *
 * Conventions (all outputs in percent where they are rates):
 *   rf_daily   = risk_free_rate / 100 / trading_days
 *   beta       = cov(p, b) / var(b)                      (population moments)
 *   alpha      = (mean(p - rf_daily) - beta * mean(b - rf_daily)) * trading_days * 100
 *   R^2        = cov(p, b)^2 / (var(b) * var(p))
 *   TE         = stdev((p - rf_daily) - (b - rf_daily)) * sqrt(trading_days) * 100
 *   IR         = (mean(p) - mean(b)) * trading_days * 100 / TE
 *
 * Zero variances never raise. A benchmark without variance leaves every
 * metric at 0; a portfolio without variance zeroes R-squared.
 */

#ifndef ALLOCATION_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define ALLOCATION_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include <string>
#include <vector>

namespace allocation
{
    namespace analytics
    {

        /**
         * @class BenchmarkAnalysis
         * @brief Computes relative performance metrics against a benchmark.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(portfolio_returns, benchmark_returns, 2.0);
         *   double beta = bench.beta();
         *   double info_ratio = bench.information_ratio();
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class BenchmarkAnalysis
        {
        public:
            /**
             * @brief Construct from portfolio and benchmark return series.
             * @param portfolio_returns Daily simple returns of the portfolio.
             * @param benchmark_returns Daily simple returns of the benchmark.
             * @param risk_free_rate Annualized risk-free rate in percent (default 2.0).
             * @param trading_days_per_year Number of trading days per year (default 252).
             * @throws std::invalid_argument If return series are empty or have different sizes.
             */
            BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                              const std::vector<double> &benchmark_returns,
                              double risk_free_rate = 2.0,
                              int trading_days_per_year = 252);

            ~BenchmarkAnalysis() = default;

            /** @brief Annualized alpha in percent. */
            double alpha() const { return alpha_; }

            /** @brief Market sensitivity, 0 when the benchmark has no variance. */
            double beta() const { return beta_; }

            /** @brief Fraction of portfolio variance explained by the benchmark. */
            double r_squared() const { return r_squared_; }

            /** @brief Annualized tracking error in percent. */
            double tracking_error() const { return tracking_error_; }

            /** @brief Annualized active return over tracking error, 0 when TE is 0. */
            double information_ratio() const { return information_ratio_; }

            /**
             * @brief Generate a formatted summary of benchmark-relative metrics.
             */
            std::string summary() const;

        private:
            void compute();

            std::vector<double> portfolio_returns_;
            std::vector<double> benchmark_returns_;
            double risk_free_rate_;
            int trading_days_per_year_;

            double alpha_;
            double beta_;
            double r_squared_;
            double tracking_error_;
            double information_ratio_;
        };

    } // namespace analytics
} // namespace allocation

#endif // ALLOCATION_ANALYTICS_BENCHMARK_ANALYSIS_HPP

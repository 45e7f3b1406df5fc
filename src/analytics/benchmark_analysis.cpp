/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 *
 * Moments are computed with Eigen over mapped return vectors. Covariance and
 * variance use the population (1/n) normalisation; the tracking error uses
 * the sample (1/(n-1)) standard deviation.
 */

#include "analytics/benchmark_analysis.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocation
{
    namespace analytics
    {

        namespace
        {

            double finite_or_zero(double value)
            {
                return std::isfinite(value) ? value : 0.0;
            }

        } // anonymous namespace

        // ===================================================================
        // Constructors
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const std::vector<double> &portfolio_returns,
                                             const std::vector<double> &benchmark_returns,
                                             double risk_free_rate,
                                             int trading_days_per_year)
            : portfolio_returns_(portfolio_returns), benchmark_returns_(benchmark_returns), risk_free_rate_(risk_free_rate), trading_days_per_year_(trading_days_per_year), alpha_(0.0), beta_(0.0), r_squared_(0.0), tracking_error_(0.0), information_ratio_(0.0)
        {
            if (portfolio_returns_.empty())
            {
                throw std::invalid_argument("Portfolio return series cannot be empty");
            }
            if (benchmark_returns_.empty())
            {
                throw std::invalid_argument("Benchmark return series cannot be empty");
            }
            if (portfolio_returns_.size() != benchmark_returns_.size())
            {
                throw std::invalid_argument(
                    "Portfolio return series size (" + std::to_string(portfolio_returns_.size()) + ") must match benchmark return series size (" + std::to_string(benchmark_returns_.size()) + ")");
            }
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }

            compute();
        }

        // ===================================================================
        // Computation
        // ===================================================================

        void BenchmarkAnalysis::compute()
        {
            const Eigen::Index n = static_cast<Eigen::Index>(portfolio_returns_.size());
            const double days = static_cast<double>(trading_days_per_year_);
            Eigen::Map<const Eigen::VectorXd> port(portfolio_returns_.data(), n);
            Eigen::Map<const Eigen::VectorXd> bench(benchmark_returns_.data(), n);

            const double rf_daily = risk_free_rate_ / 100.0 / days;
            const double mean_port = port.mean();
            const double mean_bench = bench.mean();

            Eigen::VectorXd port_centered = port.array() - mean_port;
            Eigen::VectorXd bench_centered = bench.array() - mean_bench;

            const double cov = port_centered.dot(bench_centered) / static_cast<double>(n);
            const double var_bench = bench_centered.squaredNorm() / static_cast<double>(n);
            const double var_port = port_centered.squaredNorm() / static_cast<double>(n);

            // Degenerate benchmark: every relative metric stays 0
            if (var_bench <= 0.0)
            {
                return;
            }

            beta_ = finite_or_zero(cov / var_bench);

            alpha_ = finite_or_zero(((mean_port - rf_daily) - beta_ * (mean_bench - rf_daily)) * days * 100.0);

            r_squared_ = var_port > 0.0
                             ? finite_or_zero((cov * cov) / (var_bench * var_port))
                             : 0.0;

            // Excess over the same daily rf on both sides reduces to p - b
            Eigen::VectorXd active = (port.array() - rf_daily) - (bench.array() - rf_daily);
            double te_daily = 0.0;
            if (n >= 2)
            {
                Eigen::VectorXd active_centered = active.array() - active.mean();
                te_daily = std::sqrt(active_centered.squaredNorm() / static_cast<double>(n - 1));
            }
            tracking_error_ = finite_or_zero(te_daily * std::sqrt(days) * 100.0);

            information_ratio_ = tracking_error_ > 0.0
                                     ? finite_or_zero(((mean_port - mean_bench) * days * 100.0) / tracking_error_)
                                     : 0.0;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string BenchmarkAnalysis::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(4);

            oss << "Benchmark Analysis Summary\n";
            oss << "==========================\n";
            oss << "  Alpha (annualized):  " << alpha_ << "%\n";
            oss << "  Beta:                " << beta_ << "\n";
            oss << "  R-squared:           " << r_squared_ << "\n";
            oss << "  Tracking Error:      " << tracking_error_ << "%\n";
            oss << "  Information Ratio:   " << information_ratio_ << "\n";
            oss << "  Observations:        " << portfolio_returns_.size() << "\n";

            return oss.str();
        }

    } // namespace analytics
} // namespace allocation

/**
 * @file efficient_frontier.cpp
 * @brief Implementation of the frontier builder
 */

#include "optimizer/efficient_frontier.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        // ============================================================================
        // FrontierPoint Implementation
        // ============================================================================

        FrontierPoint::FrontierPoint(const analytics::PerformanceMetrics &metrics)
            : expected_return(metrics.annualized_return),
              volatility(metrics.volatility),
              sharpe_ratio(metrics.sharpe_ratio)
        {
        }

        void to_json(nlohmann::json &j, const FrontierPoint &p)
        {
            j = nlohmann::json{
                {"expected_return", p.expected_return},
                {"volatility", p.volatility},
                {"sharpe_ratio", p.sharpe_ratio},
                {"is_current", p.is_current},
                {"is_optimal", p.is_optimal},
                {"is_sector_balanced", p.is_sector_balanced}};
        }

        // ============================================================================
        // EfficientFrontierResult Implementation
        // ============================================================================

        size_t EfficientFrontierResult::num_samples() const
        {
            return static_cast<size_t>(std::count_if(points.begin(), points.end(),
                                                      [](const FrontierPoint &p)
                                                      { return !p.is_current && !p.is_optimal && !p.is_sector_balanced; }));
        }

        void EfficientFrontierResult::print_summary() const
        {
            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Total points:   " << points.size() << "\n";
            std::cout << "Sampled points: " << num_samples() << "\n";
            std::cout << std::string(60, '-') << "\n";

            for (const auto &point : points)
            {
                const char *label = point.is_current          ? "Current Portfolio"
                                    : point.is_optimal         ? "Optimized Portfolio"
                                    : point.is_sector_balanced ? "Sector-Balanced Portfolio"
                                                               : nullptr;
                if (label == nullptr)
                {
                    continue;
                }
                std::cout << "\n" << label << ":\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(2)
                          << point.expected_return << "%\n";
                std::cout << "  Volatility:       " << point.volatility << "%\n";
                std::cout << "  Sharpe Ratio:     " << std::setprecision(3) << point.sharpe_ratio << "\n";
            }

            if (num_samples() > 0)
            {
                std::cout << "\nFrontier Range:\n";

                double min_vol = std::numeric_limits<double>::max();
                double max_vol = -std::numeric_limits<double>::max();
                double min_ret = std::numeric_limits<double>::max();
                double max_ret = -std::numeric_limits<double>::max();

                for (const auto &point : points)
                {
                    if (!point.is_current && !point.is_optimal && !point.is_sector_balanced)
                    {
                        min_vol = std::min(min_vol, point.volatility);
                        max_vol = std::max(max_vol, point.volatility);
                        min_ret = std::min(min_ret, point.expected_return);
                        max_ret = std::max(max_ret, point.expected_return);
                    }
                }

                std::cout << "  Return range:     " << std::fixed << std::setprecision(2)
                          << min_ret << "% to " << max_ret << "%\n";
                std::cout << "  Volatility range: "
                          << min_vol << "% to " << max_vol << "%\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void EfficientFrontierResult::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "return,volatility,sharpe_ratio,is_current,is_optimal,is_sector_balanced\n";

            for (const auto &point : points)
            {
                file << std::fixed << std::setprecision(8)
                     << point.expected_return << ","
                     << point.volatility << ","
                     << point.sharpe_ratio << ","
                     << (point.is_current ? "1" : "0") << ","
                     << (point.is_optimal ? "1" : "0") << ","
                     << (point.is_sector_balanced ? "1" : "0") << "\n";
            }

            file.close();
        }

        // ============================================================================
        // FrontierBuilder Implementation
        // ============================================================================

        FrontierBuilder::FrontierBuilder(int num_points)
            : num_points_(num_points)
        {
            if (num_points < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'num_points', got: " + std::to_string(num_points));
            }
        }

        EfficientFrontierResult FrontierBuilder::build(const std::vector<Candidate> &pool,
                                                       const analytics::PerformanceMetrics &current,
                                                       const analytics::PerformanceMetrics &optimal,
                                                       const std::optional<analytics::PerformanceMetrics> &sector_balanced) const
        {
            std::vector<FrontierPoint> sorted;
            sorted.reserve(pool.size());
            for (const auto &candidate : pool)
            {
                sorted.emplace_back(candidate.metrics);
            }
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const FrontierPoint &a, const FrontierPoint &b)
                             { return a.volatility < b.volatility; });

            EfficientFrontierResult result;
            const size_t step = std::max<size_t>(1, sorted.size() / static_cast<size_t>(num_points_));
            for (size_t i = 0; i < sorted.size(); i += step)
            {
                result.points.push_back(sorted[i]);
            }

            FrontierPoint current_point(current);
            current_point.is_current = true;
            result.points.push_back(current_point);

            FrontierPoint optimal_point(optimal);
            optimal_point.is_optimal = true;
            result.points.push_back(optimal_point);

            if (sector_balanced)
            {
                FrontierPoint balanced_point(*sector_balanced);
                balanced_point.is_sector_balanced = true;
                result.points.push_back(balanced_point);
            }

            return result;
        }

    } // namespace optimizer
} // namespace allocation

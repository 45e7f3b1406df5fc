/**
 * @file efficient_frontier.hpp
 * @brief Risk/return scatter of the evaluated candidate pool
 *
 * The frontier is drawn from the search pool rather than solved for: the
 * candidates are sorted by volatility and roughly frontier_points of them
 * are sampled at an even stride. Marker points for the current holdings,
 * the selected portfolio and (when one was computed) the sector-balanced
 * intermediate portfolio are appended after the samples.
 *
 * All values are in percent, as produced by the MetricsEngine.
 */

#pragma once

#include "optimizer/optimizer_interface.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct FrontierPoint
         * @brief Single point of the risk/return scatter
         */
        struct FrontierPoint
        {
            double expected_return = 0.0; ///< Annualized return, percent
            double volatility = 0.0;      ///< Annualized volatility, percent
            double sharpe_ratio = 0.0;
            bool is_current = false;
            bool is_optimal = false;
            bool is_sector_balanced = false;

            FrontierPoint() = default;

            /**
             * @brief Construct from a metrics record
             */
            explicit FrontierPoint(const analytics::PerformanceMetrics &metrics);
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Sampled frontier plus its marker points
         */
        struct EfficientFrontierResult
        {
            std::vector<FrontierPoint> points; ///< Samples followed by the markers

            /**
             * @brief Number of points that are not markers
             */
            size_t num_samples() const;

            /**
             * @brief Print summary statistics
             */
            void print_summary() const;

            /**
             * @brief Export frontier data to CSV
             * @param filepath Path to output file
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_to_csv(const std::string &filepath) const;
        };

        void to_json(nlohmann::json &j, const FrontierPoint &p);

        /**
         * @class FrontierBuilder
         * @brief Builds the frontier scatter from a search pool
         *
         * Usage Example:
         * @code
         * FrontierBuilder builder(50);
         * auto frontier = builder.build(outcome.pool, outcome.baseline_metrics,
         *                               outcome.selected.metrics,
         *                               outcome.sector_balanced_metrics);
         * frontier.export_to_csv("frontier.csv");
         * @endcode
         */
        class FrontierBuilder
        {
        public:
            /**
             * @param num_points Approximate number of sampled points
             * @throws std::invalid_argument if num_points < 1
             */
            explicit FrontierBuilder(int num_points = 50);

            /**
             * @brief Sample the pool and append the marker points
             *
             * The stride is max(1, floor(pool size / num_points)). Exactly one
             * point is flagged is_current and exactly one is_optimal; one
             * is_sector_balanced point is added when @p sector_balanced is set.
             */
            EfficientFrontierResult build(const std::vector<Candidate> &pool,
                                          const analytics::PerformanceMetrics &current,
                                          const analytics::PerformanceMetrics &optimal,
                                          const std::optional<analytics::PerformanceMetrics> &sector_balanced = std::nullopt) const;

            int get_num_points() const { return num_points_; }

        private:
            int num_points_;
        };

    } // namespace optimizer
} // namespace allocation

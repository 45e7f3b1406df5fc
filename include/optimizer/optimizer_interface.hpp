/**
 * @file optimizer_interface.hpp
 * @brief Abstract interface and common structures for allocation search
 *
 * Provides the request, candidate and outcome types shared by the search
 * engine, the frontier builder and the engine facade, plus the
 * recommendation diff between a reference allocation and an optimized one.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations. Randomness is always supplied by the caller.
 */

#pragma once

#include "analytics/performance_metrics.hpp"
#include "analytics/sector_balance.hpp"
#include "data/holding.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace allocation
{

    namespace data
    {
        class MarketData;
    }

    namespace optimizer
    {

        /**
         * @enum RiskTolerance
         * @brief Investor risk profile driving post-processing and selection
         */
        enum class RiskTolerance
        {
            CONSERVATIVE,
            MODERATE,
            AGGRESSIVE
        };

        /**
         * @brief Parse "conservative" | "moderate" | "aggressive" (case-insensitive)
         * @throws std::invalid_argument on any other value
         */
        RiskTolerance parse_risk_tolerance(const std::string &value);

        std::string to_string(RiskTolerance tolerance);

        /**
         * @struct OptimizationRequest
         * @brief Holdings to improve plus the investor's constraints
         */
        struct OptimizationRequest
        {
            data::Holdings holdings;
            RiskTolerance risk_tolerance = RiskTolerance::MODERATE;
            std::optional<double> target_return; ///< Annualized, percent
            bool rebalance_sectors = false;

            /**
             * @brief Validate request
             * @throws std::invalid_argument if holdings or target return are invalid
             */
            void validate() const;

            /**
             * @brief Create from JSON request
             *
             * Tickers are trimmed and upper-cased. The request is validated
             * before it is returned.
             */
            static OptimizationRequest from_json(const nlohmann::json &j);
        };

        /**
         * @struct Candidate
         * @brief One evaluated allocation of the search pool
         */
        struct Candidate
        {
            data::Holdings holdings;
            analytics::PerformanceMetrics metrics;
            int sector_score = 0;
        };

        /**
         * @struct OptimizedHolding
         * @brief Optimized allocation with its change against the reference
         */
        struct OptimizedHolding
        {
            std::string ticker;
            double allocation;
            double change;
        };

        /**
         * @struct Recommendation
         * @brief One actionable allocation change
         */
        struct Recommendation
        {
            std::string action; ///< Add position | Increase allocation | Remove position | Decrease allocation
            std::string ticker;
            double current_allocation;
            double recommended_allocation;
            double change;
            std::string rationale;
        };

        /**
         * @struct SearchOutcome
         * @brief Everything the search produced for one request
         */
        struct SearchOutcome
        {
            Candidate selected;                          ///< Winning candidate
            analytics::SectorBalanceReport selected_report;
            analytics::PerformanceMetrics baseline_metrics;
            data::Holdings reference;                    ///< Allocation the changes are measured against
            std::vector<OptimizedHolding> holdings;      ///< Selected holdings with change
            std::vector<Candidate> pool;                 ///< Every evaluated candidate

            bool sector_rebalancing_applied = false;
            std::optional<analytics::SectorBalanceReport> current_sector_balance;
            std::optional<data::Holdings> sector_balanced;
            std::optional<analytics::PerformanceMetrics> sector_balanced_metrics;
            analytics::TargetAdjustments target_adjustments;

            std::vector<std::string> must_include;
            size_t holdings_cap = 0;
            int iterations = 0;
            bool timed_out = false;
            bool conservative_cap_met = true;            ///< False when a conservative pick exceeds the cap
            std::string stop_reason;
        };

        /**
         * @class OptimizerInterface
         * @brief Abstract base class for allocation optimizers
         *
         * Usage Example:
         * @code
         * std::mt19937_64 rng(42);
         * SearchEngine engine(metrics, evaluator, settings);
         * SearchOutcome outcome = engine.optimize(request, aligned_prices, rng);
         * @endcode
         */
        class OptimizerInterface
        {
        public:
            virtual ~OptimizerInterface() = default;

            /**
             * @brief Propose an improved allocation
             * @param request Holdings and investor constraints
             * @param prices Date-aligned prices of the whole ticker universe
             * @param rng Random generator; identical seeds give identical outcomes
             * @return Search outcome with the selected candidate
             * @throws std::invalid_argument if the request is invalid
             */
            virtual SearchOutcome optimize(const OptimizationRequest &request,
                                           const data::MarketData &prices,
                                           std::mt19937_64 &rng) const = 0;

            /**
             * @brief Get optimizer name
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get optimizer parameters as JSON
             */
            virtual nlohmann::json get_parameters() const = 0;
        };

        // ============================================================================
        // Recommendation diff
        // ============================================================================

        /**
         * @brief Attach the change against @p reference to every optimized holding
         *
         * Reference tickers missing from @p optimized are appended with
         * allocation 0 and a negative change.
         */
        std::vector<OptimizedHolding> diff_holdings(const data::Holdings &reference,
                                                    const data::Holdings &optimized);

        /**
         * @brief Recommendations for every ticker whose allocation moves by at least @p min_change points
         *
         * Sorted by descending magnitude of change.
         */
        std::vector<Recommendation> make_recommendations(const data::Holdings &reference,
                                                         const data::Holdings &optimized,
                                                         RiskTolerance tolerance,
                                                         double min_change = 1.0);

        void to_json(nlohmann::json &j, const OptimizedHolding &h);
        void to_json(nlohmann::json &j, const Recommendation &r);

    } // namespace optimizer
} // namespace allocation

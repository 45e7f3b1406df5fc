/**
 * @file search_engine.hpp
 * @brief Bounded-effort stochastic search for improved allocations
 *
 * The search runs as a small state machine:
 *
 *     INIT -> BATCH_LOCAL -> BATCH_GLOBAL -> CHECK_STOP -> (BATCH_LOCAL | SELECT) -> DONE
 *
 * INIT computes the baseline metrics, the optional sector-balanced
 * intermediate portfolio, the must-include tickers and the holdings cap.
 * Each iteration evaluates a local batch (mutations of the seed or the best
 * candidate so far) and a global batch (fresh samples from the universe).
 * The loop stops on the first satisfied stop rule, after max_retries
 * iterations, or when the wall-clock budget is spent; the budget is checked
 * between batches only.
 *
 * Given the same generator state the search is deterministic unless the
 * time budget cuts it short.
 */

#pragma once

#include "analytics/performance_metrics.hpp"
#include "analytics/sector_balance.hpp"
#include "optimizer/candidate_generator.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "optimizer/sector_adjuster.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct SearchSettings
         * @brief Effort bounds and policy constants of the search
         */
        struct SearchSettings
        {
            int max_retries = 10;
            double time_budget_seconds = 60.0;
            int local_batch_size = 40;
            int global_batch_size = 40;
            double mutation_rate = 0.2;
            double rebalancing_strength = 0.8;
            std::uint64_t seed = 42;
            int frontier_points = 50;

            double must_include_sharpe = -0.2;    ///< Single-asset Sharpe a held ticker must beat to be kept
            double stop_sharpe_multiplier = 1.1;  ///< Stop once Sharpe exceeds this times the baseline
            double viable_sharpe_multiplier = 0.8;
            double target_stop_tolerance = 1.5;   ///< Percentage points
            double target_select_tolerance = 2.0; ///< Percentage points
            double top_score_fraction = 0.2;
            int fallback_pool_size = 50;
            double conservative_cap = 30.0;
            double min_allocation = 0.5;

            bool verbose = false;

            /**
             * @throws std::invalid_argument if a value is out of range
             */
            void validate() const;

            static SearchSettings from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @enum SearchState
         * @brief States of the search loop
         */
        enum class SearchState
        {
            INIT,
            BATCH_LOCAL,
            BATCH_GLOBAL,
            CHECK_STOP,
            SELECT,
            DONE
        };

        std::string to_string(SearchState state);

        /**
         * @class SearchEngine
         * @brief Randomized sampling plus local mutation over the weight simplex
         *
         * Collaborators are held by reference and must outlive the engine.
         */
        class SearchEngine : public OptimizerInterface
        {
        public:
            /**
             * @throws std::invalid_argument if either settings object fails validation
             */
            SearchEngine(const analytics::MetricsEngine &metrics,
                         const analytics::SectorBalanceEvaluator &evaluator,
                         const SearchSettings &settings = SearchSettings(),
                         const SectorAdjusterSettings &adjuster_settings = SectorAdjusterSettings());

            ~SearchEngine() override = default;

            /**
             * @copydoc OptimizerInterface::optimize
             * @throws data::MissingInstrumentError if a held ticker has no prices in @p prices
             */
            SearchOutcome optimize(const OptimizationRequest &request,
                                   const data::MarketData &prices,
                                   std::mt19937_64 &rng) const override;

            std::string get_name() const override { return "stochastic_search"; }

            nlohmann::json get_parameters() const override;

            /**
             * @brief Evaluate metrics and sector score of a holdings set
             */
            Candidate evaluate(const data::Holdings &holdings, const data::MarketData &prices) const;

            /**
             * @brief Tickers of @p holdings whose single-asset Sharpe beats must_include_sharpe
             *
             * Falls back to the single best ticker when none qualifies. The
             * result is ordered by descending Sharpe and never longer than @p cap.
             */
            std::vector<std::string> must_include(const data::Holdings &holdings,
                                                  const data::MarketData &prices,
                                                  size_t cap) const;

            /**
             * @brief min(max(2 * baseline_count, 15), 50), bounded by the universe size
             */
            static size_t holdings_cap(size_t baseline_count, size_t universe_size);

            /**
             * @brief Index of the candidate chosen by the selection policy
             * @throws std::invalid_argument if @p pool is empty
             */
            size_t select(const std::vector<Candidate> &pool,
                          const analytics::PerformanceMetrics &baseline,
                          const OptimizationRequest &request) const;

            const SearchSettings &settings() const { return settings_; }

        private:
            /**
             * @brief Check the candidates added since @p from against the stop rule
             *
             * The sector score rule applies only while @p rebalancing is true,
             * i.e. the baseline needed sector adjustments.
             */
            bool stop_reached(const std::vector<Candidate> &pool, size_t from,
                              const analytics::PerformanceMetrics &baseline,
                              const OptimizationRequest &request, bool rebalancing,
                              std::string &reason) const;

            bool better(const Candidate &a, const Candidate &b, const OptimizationRequest &request,
                        bool rebalancing) const;

            data::Holdings top_up(const data::Holdings &holdings, size_t min_size,
                                  const std::vector<std::string> &universe,
                                  std::mt19937_64 &rng) const;

            void transition(SearchState &state, SearchState next, int iteration) const;

            const analytics::MetricsEngine &metrics_;
            const analytics::SectorBalanceEvaluator &evaluator_;
            SearchSettings settings_;
            CandidateGenerator generator_;
            SectorAdjuster adjuster_;
        };

    } // namespace optimizer
} // namespace allocation

/**
 * @file sector_adjuster.hpp
 * @brief Iterative reweighting of holdings into sector-balance compliance
 *
 * Each iteration re-checks the holdings, derives target adjustments and
 * applies them:
 *  - overweight sectors: members scaled by (target / current) * aggressiveness,
 *    where aggressiveness is 0.9 while a hard violation remains and 0.95 otherwise
 *  - underweight sectors already held: members scaled by target / current
 *  - underweight sectors not held: up to two new tickers from the sector pool
 *    share the missing weight evenly
 *
 * Weight freed by the trims goes to untrimmed sectors, each only up to its
 * headroom: headroom_margin below the soft limit of the single-sector,
 * correlated-group, REIT and Energy + Materials rules. When the held sectors
 * are full, new sectors from the pool are opened: uncorrelated sectors first,
 * then defensive, other correlated, Real Estate, and Energy or Materials last.
 * Excess from raised sectors is taken from sectors no rule moved.
 *
 * Allocations below the minimum are dropped and the rest renormalized. The
 * loop ends once a check reports zero hard violations and zero soft
 * warnings, or after max_iterations passes.
 */

#pragma once

#include "analytics/sector_balance.hpp"
#include "data/holding.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct SectorAdjusterSettings
         * @brief Tunable parameters of the adjustment loop
         */
        struct SectorAdjusterSettings
        {
            int max_iterations = 20;
            double min_allocation = 0.5;       ///< Percent; smaller holdings are dropped
            int new_tickers_per_sector = 2;
            double hard_aggressiveness = 0.9;  ///< Overweight scaling while hard violations remain
            double soft_aggressiveness = 0.95; ///< Overweight scaling otherwise
            double headroom_margin = 5.0;      ///< Percent kept below each soft limit when placing weight

            /**
             * @throws std::invalid_argument if a value is out of range
             */
            void validate() const;

            static SectorAdjusterSettings from_json(const nlohmann::json &j);
        };

        /**
         * @struct AdjustmentResult
         * @brief Outcome of the adjustment loop
         */
        struct AdjustmentResult
        {
            data::Holdings holdings;               ///< Independent copy, sums to 100
            int iterations = 0;                    ///< Adjustment passes applied
            bool converged = false;                ///< Final report is compliant
            analytics::SectorBalanceReport report; ///< Check of the returned holdings
        };

        /**
         * @class SectorAdjuster
         * @brief Forces a holdings set towards sector-balance compliance
         *
         * Usage Example:
         * @code
         * SectorBalanceEvaluator evaluator(sector_mapping);
         * SectorAdjuster adjuster(evaluator);
         * AdjustmentResult balanced = adjuster.adjust(holdings, priced_tickers);
         * @endcode
         */
        class SectorAdjuster
        {
        public:
            /**
             * @param evaluator Evaluator (and, through it, sector lookup); must outlive the adjuster
             * @throws std::invalid_argument if @p settings fail validation
             */
            explicit SectorAdjuster(const analytics::SectorBalanceEvaluator &evaluator,
                                    const SectorAdjusterSettings &settings = SectorAdjusterSettings());

            /**
             * @brief Run the adjustment loop
             * @param holdings Starting holdings (never modified)
             * @param available Tickers that may be added; empty means every mapped ticker
             * @return Adjusted copy with iteration count and final report
             */
            AdjustmentResult adjust(const data::Holdings &holdings,
                                    const std::vector<std::string> &available = {}) const;

            const SectorAdjusterSettings &settings() const { return settings_; }

        private:
            data::Holdings apply_pass(const data::Holdings &holdings,
                                      const analytics::SectorBalanceReport &report,
                                      const std::vector<std::string> &available) const;

            std::vector<std::string> addable_tickers(const std::string &sector,
                                                     const std::set<std::string> &held,
                                                     const std::set<std::string> &allowed) const;

            /** @brief Weight @p sector can take before any rule nears its soft limit. */
            double headroom(const std::string &sector, const std::map<std::string, double> &desired) const;

            /** @return Residual that no untrimmed sector could take. */
            double fill(std::map<std::string, double> &desired,
                        const std::set<std::string> &trimmed,
                        double residual) const;

            std::string next_receiving_sector(const std::map<std::string, double> &desired,
                                              const std::set<std::string> &held,
                                              const std::set<std::string> &allowed,
                                              std::vector<std::string> &picks) const;

            const analytics::SectorBalanceEvaluator &evaluator_;
            SectorAdjusterSettings settings_;
        };

    } // namespace optimizer
} // namespace allocation

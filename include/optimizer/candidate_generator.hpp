/**
 * @file candidate_generator.hpp
 * @brief Randomized allocation candidates for the search engine
 *
 * Two sampling modes:
 *  - Unbiased: a random subset of the universe (must-include tickers always
 *    present) with i.i.d. uniform(0,1) weights normalized to 100.
 *  - Sector-biased: the same sampling, with every raw weight scaled by a
 *    factor derived from its sector's target adjustment.
 *
 * Two mutation operators for local search (weight perturbation and holding
 * swap) and the risk-tolerance post-processing step.
 *
 * Every method returns a fresh holdings set; inputs are never modified.
 * Randomness comes exclusively from the generator passed in.
 */

#pragma once

#include "analytics/sector_balance.hpp"
#include "data/holding.hpp"
#include "data/price_source.hpp"
#include "optimizer/optimizer_interface.hpp"

#include <random>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class CandidateGenerator
         * @brief Samples and mutates holdings sets
         *
         * Usage Example:
         * @code
         * std::mt19937_64 rng(7);
         * CandidateGenerator generator(sector_mapping);
         * auto holdings = generator.unbiased(universe, 10, {"AAPL"}, rng);
         * holdings = CandidateGenerator::apply_risk_tolerance(holdings, RiskTolerance::CONSERVATIVE);
         * @endcode
         */
        class CandidateGenerator
        {
        public:
            /**
             * @param sectors Sector lookup used by sector-biased sampling; must outlive the generator
             * @param min_allocation Sector-biased holdings below this are dropped (percent)
             */
            explicit CandidateGenerator(const data::SectorLookup &sectors, double min_allocation = 0.5);

            /**
             * @brief Random subset with uniform weights
             * @param universe Tickers to sample from
             * @param target_size Number of holdings (raised to the must-include count, capped at the universe size)
             * @param must_include Tickers always present
             * @param rng Random generator
             * @throws std::invalid_argument if the universe is empty
             */
            data::Holdings unbiased(const std::vector<std::string> &universe,
                                    size_t target_size,
                                    const std::vector<std::string> &must_include,
                                    std::mt19937_64 &rng) const;

            /**
             * @brief Random subset with sector-scaled weights
             *
             * Tickers of sectors that need more weight are seeded into the
             * subset first (up to two per sector). Each raw weight is then
             * multiplied by 1 + |delta|/100 * strength * 2 when its sector is
             * underweight, or by max(0.1, 1 - |delta|/100 * strength) when it is
             * overweight. Allocations below min_allocation are dropped unless the
             * ticker is must-include.
             *
             * @throws std::invalid_argument if the universe is empty
             */
            data::Holdings sector_biased(const std::vector<std::string> &universe,
                                         size_t target_size,
                                         const std::vector<std::string> &must_include,
                                         const analytics::TargetAdjustments &adjustments,
                                         double strength,
                                         std::mt19937_64 &rng) const;

            /**
             * @brief Perturb each weight by up to +/- rate * weight, then normalize
             */
            data::Holdings mutate_weights(const data::Holdings &holdings,
                                          double rate,
                                          std::mt19937_64 &rng) const;

            /**
             * @brief Replace one holding with an unheld universe ticker at the average weight
             *
             * Must-include holdings are only removed when nothing else is held.
             * Returns a normalized copy unchanged when every universe ticker is
             * already held.
             */
            data::Holdings swap_holding(const data::Holdings &holdings,
                                        const std::vector<std::string> &universe,
                                        const std::vector<std::string> &must_include,
                                        std::mt19937_64 &rng) const;

            /**
             * @brief Keep at most @p cap holdings (largest first, must-include kept), then normalize
             */
            static data::Holdings limit_holdings(const data::Holdings &holdings,
                                                 size_t cap,
                                                 const std::vector<std::string> &must_include);

            /**
             * @brief Risk-tolerance post-processing
             *
             * Conservative: no allocation above @p conservative_cap, the excess
             * redistributed proportionally among the others (equal weight when
             * the cap cannot be met). Aggressive: the two largest holdings are
             * raised to at least 1.5x the equal-weight share. Moderate: normalized
             * copy.
             */
            static data::Holdings apply_risk_tolerance(const data::Holdings &holdings,
                                                       RiskTolerance tolerance,
                                                       double conservative_cap = 30.0);

        private:
            std::vector<std::string> sample_subset(const std::vector<std::string> &universe,
                                                   size_t target_size,
                                                   const std::vector<std::string> &must_include,
                                                   const std::vector<std::string> &preferred,
                                                   std::mt19937_64 &rng) const;

            const data::SectorLookup &sectors_;
            double min_allocation_;
        };

    } // namespace optimizer
} // namespace allocation

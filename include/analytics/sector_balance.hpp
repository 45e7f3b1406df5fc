/**
 * @file sector_balance.hpp
 * @brief Rule-based sector concentration checks.
 *
 * Scores a holdings set against five concentration rules:
 *   1. Single sector weight.
 *   2. Correlated sector groups (connected components of a fixed graph).
 *   3. Defensive sector minimum.
 *   4. REIT ceiling.
 *   5. Energy + Materials ceiling.
 *
 * overall_score = max(0, 100 - 30 * hard - 15 * soft - 5 * advisory).
 *
 * The report also drives TargetAdjustment derivation, which the candidate
 * generator and the sector adjuster use to steer allocations back into
 * compliance.
 */

#ifndef ALLOCATION_ANALYTICS_SECTOR_BALANCE_HPP
#define ALLOCATION_ANALYTICS_SECTOR_BALANCE_HPP

#include "data/holding.hpp"
#include "data/price_source.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace allocation
{
    namespace analytics
    {

        /**
         * @enum CheckStatus
         * @brief Severity of a single rule check, mildest first.
         */
        enum class CheckStatus
        {
            OK,
            ADVISORY,
            SOFT_WARNING,
            HARD_VIOLATION
        };

        std::string to_string(CheckStatus status);

        /**
         * @struct SectorAllocation
         * @brief Aggregate allocation of one sector, in percent.
         */
        struct SectorAllocation
        {
            std::string sector;
            double allocation;
        };

        using SectorDistribution = std::vector<SectorAllocation>;

        /**
         * @struct SectorBalanceCheck
         * @brief Outcome of one rule.
         */
        struct SectorBalanceCheck
        {
            int rule = 0;                     ///< 1..5
            CheckStatus status = CheckStatus::OK;
            double value = 0.0;               ///< Measured weight, percent
            std::string sector;               ///< Rule 1 only
            std::vector<std::string> members; ///< Rule 2 only
            std::string message;

            bool operator==(const SectorBalanceCheck &other) const;
        };

        /**
         * @struct SectorBalanceReport
         * @brief All checks of a holdings set plus counts and score.
         */
        struct SectorBalanceReport
        {
            std::vector<SectorBalanceCheck> checks;
            int hard_violations = 0;
            int soft_warnings = 0;
            int advisories = 0;
            int overall_score = 100; ///< 0..100

            /** @brief No hard violation and no soft warning. */
            bool compliant() const { return hard_violations == 0 && soft_warnings == 0; }

            bool operator==(const SectorBalanceReport &other) const;
        };

        /**
         * @enum Priority
         * @brief Urgency of a target adjustment, mirrors the check severity.
         */
        enum class Priority
        {
            HIGH,
            MEDIUM,
            LOW
        };

        std::string to_string(Priority priority);

        /**
         * @struct TargetAdjustment
         * @brief Desired move of one sector's weight.
         */
        struct TargetAdjustment
        {
            double current = 0.0;
            double target = 0.0;
            double delta = 0.0; ///< target - current
            Priority priority = Priority::LOW;
        };

        /** @brief Target adjustments keyed by sector. */
        using TargetAdjustments = std::map<std::string, TargetAdjustment>;

        /**
         * @struct SectorBalanceThresholds
         * @brief Tunable rule thresholds, penalties and adjustment targets (percent).
         */
        struct SectorBalanceThresholds
        {
            double single_sector_hard = 40.0;
            double single_sector_soft = 30.0;
            double correlated_hard = 60.0;
            double correlated_soft = 50.0;
            double defensive_hard = 5.0;
            double defensive_soft = 10.0;
            double reit_hard = 20.0;
            double reit_soft = 15.0;
            double energy_materials_hard = 25.0;
            double energy_materials_soft = 20.0;
            double energy_materials_advisory = 15.0;

            int hard_penalty = 30;
            int soft_penalty = 15;
            int advisory_penalty = 5;

            double overweight_target_hard = 25.0;
            double overweight_target_soft = 30.0;
            double correlated_reduction = 0.7; ///< Multiplier applied to each heavy member
            double correlated_floor = 15.0;
            double defensive_target_hard = 8.0;
            double defensive_target_soft = 5.0;
            double reit_target = 15.0;
            double energy_materials_target = 12.0;
        };

        /**
         * @class SectorBalanceEvaluator
         * @brief Pure evaluator of sector concentration rules.
         *
         * Holds a reference to the sector lookup; the lookup must outlive the
         * evaluator. Calling check() twice on the same holdings yields equal
         * reports.
         */
        class SectorBalanceEvaluator
        {
        public:
            explicit SectorBalanceEvaluator(const data::SectorLookup &sectors,
                                            const SectorBalanceThresholds &thresholds = SectorBalanceThresholds());

            /**
             * @brief Allocation per sector, normalized to 100, largest first.
             *
             * Unmapped tickers are aggregated under "Unknown". A holdings set
             * whose total is 0 yields an empty distribution.
             */
            SectorDistribution sector_distribution(const data::Holdings &holdings) const;

            /**
             * @brief Evaluate all five rules.
             */
            SectorBalanceReport check(const data::Holdings &holdings) const;

            /**
             * @brief Derive per-sector targets from the non-OK checks of @p report.
             *
             * When two checks target the same sector the higher priority wins;
             * on equal priority the first derived adjustment is kept.
             */
            TargetAdjustments target_adjustments(const SectorBalanceReport &report,
                                                 const data::Holdings &holdings) const;

            /**
             * @brief Connected components of size > 1 among @p sectors.
             *
             * Components are discovered in the order of @p sectors.
             */
            static std::vector<std::vector<std::string>> correlated_groups(const std::vector<std::string> &sectors);

            static const std::vector<std::pair<std::string, std::string>> &correlated_pairs();

            static const std::vector<std::string> &defensive_sectors();

            static bool is_real_estate(const std::string &sector);

            static bool is_energy_or_materials(const std::string &sector);

            const data::SectorLookup &lookup() const { return sectors_; }

            const SectorBalanceThresholds &thresholds() const { return thresholds_; }

        private:
            CheckStatus ceiling_status(double value, double hard, double soft) const;

            int score(const std::vector<SectorBalanceCheck> &checks) const;

            const data::SectorLookup &sectors_;
            SectorBalanceThresholds thresholds_;
        };

        void to_json(nlohmann::json &j, const SectorAllocation &s);
        void to_json(nlohmann::json &j, const SectorBalanceCheck &c);
        void to_json(nlohmann::json &j, const SectorBalanceReport &r);
        void to_json(nlohmann::json &j, const TargetAdjustment &a);

    } // namespace analytics
} // namespace allocation

#endif // ALLOCATION_ANALYTICS_SECTOR_BALANCE_HPP

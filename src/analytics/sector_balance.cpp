/**
 * @file sector_balance.cpp
 * @brief Implementation of SectorBalanceEvaluator.
 */

#include "analytics/sector_balance.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>

namespace allocation
{
    namespace analytics
    {

        namespace
        {

            std::string percent(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(1) << value << "%";
                return oss.str();
            }

            int rank(Priority p)
            {
                switch (p)
                {
                case Priority::HIGH:
                    return 3;
                case Priority::MEDIUM:
                    return 2;
                case Priority::LOW:
                    return 1;
                }
                return 0;
            }

            Priority priority_of(CheckStatus status)
            {
                if (status == CheckStatus::HARD_VIOLATION)
                {
                    return Priority::HIGH;
                }
                if (status == CheckStatus::SOFT_WARNING)
                {
                    return Priority::MEDIUM;
                }
                return Priority::LOW;
            }

            void propose(TargetAdjustments &adjustments, const std::string &sector,
                         double current, double target, Priority priority)
            {
                auto it = adjustments.find(sector);
                if (it != adjustments.end() && rank(it->second.priority) >= rank(priority))
                {
                    return;
                }
                adjustments[sector] = TargetAdjustment{current, target, target - current, priority};
            }

        } // anonymous namespace

        std::string to_string(CheckStatus status)
        {
            switch (status)
            {
            case CheckStatus::OK:
                return "OK";
            case CheckStatus::ADVISORY:
                return "ADVISORY";
            case CheckStatus::SOFT_WARNING:
                return "SOFT_WARNING";
            case CheckStatus::HARD_VIOLATION:
                return "HARD_VIOLATION";
            }
            return "OK";
        }

        std::string to_string(Priority priority)
        {
            switch (priority)
            {
            case Priority::HIGH:
                return "high";
            case Priority::MEDIUM:
                return "medium";
            case Priority::LOW:
                return "low";
            }
            return "low";
        }

        bool SectorBalanceCheck::operator==(const SectorBalanceCheck &other) const
        {
            return rule == other.rule && status == other.status && value == other.value &&
                   sector == other.sector && members == other.members && message == other.message;
        }

        bool SectorBalanceReport::operator==(const SectorBalanceReport &other) const
        {
            return checks == other.checks && hard_violations == other.hard_violations &&
                   soft_warnings == other.soft_warnings && advisories == other.advisories &&
                   overall_score == other.overall_score;
        }

        // ===================================================================
        // Fixed sector relationships
        // ===================================================================

        const std::vector<std::pair<std::string, std::string>> &SectorBalanceEvaluator::correlated_pairs()
        {
            static const std::vector<std::pair<std::string, std::string>> pairs = {
                {"Information Technology", "Communication Services"},
                {"Energy", "Materials"},
                {"Consumer Staples", "Health Care"},
                {"Industrials", "Financials"},
                {"Consumer Discretionary", "Communication Services"}};
            return pairs;
        }

        const std::vector<std::string> &SectorBalanceEvaluator::defensive_sectors()
        {
            static const std::vector<std::string> sectors = {"Consumer Staples", "Health Care", "Utilities"};
            return sectors;
        }

        bool SectorBalanceEvaluator::is_real_estate(const std::string &sector)
        {
            return sector.find("Real Estate") != std::string::npos;
        }

        bool SectorBalanceEvaluator::is_energy_or_materials(const std::string &sector)
        {
            return sector == "Energy" || sector == "Materials";
        }

        std::vector<std::vector<std::string>> SectorBalanceEvaluator::correlated_groups(const std::vector<std::string> &sectors)
        {
            std::unordered_map<std::string, std::vector<std::string>> adjacency;
            std::set<std::string> present(sectors.begin(), sectors.end());
            for (const auto &sector : sectors)
            {
                adjacency[sector];
            }
            for (const auto &[a, b] : correlated_pairs())
            {
                if (present.count(a) && present.count(b))
                {
                    adjacency[a].push_back(b);
                    adjacency[b].push_back(a);
                }
            }

            std::vector<std::vector<std::string>> groups;
            std::set<std::string> visited;
            for (const auto &sector : sectors)
            {
                if (visited.count(sector))
                {
                    continue;
                }
                std::vector<std::string> component;
                std::vector<std::string> stack{sector};
                visited.insert(sector);
                while (!stack.empty())
                {
                    std::string current = stack.back();
                    stack.pop_back();
                    component.push_back(current);
                    for (const auto &neighbor : adjacency[current])
                    {
                        if (visited.insert(neighbor).second)
                        {
                            stack.push_back(neighbor);
                        }
                    }
                }
                if (component.size() > 1)
                {
                    groups.push_back(std::move(component));
                }
            }
            return groups;
        }

        // ===================================================================
        // Evaluation
        // ===================================================================

        SectorBalanceEvaluator::SectorBalanceEvaluator(const data::SectorLookup &sectors,
                                                       const SectorBalanceThresholds &thresholds)
            : sectors_(sectors), thresholds_(thresholds)
        {
        }

        SectorDistribution SectorBalanceEvaluator::sector_distribution(const data::Holdings &holdings) const
        {
            SectorDistribution distribution;
            std::unordered_map<std::string, size_t> position;
            double total = 0.0;
            for (const auto &h : holdings)
            {
                std::string sector = sectors_.get_sector(h.ticker);
                auto it = position.find(sector);
                if (it == position.end())
                {
                    position[sector] = distribution.size();
                    distribution.push_back({sector, h.allocation});
                }
                else
                {
                    distribution[it->second].allocation += h.allocation;
                }
                total += h.allocation;
            }

            if (total <= 0.0)
            {
                return {};
            }

            for (auto &s : distribution)
            {
                s.allocation = s.allocation / total * 100.0;
            }
            std::sort(distribution.begin(), distribution.end(),
                      [](const SectorAllocation &a, const SectorAllocation &b)
                      {
                          if (a.allocation != b.allocation)
                          {
                              return a.allocation > b.allocation;
                          }
                          return a.sector < b.sector;
                      });
            return distribution;
        }

        CheckStatus SectorBalanceEvaluator::ceiling_status(double value, double hard, double soft) const
        {
            if (value > hard)
            {
                return CheckStatus::HARD_VIOLATION;
            }
            if (value > soft)
            {
                return CheckStatus::SOFT_WARNING;
            }
            return CheckStatus::OK;
        }

        int SectorBalanceEvaluator::score(const std::vector<SectorBalanceCheck> &checks) const
        {
            int result = 100;
            for (const auto &c : checks)
            {
                if (c.status == CheckStatus::HARD_VIOLATION)
                {
                    result -= thresholds_.hard_penalty;
                }
                else if (c.status == CheckStatus::SOFT_WARNING)
                {
                    result -= thresholds_.soft_penalty;
                }
                else if (c.status == CheckStatus::ADVISORY)
                {
                    result -= thresholds_.advisory_penalty;
                }
            }
            return std::max(0, result);
        }

        SectorBalanceReport SectorBalanceEvaluator::check(const data::Holdings &holdings) const
        {
            const SectorDistribution distribution = sector_distribution(holdings);
            std::map<std::string, double> weight;
            std::vector<std::string> sector_names;
            for (const auto &s : distribution)
            {
                weight[s.sector] = s.allocation;
                sector_names.push_back(s.sector);
            }

            SectorBalanceReport report;

            // Rule 1: largest single sector (distribution is sorted)
            if (!distribution.empty())
            {
                const SectorAllocation &largest = distribution.front();
                SectorBalanceCheck c;
                c.rule = 1;
                c.status = ceiling_status(largest.allocation, thresholds_.single_sector_hard,
                                          thresholds_.single_sector_soft);
                c.value = largest.allocation;
                c.sector = largest.sector;
                c.message = "Single sector '" + largest.sector + "' weight: " + percent(largest.allocation);
                report.checks.push_back(c);
            }

            // Rule 2: correlated groups, reported only when not OK
            for (const auto &group : correlated_groups(sector_names))
            {
                double group_weight = 0.0;
                for (const auto &sector : group)
                {
                    group_weight += weight[sector];
                }
                CheckStatus status = ceiling_status(group_weight, thresholds_.correlated_hard,
                                                    thresholds_.correlated_soft);
                if (status == CheckStatus::OK)
                {
                    continue;
                }
                SectorBalanceCheck c;
                c.rule = 2;
                c.status = status;
                c.value = group_weight;
                c.members = group;
                c.message = "Correlated sector group total: " + percent(group_weight);
                report.checks.push_back(c);
            }

            // Rule 3: defensive floor
            double defensive = 0.0;
            for (const auto &sector : defensive_sectors())
            {
                auto it = weight.find(sector);
                if (it != weight.end())
                {
                    defensive += it->second;
                }
            }
            {
                SectorBalanceCheck c;
                c.rule = 3;
                if (defensive < thresholds_.defensive_hard)
                {
                    c.status = CheckStatus::HARD_VIOLATION;
                }
                else if (defensive < thresholds_.defensive_soft)
                {
                    c.status = CheckStatus::SOFT_WARNING;
                }
                c.value = defensive;
                c.message = "Defensive sectors total: " + percent(defensive);
                report.checks.push_back(c);
            }

            // Rule 4: REIT ceiling
            double reit = 0.0;
            double energy_materials = 0.0;
            for (const auto &s : distribution)
            {
                if (is_real_estate(s.sector))
                {
                    reit += s.allocation;
                }
                if (is_energy_or_materials(s.sector))
                {
                    energy_materials += s.allocation;
                }
            }
            {
                SectorBalanceCheck c;
                c.rule = 4;
                c.status = ceiling_status(reit, thresholds_.reit_hard, thresholds_.reit_soft);
                c.value = reit;
                c.message = "REITs total: " + percent(reit);
                report.checks.push_back(c);
            }

            // Rule 5: Energy + Materials ceiling with an advisory band
            {
                SectorBalanceCheck c;
                c.rule = 5;
                c.status = ceiling_status(energy_materials, thresholds_.energy_materials_hard,
                                          thresholds_.energy_materials_soft);
                if (c.status == CheckStatus::OK && energy_materials > thresholds_.energy_materials_advisory)
                {
                    c.status = CheckStatus::ADVISORY;
                }
                c.value = energy_materials;
                c.message = "Energy + Materials total: " + percent(energy_materials);
                report.checks.push_back(c);
            }

            for (const auto &c : report.checks)
            {
                if (c.status == CheckStatus::HARD_VIOLATION)
                {
                    ++report.hard_violations;
                }
                else if (c.status == CheckStatus::SOFT_WARNING)
                {
                    ++report.soft_warnings;
                }
                else if (c.status == CheckStatus::ADVISORY)
                {
                    ++report.advisories;
                }
            }
            report.overall_score = score(report.checks);
            return report;
        }

        // ===================================================================
        // Target adjustments
        // ===================================================================

        TargetAdjustments SectorBalanceEvaluator::target_adjustments(const SectorBalanceReport &report,
                                                                     const data::Holdings &holdings) const
        {
            TargetAdjustments adjustments;
            const SectorDistribution distribution = sector_distribution(holdings);
            std::map<std::string, double> weight;
            for (const auto &s : distribution)
            {
                weight[s.sector] = s.allocation;
            }
            auto current_of = [&weight](const std::string &sector)
            {
                auto it = weight.find(sector);
                return it != weight.end() ? it->second : 0.0;
            };

            for (const auto &c : report.checks)
            {
                if (c.status == CheckStatus::OK)
                {
                    continue;
                }
                const Priority priority = priority_of(c.status);
                const bool hard = c.status == CheckStatus::HARD_VIOLATION;

                switch (c.rule)
                {
                case 1:
                {
                    if (c.sector.empty())
                    {
                        break;
                    }
                    double target = hard ? thresholds_.overweight_target_hard : thresholds_.overweight_target_soft;
                    propose(adjustments, c.sector, current_of(c.sector), target, priority);
                    break;
                }
                case 2:
                    for (const auto &member : c.members)
                    {
                        double current = current_of(member);
                        if (current > thresholds_.correlated_floor)
                        {
                            double target = std::max(current * thresholds_.correlated_reduction,
                                                     thresholds_.correlated_floor);
                            propose(adjustments, member, current, target, priority);
                        }
                    }
                    break;
                case 3:
                {
                    double target = hard ? thresholds_.defensive_target_hard : thresholds_.defensive_target_soft;
                    for (const auto &sector : defensive_sectors())
                    {
                        double current = current_of(sector);
                        if (current < target)
                        {
                            propose(adjustments, sector, current, target, priority);
                        }
                    }
                    break;
                }
                case 4:
                case 5:
                {
                    const bool reit_rule = c.rule == 4;
                    const double cap = reit_rule ? thresholds_.reit_target : thresholds_.energy_materials_target;
                    if (c.value <= cap)
                    {
                        break;
                    }
                    for (const auto &s : distribution)
                    {
                        bool member = reit_rule ? is_real_estate(s.sector) : is_energy_or_materials(s.sector);
                        if (member && s.allocation > 0.0)
                        {
                            propose(adjustments, s.sector, s.allocation, s.allocation * cap / c.value, priority);
                        }
                    }
                    break;
                }
                default:
                    break;
                }
            }
            return adjustments;
        }

        // ===================================================================
        // JSON
        // ===================================================================

        void to_json(nlohmann::json &j, const SectorAllocation &s)
        {
            j = nlohmann::json{{"sector", s.sector}, {"allocation", s.allocation}};
        }

        void to_json(nlohmann::json &j, const SectorBalanceCheck &c)
        {
            j = nlohmann::json{{"rule", c.rule},
                               {"status", to_string(c.status)},
                               {"value", c.value},
                               {"message", c.message}};
            if (!c.sector.empty())
            {
                j["sector"] = c.sector;
            }
            if (!c.members.empty())
            {
                j["members"] = c.members;
            }
        }

        void to_json(nlohmann::json &j, const SectorBalanceReport &r)
        {
            j = nlohmann::json{{"checks", r.checks},
                               {"hard_violations", r.hard_violations},
                               {"soft_warnings", r.soft_warnings},
                               {"advisories", r.advisories},
                               {"overall_score", r.overall_score}};
        }

        void to_json(nlohmann::json &j, const TargetAdjustment &a)
        {
            j = nlohmann::json{{"current", a.current},
                               {"target", a.target},
                               {"delta", a.delta},
                               {"priority", to_string(a.priority)}};
        }

    } // namespace analytics
} // namespace allocation

/**
 * @file sector_adjuster.cpp
 * @brief Implementation of SectorAdjuster
 */

#include "optimizer/sector_adjuster.hpp"
#include "data/price_source.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {

            constexpr double kEpsilon = 1e-9;
            constexpr int kMaxFillRounds = 32;

            double sum_of(const std::map<std::string, double> &weights)
            {
                double total = 0.0;
                for (const auto &entry : weights)
                {
                    total += entry.second;
                }
                return total;
            }

            // Lower rank is opened first when freed weight needs a new sector
            int receiving_rank(const std::string &sector)
            {
                using analytics::SectorBalanceEvaluator;
                if (SectorBalanceEvaluator::is_energy_or_materials(sector))
                {
                    return 4;
                }
                if (SectorBalanceEvaluator::is_real_estate(sector))
                {
                    return 3;
                }
                bool paired = false;
                for (const auto &[a, b] : SectorBalanceEvaluator::correlated_pairs())
                {
                    paired = paired || a == sector || b == sector;
                }
                if (!paired)
                {
                    return 0;
                }
                const auto &defensive = SectorBalanceEvaluator::defensive_sectors();
                return std::find(defensive.begin(), defensive.end(), sector) != defensive.end() ? 1 : 2;
            }

            // Takes the excess out of sectors no rule asked to move, defensive ones last
            void release(std::map<std::string, double> &desired,
                         const std::set<std::string> &trimmed,
                         const std::set<std::string> &raised,
                         double excess)
            {
                const auto &defensive = analytics::SectorBalanceEvaluator::defensive_sectors();
                for (bool include_defensive : {false, true})
                {
                    std::vector<std::string> donors;
                    double total = 0.0;
                    for (const auto &[sector, weight] : desired)
                    {
                        const bool is_defensive =
                            std::find(defensive.begin(), defensive.end(), sector) != defensive.end();
                        if (trimmed.count(sector) || raised.count(sector) || weight <= kEpsilon ||
                            (is_defensive && !include_defensive))
                        {
                            continue;
                        }
                        donors.push_back(sector);
                        total += weight;
                    }
                    if (total > excess)
                    {
                        const double scale = (total - excess) / total;
                        for (const auto &sector : donors)
                        {
                            desired[sector] *= scale;
                        }
                        return;
                    }
                }
            }

        } // anonymous namespace

        // ============================================================================
        // SectorAdjusterSettings Implementation
        // ============================================================================

        void SectorAdjusterSettings::validate() const
        {
            if (max_iterations < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'max_iterations', got: " + std::to_string(max_iterations));
            }
            if (min_allocation < 0.0 || min_allocation >= 100.0)
            {
                throw std::invalid_argument(
                    "min_allocation must be in [0, 100), got: " + std::to_string(min_allocation));
            }
            if (new_tickers_per_sector < 0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'new_tickers_per_sector', got: " + std::to_string(new_tickers_per_sector));
            }
            if (hard_aggressiveness <= 0.0 || hard_aggressiveness > 1.0 ||
                soft_aggressiveness <= 0.0 || soft_aggressiveness > 1.0)
            {
                throw std::invalid_argument("Aggressiveness factors must be in (0, 1]");
            }
            if (headroom_margin < 0.0 || headroom_margin > 10.0)
            {
                throw std::invalid_argument(
                    "headroom_margin must be in [0, 10], got: " + std::to_string(headroom_margin));
            }
        }

        SectorAdjusterSettings SectorAdjusterSettings::from_json(const nlohmann::json &j)
        {
            SectorAdjusterSettings settings;
            settings.max_iterations = j.value("max_iterations", settings.max_iterations);
            settings.min_allocation = j.value("min_allocation", settings.min_allocation);
            settings.new_tickers_per_sector = j.value("new_tickers_per_sector", settings.new_tickers_per_sector);
            settings.hard_aggressiveness = j.value("hard_aggressiveness", settings.hard_aggressiveness);
            settings.soft_aggressiveness = j.value("soft_aggressiveness", settings.soft_aggressiveness);
            settings.headroom_margin = j.value("headroom_margin", settings.headroom_margin);
            settings.validate();
            return settings;
        }

        // ============================================================================
        // SectorAdjuster Implementation
        // ============================================================================

        SectorAdjuster::SectorAdjuster(const analytics::SectorBalanceEvaluator &evaluator,
                                       const SectorAdjusterSettings &settings)
            : evaluator_(evaluator), settings_(settings)
        {
            settings_.validate();
        }

        AdjustmentResult SectorAdjuster::adjust(const data::Holdings &holdings,
                                                const std::vector<std::string> &available) const
        {
            AdjustmentResult result;
            result.holdings = data::normalize(data::merge_duplicates(holdings));

            for (int i = 0; i < settings_.max_iterations; ++i)
            {
                analytics::SectorBalanceReport report = evaluator_.check(result.holdings);
                if (report.compliant())
                {
                    break;
                }
                data::Holdings next = apply_pass(result.holdings, report, available);
                ++result.iterations;
                if (next == result.holdings)
                {
                    // No adjustment could move the holdings any further
                    break;
                }
                result.holdings = std::move(next);
            }

            result.report = evaluator_.check(result.holdings);
            result.converged = result.report.compliant();
            return result;
        }

        data::Holdings SectorAdjuster::apply_pass(const data::Holdings &holdings,
                                                  const analytics::SectorBalanceReport &report,
                                                  const std::vector<std::string> &available) const
        {
            const analytics::TargetAdjustments adjustments = evaluator_.target_adjustments(report, holdings);
            const data::SectorLookup &lookup = evaluator_.lookup();
            const double aggressiveness = report.hard_violations > 0
                                              ? settings_.hard_aggressiveness
                                              : settings_.soft_aggressiveness;

            std::map<std::string, double> current;
            for (const auto &s : evaluator_.sector_distribution(holdings))
            {
                current[s.sector] = s.allocation;
            }

            std::set<std::string> held;
            for (const auto &h : holdings)
            {
                held.insert(h.ticker);
            }
            const std::set<std::string> allowed(available.begin(), available.end());

            // Desired weight per sector; sums to 100 once the residual is placed
            std::map<std::string, double> desired = current;
            std::set<std::string> trimmed;
            std::set<std::string> raised;
            std::map<std::string, std::vector<std::string>> additions;

            for (const auto &[sector, adjustment] : adjustments)
            {
                auto it = current.find(sector);
                const double weight = it != current.end() ? it->second : 0.0;

                if (adjustment.delta < 0.0 && weight > 0.0)
                {
                    desired[sector] = adjustment.target * aggressiveness;
                    trimmed.insert(sector);
                }
                else if (adjustment.delta > 0.0 && weight > 0.0)
                {
                    desired[sector] = adjustment.target;
                    raised.insert(sector);
                }
                else if (adjustment.delta > 0.0)
                {
                    std::vector<std::string> picks = addable_tickers(sector, held, allowed);
                    if (picks.empty())
                    {
                        continue;
                    }
                    held.insert(picks.begin(), picks.end());
                    additions[sector] = std::move(picks);
                    desired[sector] = adjustment.target;
                    raised.insert(sector);
                }
            }

            double residual = 100.0 - sum_of(desired);
            if (residual > kEpsilon)
            {
                residual = fill(desired, trimmed, residual);
                // Open new sectors while the held ones cannot absorb the freed weight
                while (residual > kEpsilon)
                {
                    std::vector<std::string> picks;
                    const std::string sector = next_receiving_sector(desired, held, allowed, picks);
                    if (sector.empty())
                    {
                        break;
                    }
                    held.insert(picks.begin(), picks.end());
                    additions[sector] = std::move(picks);
                    desired[sector] = 0.0;
                    residual = fill(desired, trimmed, residual);
                }
            }
            else if (residual < -kEpsilon)
            {
                release(desired, trimmed, raised, -residual);
            }

            data::Holdings next;
            next.reserve(holdings.size() + additions.size() * static_cast<size_t>(settings_.new_tickers_per_sector));
            for (const auto &h : holdings)
            {
                const std::string sector = lookup.get_sector(h.ticker);
                const double weight = current[sector];
                const double scale = weight > 0.0 ? desired[sector] / weight : 1.0;
                next.push_back({h.ticker, h.allocation * scale});
            }
            for (const auto &[sector, picks] : additions)
            {
                const double weight = desired[sector];
                if (weight <= kEpsilon)
                {
                    continue;
                }
                for (const auto &ticker : picks)
                {
                    next.push_back({ticker, weight / static_cast<double>(picks.size())});
                }
            }

            return data::drop_small(data::normalize(next), settings_.min_allocation);
        }

        std::vector<std::string> SectorAdjuster::addable_tickers(const std::string &sector,
                                                                 const std::set<std::string> &held,
                                                                 const std::set<std::string> &allowed) const
        {
            std::vector<std::string> picks;
            for (const auto &ticker : evaluator_.lookup().tickers_by_sector(sector))
            {
                if (static_cast<int>(picks.size()) >= settings_.new_tickers_per_sector)
                {
                    break;
                }
                if (held.count(ticker) || (!allowed.empty() && !allowed.count(ticker)))
                {
                    continue;
                }
                picks.push_back(ticker);
            }
            return picks;
        }

        double SectorAdjuster::headroom(const std::string &sector, const std::map<std::string, double> &desired) const
        {
            using analytics::SectorBalanceEvaluator;
            const analytics::SectorBalanceThresholds &limits = evaluator_.thresholds();
            const double margin = settings_.headroom_margin;

            auto weight_of = [&desired](const std::string &s)
            {
                auto it = desired.find(s);
                return it != desired.end() ? it->second : 0.0;
            };

            double room = limits.single_sector_soft - margin - weight_of(sector);

            std::vector<std::string> present;
            for (const auto &[s, weight] : desired)
            {
                if (weight > kEpsilon || s == sector)
                {
                    present.push_back(s);
                }
            }
            if (desired.find(sector) == desired.end())
            {
                present.push_back(sector);
            }
            for (const auto &group : SectorBalanceEvaluator::correlated_groups(present))
            {
                if (std::find(group.begin(), group.end(), sector) == group.end())
                {
                    continue;
                }
                double total = 0.0;
                for (const auto &member : group)
                {
                    total += weight_of(member);
                }
                room = std::min(room, limits.correlated_soft - margin - total);
            }

            double reit = 0.0;
            double energy_materials = 0.0;
            for (const auto &[s, weight] : desired)
            {
                if (SectorBalanceEvaluator::is_real_estate(s))
                {
                    reit += weight;
                }
                if (SectorBalanceEvaluator::is_energy_or_materials(s))
                {
                    energy_materials += weight;
                }
            }
            if (SectorBalanceEvaluator::is_real_estate(sector))
            {
                room = std::min(room, limits.reit_soft - margin - reit);
            }
            if (SectorBalanceEvaluator::is_energy_or_materials(sector))
            {
                room = std::min(room, limits.energy_materials_soft - margin - energy_materials);
            }
            return std::max(0.0, room);
        }

        double SectorAdjuster::fill(std::map<std::string, double> &desired,
                                    const std::set<std::string> &trimmed,
                                    double residual) const
        {
            for (int round = 0; round < kMaxFillRounds && residual > kEpsilon; ++round)
            {
                std::vector<std::string> receivers;
                for (const auto &entry : desired)
                {
                    if (!trimmed.count(entry.first) && headroom(entry.first, desired) > kEpsilon)
                    {
                        receivers.push_back(entry.first);
                    }
                }
                if (receivers.empty())
                {
                    break;
                }

                const double share = residual / static_cast<double>(receivers.size());
                for (const auto &sector : receivers)
                {
                    const double give = std::min(share, headroom(sector, desired));
                    desired[sector] += give;
                    residual -= give;
                }
            }
            return residual;
        }

        std::string SectorAdjuster::next_receiving_sector(const std::map<std::string, double> &desired,
                                                          const std::set<std::string> &held,
                                                          const std::set<std::string> &allowed,
                                                          std::vector<std::string> &picks) const
        {
            const data::SectorLookup &lookup = evaluator_.lookup();
            std::set<std::string> pool;
            for (const auto &ticker : lookup.all_tickers())
            {
                pool.insert(lookup.get_sector(ticker));
            }

            std::string best;
            int best_rank = 0;
            for (const auto &sector : pool)
            {
                if (sector == data::UNKNOWN_SECTOR || desired.count(sector))
                {
                    continue;
                }
                const int rank = receiving_rank(sector);
                if (!best.empty() && rank >= best_rank)
                {
                    continue;
                }
                if (headroom(sector, desired) <= kEpsilon)
                {
                    continue;
                }
                std::vector<std::string> tickers = addable_tickers(sector, held, allowed);
                if (tickers.empty())
                {
                    continue;
                }
                best = sector;
                best_rank = rank;
                picks = std::move(tickers);
            }
            return best;
        }

    } // namespace optimizer
} // namespace allocation

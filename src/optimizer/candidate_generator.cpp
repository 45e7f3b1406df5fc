/**
 * @file candidate_generator.cpp
 * @brief Implementation of CandidateGenerator
 */

#include "optimizer/candidate_generator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {

            bool contains(const std::vector<std::string> &tickers, const std::string &ticker)
            {
                return std::find(tickers.begin(), tickers.end(), ticker) != tickers.end();
            }

            /**
             * @brief Indices of @p holdings ordered by allocation, largest first (ties keep input order)
             */
            std::vector<size_t> by_allocation_desc(const data::Holdings &holdings)
            {
                std::vector<size_t> order(holdings.size());
                std::iota(order.begin(), order.end(), 0);
                std::stable_sort(order.begin(), order.end(),
                                 [&holdings](size_t a, size_t b)
                                 { return holdings[a].allocation > holdings[b].allocation; });
                return order;
            }

        } // anonymous namespace

        CandidateGenerator::CandidateGenerator(const data::SectorLookup &sectors, double min_allocation)
            : sectors_(sectors), min_allocation_(min_allocation)
        {
            if (min_allocation < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'min_allocation', got: " + std::to_string(min_allocation));
            }
        }

        // ============================================================================
        // Sampling
        // ============================================================================

        std::vector<std::string> CandidateGenerator::sample_subset(const std::vector<std::string> &universe,
                                                                   size_t target_size,
                                                                   const std::vector<std::string> &must_include,
                                                                   const std::vector<std::string> &preferred,
                                                                   std::mt19937_64 &rng) const
        {
            if (universe.empty())
            {
                throw std::invalid_argument("Cannot sample candidates from an empty universe");
            }

            std::vector<std::string> chosen;
            std::set<std::string> taken;
            for (const auto &ticker : must_include)
            {
                if (contains(universe, ticker) && taken.insert(ticker).second)
                {
                    chosen.push_back(ticker);
                }
            }

            size_t size = std::max(target_size, chosen.size());
            size = std::max<size_t>(1, std::min(size, universe.size()));

            for (const auto &ticker : preferred)
            {
                if (chosen.size() >= size)
                {
                    break;
                }
                if (contains(universe, ticker) && taken.insert(ticker).second)
                {
                    chosen.push_back(ticker);
                }
            }

            std::vector<std::string> rest;
            rest.reserve(universe.size());
            for (const auto &ticker : universe)
            {
                if (!taken.count(ticker))
                {
                    rest.push_back(ticker);
                }
            }
            std::shuffle(rest.begin(), rest.end(), rng);
            for (const auto &ticker : rest)
            {
                if (chosen.size() >= size)
                {
                    break;
                }
                taken.insert(ticker);
                chosen.push_back(ticker);
            }
            return chosen;
        }

        data::Holdings CandidateGenerator::unbiased(const std::vector<std::string> &universe,
                                                    size_t target_size,
                                                    const std::vector<std::string> &must_include,
                                                    std::mt19937_64 &rng) const
        {
            std::uniform_real_distribution<double> weight(0.0, 1.0);
            data::Holdings holdings;
            for (const auto &ticker : sample_subset(universe, target_size, must_include, {}, rng))
            {
                holdings.push_back({ticker, weight(rng)});
            }
            return data::normalize(holdings);
        }

        data::Holdings CandidateGenerator::sector_biased(const std::vector<std::string> &universe,
                                                         size_t target_size,
                                                         const std::vector<std::string> &must_include,
                                                         const analytics::TargetAdjustments &adjustments,
                                                         double strength,
                                                         std::mt19937_64 &rng) const
        {
            // Seed the subset with members of the sectors that need more weight
            std::vector<std::string> preferred;
            for (const auto &[sector, adjustment] : adjustments)
            {
                if (adjustment.delta <= 0.0)
                {
                    continue;
                }
                std::vector<std::string> members;
                for (const auto &ticker : universe)
                {
                    if (sectors_.get_sector(ticker) == sector)
                    {
                        members.push_back(ticker);
                    }
                }
                std::shuffle(members.begin(), members.end(), rng);
                for (size_t i = 0; i < members.size() && i < 2; ++i)
                {
                    preferred.push_back(members[i]);
                }
            }

            std::uniform_real_distribution<double> weight(0.0, 1.0);
            data::Holdings holdings;
            for (const auto &ticker : sample_subset(universe, target_size, must_include, preferred, rng))
            {
                double w = weight(rng);
                auto it = adjustments.find(sectors_.get_sector(ticker));
                if (it != adjustments.end())
                {
                    double magnitude = std::abs(it->second.delta) / 100.0;
                    if (it->second.delta > 0.0)
                    {
                        w *= 1.0 + magnitude * strength * 2.0;
                    }
                    else if (it->second.delta < 0.0)
                    {
                        w *= std::max(0.1, 1.0 - magnitude * strength);
                    }
                }
                holdings.push_back({ticker, w});
            }

            return data::drop_small(data::normalize(holdings), min_allocation_, must_include);
        }

        // ============================================================================
        // Mutation
        // ============================================================================

        data::Holdings CandidateGenerator::mutate_weights(const data::Holdings &holdings,
                                                          double rate,
                                                          std::mt19937_64 &rng) const
        {
            std::uniform_real_distribution<double> shock(-1.0, 1.0);
            data::Holdings mutated(holdings);
            for (auto &h : mutated)
            {
                h.allocation = std::max(0.0, h.allocation + shock(rng) * rate * h.allocation);
            }
            return data::normalize(mutated);
        }

        data::Holdings CandidateGenerator::swap_holding(const data::Holdings &holdings,
                                                        const std::vector<std::string> &universe,
                                                        const std::vector<std::string> &must_include,
                                                        std::mt19937_64 &rng) const
        {
            const std::vector<std::string> held = data::tickers_of(holdings);
            std::vector<std::string> unseen;
            for (const auto &ticker : universe)
            {
                if (!contains(held, ticker))
                {
                    unseen.push_back(ticker);
                }
            }
            if (holdings.empty() || unseen.empty())
            {
                return data::normalize(holdings);
            }

            std::vector<size_t> removable;
            for (size_t i = 0; i < holdings.size(); ++i)
            {
                if (!contains(must_include, holdings[i].ticker))
                {
                    removable.push_back(i);
                }
            }
            if (removable.empty())
            {
                removable.resize(holdings.size());
                std::iota(removable.begin(), removable.end(), 0);
            }

            std::uniform_int_distribution<size_t> pick_removed(0, removable.size() - 1);
            std::uniform_int_distribution<size_t> pick_added(0, unseen.size() - 1);
            const size_t removed = removable[pick_removed(rng)];
            const std::string &added = unseen[pick_added(rng)];

            const double average = data::total_allocation(holdings) / static_cast<double>(holdings.size());
            data::Holdings swapped;
            swapped.reserve(holdings.size());
            for (size_t i = 0; i < holdings.size(); ++i)
            {
                if (i != removed)
                {
                    swapped.push_back(holdings[i]);
                }
            }
            swapped.push_back({added, average});
            return data::normalize(swapped);
        }

        // ============================================================================
        // Post-processing
        // ============================================================================

        data::Holdings CandidateGenerator::limit_holdings(const data::Holdings &holdings,
                                                          size_t cap,
                                                          const std::vector<std::string> &must_include)
        {
            if (cap == 0 || holdings.size() <= cap)
            {
                return data::normalize(holdings);
            }

            std::vector<bool> keep(holdings.size(), false);
            size_t kept = 0;
            for (size_t i = 0; i < holdings.size() && kept < cap; ++i)
            {
                if (contains(must_include, holdings[i].ticker))
                {
                    keep[i] = true;
                    ++kept;
                }
            }
            for (size_t i : by_allocation_desc(holdings))
            {
                if (kept >= cap)
                {
                    break;
                }
                if (!keep[i])
                {
                    keep[i] = true;
                    ++kept;
                }
            }

            data::Holdings limited;
            for (size_t i = 0; i < holdings.size(); ++i)
            {
                if (keep[i])
                {
                    limited.push_back(holdings[i]);
                }
            }
            return data::normalize(limited);
        }

        data::Holdings CandidateGenerator::apply_risk_tolerance(const data::Holdings &holdings,
                                                                RiskTolerance tolerance,
                                                                double conservative_cap)
        {
            data::Holdings adjusted = data::normalize(holdings);
            const size_t n = adjusted.size();
            if (n == 0)
            {
                return adjusted;
            }

            if (tolerance == RiskTolerance::CONSERVATIVE)
            {
                if (static_cast<double>(n) * conservative_cap < 100.0)
                {
                    for (auto &h : adjusted)
                    {
                        h.allocation = 100.0 / static_cast<double>(n);
                    }
                    return adjusted;
                }

                const double eps = 1e-9;
                for (size_t round = 0; round <= n; ++round)
                {
                    double excess = 0.0;
                    for (auto &h : adjusted)
                    {
                        if (h.allocation > conservative_cap + eps)
                        {
                            excess += h.allocation - conservative_cap;
                            h.allocation = conservative_cap;
                        }
                    }
                    if (excess <= 0.0)
                    {
                        break;
                    }

                    double free_total = 0.0;
                    size_t free_count = 0;
                    for (const auto &h : adjusted)
                    {
                        if (h.allocation < conservative_cap - eps)
                        {
                            free_total += h.allocation;
                            ++free_count;
                        }
                    }
                    if (free_count == 0)
                    {
                        break;
                    }
                    for (auto &h : adjusted)
                    {
                        if (h.allocation < conservative_cap - eps)
                        {
                            h.allocation += free_total > 0.0
                                                ? excess * h.allocation / free_total
                                                : excess / static_cast<double>(free_count);
                        }
                    }
                }
                return adjusted;
            }

            if (tolerance == RiskTolerance::AGGRESSIVE)
            {
                const double floor = 1.5 * 100.0 / static_cast<double>(n);
                std::vector<size_t> order = by_allocation_desc(adjusted);
                for (size_t k = 0; k < order.size() && k < 2; ++k)
                {
                    auto &h = adjusted[order[k]];
                    h.allocation = std::max(h.allocation, floor);
                }
                return data::normalize(adjusted);
            }

            return adjusted;
        }

    } // namespace optimizer
} // namespace allocation

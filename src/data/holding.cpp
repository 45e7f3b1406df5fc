/**
 * @file holding.cpp
 * @brief Allocation helpers for holdings sets.
 */

#include "data/holding.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace allocation
{
    namespace data
    {

        double total_allocation(const Holdings &holdings)
        {
            return std::accumulate(holdings.begin(), holdings.end(), 0.0,
                                   [](double sum, const Holding &h)
                                   { return sum + h.allocation; });
        }

        Holdings normalize(const Holdings &holdings)
        {
            Holdings result(holdings);
            if (result.empty())
            {
                return result;
            }

            double total = 0.0;
            for (auto &h : result)
            {
                h.allocation = std::max(0.0, h.allocation);
                total += h.allocation;
            }

            if (total <= 0.0)
            {
                double equal = 100.0 / static_cast<double>(result.size());
                for (auto &h : result)
                {
                    h.allocation = equal;
                }
                return result;
            }

            for (auto &h : result)
            {
                h.allocation = h.allocation / total * 100.0;
            }
            return result;
        }

        Holdings drop_small(const Holdings &holdings, double min_allocation,
                            const std::vector<std::string> &keep)
        {
            Holdings kept;
            kept.reserve(holdings.size());
            for (const auto &h : holdings)
            {
                bool protected_ticker = std::find(keep.begin(), keep.end(), h.ticker) != keep.end();
                if (h.allocation >= min_allocation || protected_ticker)
                {
                    kept.push_back(h);
                }
            }
            // Never return an empty set when there was something to keep
            if (kept.empty() && !holdings.empty())
            {
                auto largest = std::max_element(holdings.begin(), holdings.end(),
                                                [](const Holding &a, const Holding &b)
                                                { return a.allocation < b.allocation; });
                kept.push_back(*largest);
            }
            return normalize(kept);
        }

        double allocation_of(const Holdings &holdings, const std::string &ticker)
        {
            for (const auto &h : holdings)
            {
                if (h.ticker == ticker)
                {
                    return h.allocation;
                }
            }
            return 0.0;
        }

        std::vector<std::string> tickers_of(const Holdings &holdings)
        {
            std::vector<std::string> tickers;
            tickers.reserve(holdings.size());
            for (const auto &h : holdings)
            {
                tickers.push_back(h.ticker);
            }
            return tickers;
        }

        Holdings merge_duplicates(const Holdings &holdings)
        {
            Holdings merged;
            std::unordered_map<std::string, size_t> position;
            for (const auto &h : holdings)
            {
                auto it = position.find(h.ticker);
                if (it == position.end())
                {
                    position[h.ticker] = merged.size();
                    merged.push_back(h);
                }
                else
                {
                    merged[it->second].allocation += h.allocation;
                }
            }
            return merged;
        }

        void to_json(nlohmann::json &j, const Holding &h)
        {
            j = nlohmann::json{{"ticker", h.ticker}, {"allocation", h.allocation}};
        }

        void from_json(const nlohmann::json &j, Holding &h)
        {
            h.ticker = j.at("ticker").get<std::string>();
            h.allocation = j.at("allocation").get<double>();
        }

    } // namespace data
} // namespace allocation

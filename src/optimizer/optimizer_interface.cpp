/**
 * @file optimizer_interface.cpp
 * @brief Implementation of optimizer request parsing and recommendation diff
 */

#include "optimizer/optimizer_interface.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {

            std::string trim_upper(const std::string &value)
            {
                auto begin = std::find_if_not(value.begin(), value.end(),
                                              [](unsigned char c)
                                              { return std::isspace(c); });
                auto end = std::find_if_not(value.rbegin(), value.rend(),
                                            [](unsigned char c)
                                            { return std::isspace(c); })
                               .base();
                std::string result = begin < end ? std::string(begin, end) : std::string();
                std::transform(result.begin(), result.end(), result.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                return result;
            }

            std::string rationale_for(bool increase, RiskTolerance tolerance)
            {
                if (increase)
                {
                    switch (tolerance)
                    {
                    case RiskTolerance::CONSERVATIVE:
                        return "Provides stability and reduces overall portfolio volatility while maintaining growth potential";
                    case RiskTolerance::AGGRESSIVE:
                        return "Offers strong growth potential and enhances overall portfolio returns";
                    case RiskTolerance::MODERATE:
                        break;
                    }
                    return "Improves risk-adjusted returns and portfolio diversification";
                }
                switch (tolerance)
                {
                case RiskTolerance::CONSERVATIVE:
                    return "Reduces exposure to higher volatility while maintaining diversification";
                case RiskTolerance::AGGRESSIVE:
                    return "Reallocates capital to higher-performing opportunities";
                case RiskTolerance::MODERATE:
                    break;
                }
                return "Optimizes allocation for better risk-adjusted returns";
            }

        } // anonymous namespace

        // ============================================================================
        // RiskTolerance
        // ============================================================================

        RiskTolerance parse_risk_tolerance(const std::string &value)
        {
            std::string lower = value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (lower == "conservative")
            {
                return RiskTolerance::CONSERVATIVE;
            }
            if (lower == "moderate")
            {
                return RiskTolerance::MODERATE;
            }
            if (lower == "aggressive")
            {
                return RiskTolerance::AGGRESSIVE;
            }
            throw std::invalid_argument(
                "Expected risk tolerance 'conservative', 'moderate' or 'aggressive', got: '" + value + "'");
        }

        std::string to_string(RiskTolerance tolerance)
        {
            switch (tolerance)
            {
            case RiskTolerance::CONSERVATIVE:
                return "conservative";
            case RiskTolerance::MODERATE:
                return "moderate";
            case RiskTolerance::AGGRESSIVE:
                return "aggressive";
            }
            return "moderate";
        }

        // ============================================================================
        // OptimizationRequest Implementation
        // ============================================================================

        void OptimizationRequest::validate() const
        {
            if (holdings.empty())
            {
                throw std::invalid_argument("At least one holding is required");
            }

            for (const auto &h : holdings)
            {
                if (h.ticker.empty())
                {
                    throw std::invalid_argument("Ticker is required for every holding");
                }
                if (!(h.allocation >= 0.0) || !std::isfinite(h.allocation))
                {
                    throw std::invalid_argument(
                        "Allocation must be non-negative for ticker '" + h.ticker + "', got: " + std::to_string(h.allocation));
                }
            }

            if (target_return && (*target_return < 1.0 || *target_return > 100.0))
            {
                throw std::invalid_argument(
                    "target_return must be between 1 and 100, got: " + std::to_string(*target_return));
            }
        }

        OptimizationRequest OptimizationRequest::from_json(const nlohmann::json &j)
        {
            if (!j.contains("holdings") || !j.at("holdings").is_array())
            {
                throw std::invalid_argument("Portfolio request must contain a 'holdings' array");
            }

            OptimizationRequest request;
            for (const auto &item : j.at("holdings"))
            {
                data::Holding h = item.get<data::Holding>();
                h.ticker = trim_upper(h.ticker);
                request.holdings.push_back(h);
            }

            request.risk_tolerance = parse_risk_tolerance(j.value("risk_tolerance", std::string("moderate")));
            if (j.contains("target_return") && !j.at("target_return").is_null())
            {
                request.target_return = j.at("target_return").get<double>();
            }
            request.rebalance_sectors = j.value("rebalance_sectors", false);

            request.validate();
            return request;
        }

        // ============================================================================
        // Recommendation diff
        // ============================================================================

        std::vector<OptimizedHolding> diff_holdings(const data::Holdings &reference,
                                                    const data::Holdings &optimized)
        {
            std::vector<OptimizedHolding> result;
            result.reserve(optimized.size() + reference.size());
            std::set<std::string> seen;
            for (const auto &h : optimized)
            {
                result.push_back({h.ticker, h.allocation, h.allocation - data::allocation_of(reference, h.ticker)});
                seen.insert(h.ticker);
            }
            for (const auto &h : reference)
            {
                if (seen.insert(h.ticker).second)
                {
                    result.push_back({h.ticker, 0.0, -h.allocation});
                }
            }
            return result;
        }

        std::vector<Recommendation> make_recommendations(const data::Holdings &reference,
                                                         const data::Holdings &optimized,
                                                         RiskTolerance tolerance,
                                                         double min_change)
        {
            std::vector<std::string> tickers;
            std::set<std::string> seen;
            for (const auto *set : {&reference, &optimized})
            {
                for (const auto &h : *set)
                {
                    if (seen.insert(h.ticker).second)
                    {
                        tickers.push_back(h.ticker);
                    }
                }
            }

            std::vector<Recommendation> recommendations;
            for (const auto &ticker : tickers)
            {
                double current = data::allocation_of(reference, ticker);
                double recommended = data::allocation_of(optimized, ticker);
                double change = recommended - current;
                if (std::abs(change) < min_change)
                {
                    continue;
                }

                Recommendation r;
                r.ticker = ticker;
                r.current_allocation = current;
                r.recommended_allocation = recommended;
                r.change = change;
                if (change > 0.0)
                {
                    r.action = current == 0.0 ? "Add position" : "Increase allocation";
                }
                else
                {
                    r.action = recommended == 0.0 ? "Remove position" : "Decrease allocation";
                }
                r.rationale = rationale_for(change > 0.0, tolerance);
                recommendations.push_back(r);
            }

            std::stable_sort(recommendations.begin(), recommendations.end(),
                             [](const Recommendation &a, const Recommendation &b)
                             { return std::abs(a.change) > std::abs(b.change); });
            return recommendations;
        }

        void to_json(nlohmann::json &j, const OptimizedHolding &h)
        {
            j = nlohmann::json{{"ticker", h.ticker}, {"allocation", h.allocation}, {"change", h.change}};
        }

        void to_json(nlohmann::json &j, const Recommendation &r)
        {
            j = nlohmann::json{{"action", r.action},
                               {"ticker", r.ticker},
                               {"current_allocation", r.current_allocation},
                               {"recommended_allocation", r.recommended_allocation},
                               {"change", r.change},
                               {"rationale", r.rationale}};
        }

    } // namespace optimizer
} // namespace allocation

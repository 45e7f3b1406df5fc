/**
 * @file holding.hpp
 * @brief Holding value type and allocation helpers.
 *
 * Allocations are percentages. A normalized holdings set sums to 100.
 * Holdings sets are plain values: every function here returns a new
 * vector and never modifies its argument.
 */

#ifndef ALLOCATION_DATA_HOLDING_HPP
#define ALLOCATION_DATA_HOLDING_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation
{
    namespace data
    {

        /**
         * @struct Holding
         * @brief A ticker and its allocation in percent.
         */
        struct Holding
        {
            std::string ticker;
            double allocation = 0.0; ///< Percent of the portfolio, >= 0

            bool operator==(const Holding &other) const
            {
                return ticker == other.ticker && allocation == other.allocation;
            }
        };

        using Holdings = std::vector<Holding>;

        /**
         * @brief Sum of all allocations.
         */
        double total_allocation(const Holdings &holdings);

        /**
         * @brief Rescale allocations so they sum to 100.
         *
         * Negative allocations are clamped to zero first. A set whose total is
         * zero becomes equal weight.
         */
        Holdings normalize(const Holdings &holdings);

        /**
         * @brief Drop holdings below @p min_allocation (unless listed in @p keep), then normalize.
         */
        Holdings drop_small(const Holdings &holdings, double min_allocation,
                            const std::vector<std::string> &keep = {});

        /**
         * @brief Allocation of @p ticker, or 0 when it is not held.
         */
        double allocation_of(const Holdings &holdings, const std::string &ticker);

        /**
         * @brief Tickers of a holdings set, in order.
         */
        std::vector<std::string> tickers_of(const Holdings &holdings);

        /**
         * @brief Merge duplicate tickers by summing their allocations (first-seen order).
         */
        Holdings merge_duplicates(const Holdings &holdings);

        void to_json(nlohmann::json &j, const Holding &h);
        void from_json(const nlohmann::json &j, Holding &h);

    } // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_HOLDING_HPP

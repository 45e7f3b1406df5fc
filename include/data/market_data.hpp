/*
 * @file market_data.hpp
 * @brief Time-series market data storage and manipulation.
 *
 * Provides efficient storage and access to adjusted close prices using Eigen
 * matrices. Serves as the in-memory PriceSource consumed by the analytics
 * and optimizer layers.
 */

#ifndef ALLOCATION_DATA_MARKET_DATA_HPP
#define ALLOCATION_DATA_MARKET_DATA_HPP

#include "data/price_source.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace allocation
{
    namespace data
    {

        /**
         * @class MarketData
         * @brief Container for multi-asset time-series price data.
         *
         * Stores historical price data as an Eigen matrix with associated date
         * and ticker indices.
         *
         * @note Data is stored as (dates x assets).
         * @note Missing data is represented as NaN values.
         */
        class MarketData : public PriceSource
        {
        public:
            /**
             * @brief Constructor with data.
             * @param prices Price matrix (dates x assets).
             * @param dates Vector of ascending date strings.
             * @param tickers Vector of asset ticker symbols.
             * @throws std::invalid_argument if dimensions don't match.
             */
            MarketData(const Eigen::MatrixXd &prices,
                       const std::vector<std::string> &dates,
                       const std::vector<std::string> &tickers);

            ~MarketData() override = default;

            // ===========================================
            //  PriceSource
            // ===========================================

            bool has_ticker(const std::string &ticker) const override;

            PriceSeries get_series(const std::string &ticker) const override;

            std::vector<std::string> tickers() const override { return tickers_; }

            // ===========================================
            //  Data Access Methods
            // ===========================================

            /**
             * @brief Get the full price matrix.
             */
            const Eigen::MatrixXd &get_price_matrix() const { return prices_; }

            const std::vector<std::string> &get_dates() const { return dates_; }

            const std::vector<std::string> &get_tickers() const { return tickers_; }

            size_t num_dates() const { return static_cast<size_t>(prices_.rows()); }

            size_t num_assets() const { return static_cast<size_t>(prices_.cols()); }

            /**
             * @brief Index of the first non-NaN observation of a ticker (-1 if none).
             */
            int first_valid_index(const std::string &ticker) const;

            // ===========================================
            //  Filtering and Manipulation Methods
            // ===========================================

            /**
             * @brief Keep rows whose date lies in [start_date, end_date].
             *
             * Bounds need not be present in the index; comparison is lexicographic
             * on YYYY-MM-DD strings.
             *
             * @throws std::invalid_argument if start_date > end_date or nothing remains.
             */
            MarketData filter_by_date(const std::string &start_date,
                                      const std::string &end_date) const;

            /**
             * @brief Select subset of assets, in the given order.
             * @throws std::invalid_argument if a ticker is unknown.
             */
            MarketData select_assets(const std::vector<std::string> &selected_tickers) const;

            /**
             * @brief Forward-fill missing data from the most recent prior price.
             */
            MarketData forward_fill() const;

            // ===========================================
            //  Validation Methods
            // ===========================================

            /**
             * @brief Count missing values.
             */
            size_t count_missing() const;

            /**
             * @brief Print summary statistics to stdout.
             */
            void print_summary() const;

        private:
            int find_ticker_index(const std::string &ticker) const;

            void build_index_maps();

            Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
            std::vector<std::string> dates_;             ///< Date strings
            std::vector<std::string> tickers_;           ///< Asset tickers
            std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
        };

    } // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_MARKET_DATA_HPP

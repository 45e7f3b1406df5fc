/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "data/market_data.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <limits>

namespace allocation
{
    namespace data
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        MarketData::MarketData(const Eigen::MatrixXd &prices,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
            : prices_(prices), dates_(dates), tickers_(tickers)
        {
            if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
            {
                throw std::invalid_argument("Price matrix rows must match dates vector size");
            }
            if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
            {
                throw std::invalid_argument("Price matrix columns must match tickers vector size");
            }

            build_index_maps();
        }

        // ============================================================================
        // PriceSource
        // ============================================================================

        bool MarketData::has_ticker(const std::string &ticker) const
        {
            return find_ticker_index(ticker) >= 0;
        }

        PriceSeries MarketData::get_series(const std::string &ticker) const
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                throw MissingInstrumentError({ticker});
            }

            PriceSeries series;
            series.reserve(dates_.size());
            for (Eigen::Index i = 0; i < prices_.rows(); ++i)
            {
                double p = prices_(i, idx);
                if (!std::isnan(p))
                {
                    series.push_back({dates_[static_cast<size_t>(i)], p});
                }
            }
            return series;
        }

        // ============================================================================
        // Data Access Methods
        // ============================================================================

        int MarketData::first_valid_index(const std::string &ticker) const
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                return -1;
            }
            for (Eigen::Index i = 0; i < prices_.rows(); ++i)
            {
                if (!std::isnan(prices_(i, idx)))
                {
                    return static_cast<int>(i);
                }
            }
            return -1;
        }

        // ================================
        // Data Filtering and Manipulation
        // ================================

        MarketData MarketData::filter_by_date(const std::string &start_date,
                                              const std::string &end_date) const
        {
            if (start_date > end_date)
            {
                throw std::invalid_argument("Start date must be before end date");
            }

            auto first = std::lower_bound(dates_.begin(), dates_.end(), start_date);
            auto last = std::upper_bound(dates_.begin(), dates_.end(), end_date);
            if (first >= last)
            {
                throw std::invalid_argument(
                    "No observations between " + start_date + " and " + end_date);
            }

            Eigen::Index start_idx = static_cast<Eigen::Index>(std::distance(dates_.begin(), first));
            Eigen::Index num_periods = static_cast<Eigen::Index>(std::distance(first, last));
            Eigen::MatrixXd filtered_prices = prices_.block(start_idx, 0, num_periods, prices_.cols());

            std::vector<std::string> filtered_dates(first, last);

            return MarketData(filtered_prices, filtered_dates, tickers_);
        }

        MarketData MarketData::select_assets(const std::vector<std::string> &selected_tickers) const
        {
            std::vector<int> indices;
            indices.reserve(selected_tickers.size());

            for (const auto &ticker : selected_tickers)
            {
                int idx = find_ticker_index(ticker);
                if (idx < 0)
                {
                    throw std::invalid_argument("Ticker not found: " + ticker);
                }
                indices.push_back(idx);
            }

            Eigen::MatrixXd selected_prices(prices_.rows(), static_cast<Eigen::Index>(indices.size()));
            for (size_t i = 0; i < indices.size(); ++i)
            {
                selected_prices.col(static_cast<Eigen::Index>(i)) = prices_.col(indices[i]);
            }

            return MarketData(selected_prices, dates_, selected_tickers);
        }

        MarketData MarketData::forward_fill() const
        {
            Eigen::MatrixXd filled_prices = prices_;

            for (Eigen::Index j = 0; j < filled_prices.cols(); ++j)
            {
                double last_valid = std::numeric_limits<double>::quiet_NaN();

                for (Eigen::Index i = 0; i < filled_prices.rows(); ++i)
                {
                    if (!std::isnan(filled_prices(i, j)))
                    {
                        last_valid = filled_prices(i, j);
                    }
                    else if (!std::isnan(last_valid))
                    {
                        filled_prices(i, j) = last_valid;
                    }
                }
            }

            return MarketData(filled_prices, dates_, tickers_);
        }

        // ===================
        // Validation Methods
        // ===================

        size_t MarketData::count_missing() const
        {
            return static_cast<size_t>(prices_.array().isNaN().count());
        }

        void MarketData::print_summary() const
        {
            std::cout << "\n=== Market Data Summary ===\n";
            std::cout << "Dimensions: " << prices_.rows() << " dates x "
                      << prices_.cols() << " assets\n";
            if (!dates_.empty())
            {
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
            }
            std::cout << "Missing values: " << count_missing() << "\n";
            std::cout << "==========================\n"
                      << std::endl;
        }

        // =========================
        // Private Helper Methods
        // =========================

        int MarketData::find_ticker_index(const std::string &ticker) const
        {
            auto it = ticker_index_.find(ticker);
            if (it != ticker_index_.end())
            {
                return static_cast<int>(it->second);
            }
            return -1;
        }

        void MarketData::build_index_maps()
        {
            ticker_index_.clear();
            for (size_t i = 0; i < tickers_.size(); ++i)
            {
                ticker_index_[tickers_[i]] = i;
            }
        }

    } // namespace data
} // namespace allocation

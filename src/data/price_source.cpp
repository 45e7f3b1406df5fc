/**
 * @file price_source.cpp
 * @brief Date-range alignment over a PriceSource and data-layer errors.
 */

#include "data/price_source.hpp"
#include "data/market_data.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>

namespace allocation
{
    namespace data
    {

        const char *const UNKNOWN_SECTOR = "Unknown";

        namespace
        {

            std::string join_tickers(const std::vector<std::string> &tickers)
            {
                std::ostringstream oss;
                for (size_t i = 0; i < tickers.size(); ++i)
                {
                    if (i > 0)
                    {
                        oss << ", ";
                    }
                    oss << tickers[i];
                }
                return oss.str();
            }

            /**
             * @brief Days since 1970-01-01 of a proleptic Gregorian date.
             */
            long days_from_civil(long y, unsigned m, unsigned d)
            {
                y -= m <= 2 ? 1 : 0;
                const long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long>(doe) - 719468;
            }

            long parse_date(const std::string &date)
            {
                if (date.size() < 10 || date[4] != '-' || date[7] != '-')
                {
                    throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + date + "'");
                }
                try
                {
                    long year = std::stol(date.substr(0, 4));
                    unsigned month = static_cast<unsigned>(std::stoul(date.substr(5, 2)));
                    unsigned day = static_cast<unsigned>(std::stoul(date.substr(8, 2)));
                    if (month < 1 || month > 12 || day < 1 || day > 31)
                    {
                        throw std::invalid_argument("Date out of range: '" + date + "'");
                    }
                    return days_from_civil(year, month, day);
                }
                catch (const std::logic_error &)
                {
                    throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + date + "'");
                }
            }

            void require_tickers(const PriceSource &source,
                                 const std::vector<std::string> &tickers)
            {
                std::vector<std::string> missing;
                for (const auto &ticker : tickers)
                {
                    if (!source.has_ticker(ticker))
                    {
                        missing.push_back(ticker);
                    }
                }
                if (!missing.empty())
                {
                    throw MissingInstrumentError(missing);
                }
            }

        } // anonymous namespace

        MissingInstrumentError::MissingInstrumentError(const std::vector<std::string> &missing_tickers)
            : std::runtime_error("Some tickers could not be found: " + join_tickers(missing_tickers)),
              missing_tickers_(missing_tickers)
        {
        }

        long days_between(const std::string &a, const std::string &b)
        {
            return parse_date(b) - parse_date(a);
        }

        DateRange common_date_range(const PriceSource &source,
                                    const std::vector<std::string> &tickers,
                                    double min_years)
        {
            if (tickers.empty())
            {
                throw std::invalid_argument("Cannot compute a date range without tickers");
            }
            require_tickers(source, tickers);

            DateRange range;
            std::vector<std::string> empty_series;
            for (const auto &ticker : tickers)
            {
                PriceSeries series = source.get_series(ticker);
                if (series.empty())
                {
                    empty_series.push_back(ticker);
                    continue;
                }
                const std::string &start = series.front().date;
                const std::string &end = series.back().date;
                if (range.start_date.empty() || start > range.start_date)
                {
                    range.start_date = start;
                }
                if (range.end_date.empty() || end < range.end_date)
                {
                    range.end_date = end;
                }
            }
            if (!empty_series.empty())
            {
                throw MissingInstrumentError(empty_series);
            }

            long days = days_between(range.start_date, range.end_date);
            range.years = days > 0 ? static_cast<double>(days) / 365.25 : 0.0;

            if (range.years < min_years)
            {
                std::ostringstream oss;
                oss << "Insufficient historical data: common range " << range.start_date
                    << " to " << range.end_date << " covers " << range.years
                    << " years, need at least " << min_years;
                throw InsufficientHistoryError(oss.str(), range.years);
            }

            return range;
        }

        MarketData align_prices(const PriceSource &source,
                                const std::vector<std::string> &tickers,
                                const DateRange &range)
        {
            require_tickers(source, tickers);

            std::vector<PriceSeries> all_series;
            all_series.reserve(tickers.size());
            std::set<std::string> date_set;

            for (const auto &ticker : tickers)
            {
                PriceSeries filtered;
                for (const auto &point : source.get_series(ticker))
                {
                    if (point.date >= range.start_date && point.date <= range.end_date)
                    {
                        filtered.push_back(point);
                        date_set.insert(point.date);
                    }
                }
                all_series.push_back(std::move(filtered));
            }

            std::vector<std::string> dates(date_set.begin(), date_set.end());
            std::map<std::string, Eigen::Index> row_of;
            for (size_t i = 0; i < dates.size(); ++i)
            {
                row_of[dates[i]] = static_cast<Eigen::Index>(i);
            }

            Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(
                static_cast<Eigen::Index>(dates.size()),
                static_cast<Eigen::Index>(tickers.size()),
                std::numeric_limits<double>::quiet_NaN());

            for (size_t j = 0; j < all_series.size(); ++j)
            {
                for (const auto &point : all_series[j])
                {
                    prices(row_of[point.date], static_cast<Eigen::Index>(j)) = point.adjusted_close;
                }
            }

            return MarketData(prices, dates, tickers).forward_fill();
        }

    } // namespace data
} // namespace allocation

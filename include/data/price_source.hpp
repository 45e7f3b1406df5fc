/**
 * @file price_source.hpp
 * @brief Read-only collaborator interfaces for price history and sector metadata.
 *
 * The analytics and optimizer layers never load data themselves. They are
 * handed a PriceSource (adjusted-close history per ticker) and a SectorLookup
 * (ticker -> sector metadata) by reference and query them read-only.
 *
 * Also declares the data-layer error taxonomy and the date-range alignment
 * routine that turns a PriceSource into a common-range MarketData block.
 */

#ifndef ALLOCATION_DATA_PRICE_SOURCE_HPP
#define ALLOCATION_DATA_PRICE_SOURCE_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace allocation
{
    namespace data
    {

        class MarketData;

        /**
         * @struct PricePoint
         * @brief One adjusted close observation.
         */
        struct PricePoint
        {
            std::string date;      ///< YYYY-MM-DD
            double adjusted_close; ///< Split/dividend adjusted close
        };

        /**
         * @brief Date-ascending adjusted close history of a single ticker.
         */
        using PriceSeries = std::vector<PricePoint>;

        // ===================================================================
        // Errors
        // ===================================================================

        /**
         * @class InsufficientHistoryError
         * @brief The overlapping date range of the requested tickers is too short.
         */
        class InsufficientHistoryError : public std::runtime_error
        {
        public:
            InsufficientHistoryError(const std::string &message, double years_available)
                : std::runtime_error(message), years_available_(years_available)
            {
            }

            /** @brief Length of the common date range that was found, in years. */
            double years_available() const { return years_available_; }

        private:
            double years_available_;
        };

        /**
         * @class MissingInstrumentError
         * @brief One or more requested tickers have no price history.
         */
        class MissingInstrumentError : public std::runtime_error
        {
        public:
            explicit MissingInstrumentError(const std::vector<std::string> &missing_tickers);

            /** @brief Tickers that could not be found, in request order. */
            const std::vector<std::string> &missing_tickers() const { return missing_tickers_; }

        private:
            std::vector<std::string> missing_tickers_;
        };

        // ===================================================================
        // Collaborator interfaces
        // ===================================================================

        /**
         * @class PriceSource
         * @brief Abstract read-only store of adjusted close price history.
         *
         * Implementations must be safe for concurrent read-only access.
         */
        class PriceSource
        {
        public:
            virtual ~PriceSource() = default;

            /**
             * @brief Check whether history exists for a ticker.
             */
            virtual bool has_ticker(const std::string &ticker) const = 0;

            /**
             * @brief Get the full history of a ticker.
             * @param ticker Ticker symbol.
             * @return Date-ascending series, without missing observations.
             * @throws MissingInstrumentError if the ticker is unknown.
             */
            virtual PriceSeries get_series(const std::string &ticker) const = 0;

            /**
             * @brief All tickers known to the store.
             */
            virtual std::vector<std::string> tickers() const = 0;
        };

        /**
         * @class SectorLookup
         * @brief Abstract read-only ticker to sector metadata store.
         */
        class SectorLookup
        {
        public:
            virtual ~SectorLookup() = default;

            /**
             * @brief Sector of a ticker.
             * @return Sector name, or "Unknown" when the ticker is not mapped.
             */
            virtual std::string get_sector(const std::string &ticker) const = 0;

            /**
             * @brief Every mapped ticker, in the order the mapping was built.
             */
            virtual std::vector<std::string> all_tickers() const = 0;

            /**
             * @brief Tickers mapped to a sector (empty if the sector is unknown).
             */
            virtual std::vector<std::string> tickers_by_sector(const std::string &sector) const = 0;
        };

        /**
         * @brief Sector name reported for unmapped tickers.
         */
        extern const char *const UNKNOWN_SECTOR;

        // ===================================================================
        // Alignment
        // ===================================================================

        /**
         * @struct DateRange
         * @brief Common date range shared by a set of tickers.
         */
        struct DateRange
        {
            std::string start_date;
            std::string end_date;
            double years = 0.0; ///< Calendar days / 365.25
        };

        /**
         * @brief Compute the overlap of the histories of @p tickers.
         *
         * The range starts at the latest first observation and ends at the
         * earliest last observation.
         *
         * @throws MissingInstrumentError if any ticker is absent from @p source.
         * @throws InsufficientHistoryError if the overlap is shorter than @p min_years.
         */
        DateRange common_date_range(const PriceSource &source,
                                    const std::vector<std::string> &tickers,
                                    double min_years = 0.1);

        /**
         * @brief Build a date-aligned price block restricted to @p range.
         *
         * Every date observed by any of @p tickers inside the range becomes a
         * row. Missing observations are forward filled from the most recent
         * prior price; cells before a ticker's first observation remain NaN.
         *
         * @throws MissingInstrumentError if any ticker is absent from @p source.
         */
        MarketData align_prices(const PriceSource &source,
                                const std::vector<std::string> &tickers,
                                const DateRange &range);

        /**
         * @brief Whole calendar days between two YYYY-MM-DD dates (b - a).
         * @throws std::invalid_argument on malformed dates.
         */
        long days_between(const std::string &a, const std::string &b);

    } // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_PRICE_SOURCE_HPP

/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load price history from CSV files and
 * configuration from JSON files.
 */

#ifndef ALLOCATION_DATA_DATA_LOADER_HPP
#define ALLOCATION_DATA_DATA_LOADER_HPP

#include "data/market_data.hpp"
#include "analytics/performance_metrics.hpp"
#include "optimizer/search_engine.hpp"
#include "optimizer/sector_adjuster.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocation {
namespace data {

/**
 * @struct DataConfig
 * @brief Configuration parameters for data loading
 */
struct DataConfig {
    std::string prices_file = "data/prices.csv";   ///< Adjusted close history (wide or long CSV)
    std::string sectors_file = "data/sectors.csv"; ///< ticker,sector[,name] CSV or JSON mapping
    std::string benchmark = "^GSPC";               ///< Benchmark ticker
    std::string risk_free = "^IRX";                ///< Risk-free yield ticker (percent quotes)
    double min_history_years = 0.1;                ///< Minimum common history of the holdings

    /**
     * @brief Load from JSON object
     * @throws std::invalid_argument if min_history_years is negative
     */
    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct AllocationConfig
 * @brief Complete application configuration
 */
struct AllocationConfig {
    DataConfig data;
    analytics::MetricsSettings analytics;
    optimizer::SearchSettings search;
    optimizer::SectorAdjusterSettings sector_adjuster;
    bool verbose = false;
};

/**
 * @class DataLoader
 * @brief Loads and parses market data from various sources
 *
 * Supports CSV files with standard formats:
 * - Format 1: date, ticker1, ticker2, ... (wide format)
 * - Format 2: date, ticker, price (long format)
 */
class DataLoader {
public:
    DataLoader() = default;

    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load market data from CSV file (wide format)
     *
     * Expected format:
     * date,AAPL,MSFT,^GSPC,...
     * 2020-01-02,75.09,160.62,3257.85,...
     *
     * Empty cells become NaN.
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load market data from CSV file (long format)
     *
     * Expected format:
     * date,ticker,price
     * 2020-01-02,AAPL,75.09
     * 2020-01-02,MSFT,160.62
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load
     * @return MarketData object
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect CSV format and load
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete application configuration
     *
     * Every section ("data", "analytics", "search", "sector_adjuster") and
     * every field is optional.
     *
     * @throws std::runtime_error on I/O or parse failure
     * @throws std::invalid_argument if a value fails validation
     */
    static AllocationConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic market data (geometric Brownian motion)
     * @param tickers List of ticker symbols
     * @param num_days Number of consecutive calendar days
     * @param start_date Starting date
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Generator seed; identical seeds give identical prices
     * @return MarketData object with synthetic prices starting at 100
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        unsigned int seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save market data to CSV (wide format, NaN written as empty cells)
     */
    static void save_csv_wide(const MarketData& data, const std::string& filepath);

    /**
     * @brief Save market data to CSV (long format, missing cells skipped)
     */
    static void save_csv_long(const MarketData& data, const std::string& filepath);

    /**
     * @brief Generate date string for day offset
     */
    static std::string add_days(const std::string& start_date, int days_offset);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Validate date format (YYYY-MM-DD)
     */
    static bool is_valid_date_format(const std::string& date);

    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace allocation

#endif // ALLOCATION_DATA_DATA_LOADER_HPP

/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <random>
#include <ctime>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <map>

namespace allocation {
namespace data {

// =============================================
// Configuration Structures - from_json Methods
// =============================================

DataConfig DataConfig::from_json(const nlohmann::json& j)
{
    DataConfig config;
    config.prices_file = j.value("prices_file", config.prices_file);
    config.sectors_file = j.value("sectors_file", config.sectors_file);
    config.benchmark = j.value("benchmark", config.benchmark);
    config.risk_free = j.value("risk_free", config.risk_free);
    config.min_history_years = j.value("min_history_years", config.min_history_years);

    if (config.min_history_years < 0.0) {
        throw std::invalid_argument(
            "Expected non-negative value for parameter 'min_history_years', got: " +
            std::to_string(config.min_history_years));
    }
    return config;
}

// ===========================
// CSV Loading - Wide Format
// ===========================

MarketData DataLoader::load_csv_wide(const std::string& filepath,
                                     const std::vector<std::string>& tickers)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::string line;
    std::vector<std::string> all_tickers;
    std::vector<std::string> dates;
    std::vector<std::vector<double>> price_data;

    // Read header line
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty CSV file: " + filepath);
    }

    auto header = parse_csv_line(line);
    if (header.empty() || trim(header[0]) != "date") {
        throw std::runtime_error("CSV must start with 'date' column: " + filepath);
    }

    for (size_t i = 1; i < header.size(); ++i) {
        all_tickers.push_back(trim(header[i]));
    }

    // Determine which columns to load
    std::vector<size_t> column_indices;
    std::vector<std::string> selected_tickers;

    if (tickers.empty()) {
        for (size_t i = 0; i < all_tickers.size(); ++i) {
            column_indices.push_back(i);
            selected_tickers.push_back(all_tickers[i]);
        }
    } else {
        for (const auto& ticker : tickers) {
            auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
            if (it != all_tickers.end()) {
                column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                selected_tickers.push_back(ticker);
            }
        }

        if (column_indices.empty()) {
            throw std::runtime_error("None of the specified tickers found in CSV: " + filepath);
        }
    }

    // Read data rows
    while (std::getline(file, line)) {
        if (trim(line).empty())
            continue;

        auto fields = parse_csv_line(line);
        if (fields.size() < 2)
            continue;

        std::string date = trim(fields[0]);
        if (!is_valid_date_format(date)) {
            continue; // Skip invalid dates
        }

        dates.push_back(date);

        std::vector<double> row_prices;
        row_prices.reserve(column_indices.size());

        for (size_t idx : column_indices) {
            if (idx + 1 < fields.size()) {
                row_prices.push_back(safe_stod(fields[idx + 1]));
            } else {
                row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
            }
        }

        price_data.push_back(row_prices);
    }

    file.close();

    if (dates.empty()) {
        throw std::runtime_error("No valid data found in CSV file: " + filepath);
    }

    // Rows may arrive in any order; MarketData expects ascending dates
    std::vector<size_t> order(dates.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&dates](size_t a, size_t b) { return dates[a] < dates[b]; });

    std::vector<std::string> sorted_dates;
    sorted_dates.reserve(dates.size());
    Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                           static_cast<Eigen::Index>(selected_tickers.size()));
    for (size_t i = 0; i < order.size(); ++i) {
        sorted_dates.push_back(dates[order[i]]);
        for (size_t j = 0; j < selected_tickers.size(); ++j) {
            prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = price_data[order[i]][j];
        }
    }

    return MarketData(prices, sorted_dates, selected_tickers);
}

// ===========================
// CSV Loading - Long Format
// ===========================

MarketData DataLoader::load_csv_long(const std::string& filepath,
                                     const std::vector<std::string>& tickers)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::string line;
    std::map<std::string, std::map<std::string, double>> data_map; // date -> ticker -> price
    std::set<std::string> all_dates;
    std::vector<std::string> ticker_vec;
    std::set<std::string> seen_tickers;

    // Skip header
    std::getline(file, line);

    while (std::getline(file, line)) {
        if (trim(line).empty())
            continue;

        auto fields = parse_csv_line(line);
        if (fields.size() < 3)
            continue;

        std::string date = trim(fields[0]);
        std::string ticker = trim(fields[1]);
        double price = safe_stod(fields[2]);

        if (!is_valid_date_format(date) || ticker.empty())
            continue;

        // Filter by tickers if specified
        if (!tickers.empty() &&
            std::find(tickers.begin(), tickers.end(), ticker) == tickers.end()) {
            continue;
        }

        data_map[date][ticker] = price;
        all_dates.insert(date);
        if (seen_tickers.insert(ticker).second) {
            ticker_vec.push_back(ticker);
        }
    }

    file.close();

    if (all_dates.empty() || ticker_vec.empty()) {
        throw std::runtime_error("No valid data found in CSV file: " + filepath);
    }

    std::vector<std::string> dates(all_dates.begin(), all_dates.end());

    Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()),
                           static_cast<Eigen::Index>(ticker_vec.size()));
    prices.setConstant(std::numeric_limits<double>::quiet_NaN());

    for (size_t i = 0; i < dates.size(); ++i) {
        const auto& row = data_map[dates[i]];
        for (size_t j = 0; j < ticker_vec.size(); ++j) {
            auto it = row.find(ticker_vec[j]);
            if (it != row.end()) {
                prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = it->second;
            }
        }
    }

    return MarketData(prices, dates, ticker_vec);
}

// ========================
// Auto-detect CSV Format
// ========================

MarketData DataLoader::load_csv(const std::string& filepath,
                                const std::vector<std::string>& tickers)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::string line;
    std::getline(file, line);
    file.close();

    auto header = parse_csv_line(line);

    // Wide format: date, ticker1, ticker2, ...
    // Long format: date, ticker, price
    if (header.size() == 3 &&
        (trim(header[1]) == "ticker" || trim(header[1]) == "symbol")) {
        return load_csv_long(filepath, tickers);
    }
    return load_csv_wide(filepath, tickers);
}

// ================
// JSON Loading
// ================

nlohmann::json DataLoader::load_json(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open JSON file: " + filepath);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("JSON parsing error in " + filepath + ": " + std::string(e.what()));
    }

    file.close();
    return j;
}

AllocationConfig DataLoader::load_config(const std::string& config_path)
{
    auto j = load_json(config_path);

    AllocationConfig config;

    try {
        if (j.contains("data")) {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("analytics")) {
            const auto& analytics = j["analytics"];
            config.analytics = analytics::MetricsSettings::from_json(analytics);
            if (analytics.contains("min_history_years")) {
                config.data.min_history_years = analytics["min_history_years"].get<double>();
            }
        }

        if (j.contains("search")) {
            config.search = optimizer::SearchSettings::from_json(j["search"]);
        }

        if (j.contains("sector_adjuster")) {
            config.sector_adjuster = optimizer::SectorAdjusterSettings::from_json(j["sector_adjuster"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
    }

    config.verbose = j.value("verbose", false);
    config.search.verbose = config.search.verbose || config.verbose;

    if (config.data.min_history_years < 0.0) {
        throw std::invalid_argument(
            "Expected non-negative value for parameter 'min_history_years', got: " +
            std::to_string(config.data.min_history_years));
    }

    return config;
}

// ===========================
// Synthetic Data Generation
// ===========================

MarketData DataLoader::generate_synthetic_data(
    const std::vector<std::string>& tickers,
    size_t num_days,
    const std::string& start_date,
    double volatility,
    double drift,
    unsigned int seed)
{
    if (tickers.empty() || num_days == 0) {
        throw std::invalid_argument("Synthetic data needs at least one ticker and one day");
    }

    std::mt19937 gen(seed);
    std::normal_distribution<double> dist(drift, volatility);

    Eigen::MatrixXd prices(static_cast<Eigen::Index>(num_days), static_cast<Eigen::Index>(tickers.size()));
    std::vector<std::string> dates;
    dates.reserve(num_days);

    for (size_t i = 0; i < num_days; ++i) {
        dates.push_back(add_days(start_date, static_cast<int>(i)));
    }

    // Generate prices (geometric Brownian motion)
    for (Eigen::Index j = 0; j < prices.cols(); ++j) {
        prices(0, j) = 100.0;

        for (Eigen::Index i = 1; i < prices.rows(); ++i) {
            double return_val = dist(gen);
            prices(i, j) = prices(i - 1, j) * (1.0 + return_val);
        }
    }

    return MarketData(prices, dates, tickers);
}

// ==================
// Export Methods
// ==================

void DataLoader::save_csv_wide(const MarketData& data, const std::string& filepath)
{
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "date";
    for (const auto& ticker : data.get_tickers()) {
        file << "," << ticker;
    }
    file << "\n";

    const auto& prices = data.get_price_matrix();
    const auto& dates = data.get_dates();

    for (size_t i = 0; i < dates.size(); ++i) {
        file << dates[i];
        for (Eigen::Index j = 0; j < prices.cols(); ++j) {
            double price = prices(static_cast<Eigen::Index>(i), j);
            file << ",";
            if (!std::isnan(price)) {
                file << std::fixed << std::setprecision(6) << price;
            }
        }
        file << "\n";
    }

    file.close();
}

void DataLoader::save_csv_long(const MarketData& data, const std::string& filepath)
{
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "date,ticker,price\n";

    const auto& prices = data.get_price_matrix();
    const auto& dates = data.get_dates();
    const auto& tickers = data.get_tickers();

    for (size_t i = 0; i < dates.size(); ++i) {
        for (size_t j = 0; j < tickers.size(); ++j) {
            double price = prices(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
            if (std::isnan(price))
                continue;
            file << dates[i] << "," << tickers[j] << ","
                 << std::fixed << std::setprecision(6) << price << "\n";
        }
    }

    file.close();
}

// =======================
// Private Helper Methods
// =======================

std::vector<std::string> DataLoader::parse_csv_line(const std::string& line)
{
    std::vector<std::string> tokens;
    std::string token;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            tokens.push_back(token);
            token.clear();
        } else {
            token += c;
        }
    }

    tokens.push_back(token);
    return tokens;
}

bool DataLoader::is_valid_date_format(const std::string& date)
{
    if (date.length() != 10)
        return false;
    if (date[4] != '-' || date[7] != '-')
        return false;

    for (size_t i = 0; i < date.length(); ++i) {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i])))
            return false;
    }

    return true;
}

std::string DataLoader::trim(const std::string& str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

double DataLoader::safe_stod(const std::string& str)
{
    std::string trimmed = trim(str);
    if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN" || trimmed == "null") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    try {
        return std::stod(trimmed);
    } catch (const std::invalid_argument&) {
        return std::numeric_limits<double>::quiet_NaN();
    } catch (const std::out_of_range&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
}

std::string DataLoader::add_days(const std::string& start_date, int days_offset)
{
    std::tm tm = {};
    std::istringstream ss(start_date);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: " + start_date);
    }

    // Noon keeps daylight-saving shifts from moving the calendar day
    tm.tm_hour = 12;
    tm.tm_mday += days_offset;
    tm.tm_isdst = -1;
    std::mktime(&tm);

    char buffer[11];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

} // namespace data
} // namespace allocation

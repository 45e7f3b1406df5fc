/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic price history and sector mapping for the allocation optimizer
 */

#include "analytics/performance_metrics.hpp"
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>

using namespace allocation;

namespace {

struct DemoInstrument {
    const char* ticker;
    const char* sector;
    const char* name;
    double volatility_scale;
};

// A small S&P-like universe covering every sector
const std::vector<DemoInstrument> kUniverse = {
    {"AAPL", "Information Technology", "Apple Inc.", 1.3},
    {"MSFT", "Information Technology", "Microsoft Corp.", 1.2},
    {"NVDA", "Information Technology", "NVIDIA Corp.", 1.8},
    {"GOOGL", "Communication Services", "Alphabet Inc.", 1.3},
    {"META", "Communication Services", "Meta Platforms Inc.", 1.6},
    {"VZ", "Communication Services", "Verizon Communications", 0.7},
    {"AMZN", "Consumer Discretionary", "Amazon.com Inc.", 1.4},
    {"HD", "Consumer Discretionary", "Home Depot Inc.", 1.0},
    {"MCD", "Consumer Discretionary", "McDonald's Corp.", 0.8},
    {"JPM", "Financials", "JPMorgan Chase & Co.", 1.1},
    {"BAC", "Financials", "Bank of America Corp.", 1.2},
    {"GS", "Financials", "Goldman Sachs Group", 1.2},
    {"JNJ", "Health Care", "Johnson & Johnson", 0.7},
    {"PFE", "Health Care", "Pfizer Inc.", 0.9},
    {"UNH", "Health Care", "UnitedHealth Group", 0.9},
    {"PG", "Consumer Staples", "Procter & Gamble", 0.6},
    {"KO", "Consumer Staples", "Coca-Cola Co.", 0.6},
    {"WMT", "Consumer Staples", "Walmart Inc.", 0.7},
    {"XOM", "Energy", "Exxon Mobil Corp.", 1.3},
    {"CVX", "Energy", "Chevron Corp.", 1.3},
    {"LIN", "Materials", "Linde plc", 0.9},
    {"NEM", "Materials", "Newmont Corp.", 1.2},
    {"CAT", "Industrials", "Caterpillar Inc.", 1.1},
    {"HON", "Industrials", "Honeywell International", 0.9},
    {"UPS", "Industrials", "United Parcel Service", 1.0},
    {"NEE", "Utilities", "NextEra Energy", 0.8},
    {"DUK", "Utilities", "Duke Energy", 0.6},
    {"PLD", "Real Estate", "Prologis Inc.", 1.1},
    {"AMT", "Real Estate", "American Tower Corp.", 1.0},
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::string prices_file = "data/prices.csv";
    std::string sectors_file = "data/sectors.csv";
    size_t num_days = 1095; // three calendar years
    std::string start_date = "2021-01-01";
    double base_volatility = 0.012;
    double base_drift = 0.0004;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--prices" && i + 1 < argc) {
            prices_file = argv[++i];
        } else if (arg == "--sectors" && i + 1 < argc) {
            sectors_file = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--start" && i + 1 < argc) {
            start_date = argv[++i];
        } else if (arg == "--volatility" && i + 1 < argc) {
            base_volatility = std::stod(argv[++i]);
        } else if (arg == "--drift" && i + 1 < argc) {
            base_drift = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --prices FILE      Output prices CSV (default: data/prices.csv)\n"
                      << "  --sectors FILE     Output sector CSV (default: data/sectors.csv)\n"
                      << "  --days N           Number of calendar days (default: 1095)\n"
                      << "  --start DATE       First date, YYYY-MM-DD (default: 2021-01-01)\n"
                      << "  --volatility VAL   Base daily volatility (default: 0.012)\n"
                      << "  --drift VAL        Base daily drift (default: 0.0004)\n"
                      << "  --seed N           Generator seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        } else {
            std::cerr << "Warning: Unknown argument: " << arg << std::endl;
        }
    }

    try {
        std::cout << "Generating data for " << kUniverse.size() << " assets plus ^GSPC and ^IRX..." << std::endl;
        std::cout << "Time period: " << start_date << ", " << num_days << " days" << std::endl;

        std::vector<std::string> tickers;
        for (const auto& instrument : kUniverse) {
            tickers.push_back(instrument.ticker);
        }

        // Each instrument gets its own volatility; one generator call per ticker keeps seeds distinct
        Eigen::MatrixXd prices(static_cast<Eigen::Index>(num_days),
                               static_cast<Eigen::Index>(tickers.size() + 2));
        std::vector<std::string> dates;
        for (size_t k = 0; k < kUniverse.size(); ++k) {
            auto single = data::DataLoader::generate_synthetic_data(
                {tickers[k]}, num_days, start_date,
                base_volatility * kUniverse[k].volatility_scale, base_drift, seed + static_cast<unsigned int>(k));
            prices.col(static_cast<Eigen::Index>(k)) = single.get_price_matrix().col(0);
            if (dates.empty()) {
                dates = single.get_dates();
            }
        }

        // Benchmark: equal-weight index of the universe, rescaled to start at 3000
        for (Eigen::Index i = 0; i < prices.rows(); ++i) {
            double level = prices.row(i).head(static_cast<Eigen::Index>(tickers.size())).mean();
            prices(i, static_cast<Eigen::Index>(tickers.size())) = level * 30.0;
        }

        // Risk-free yield in percent, a slow random walk around 2%
        std::mt19937 gen(seed);
        std::normal_distribution<double> step(0.0, 0.01);
        double yield = 2.0;
        for (Eigen::Index i = 0; i < prices.rows(); ++i) {
            yield = std::max(0.0, yield + step(gen));
            prices(i, static_cast<Eigen::Index>(tickers.size() + 1)) = yield;
        }

        std::vector<std::string> all_tickers = tickers;
        all_tickers.push_back("^GSPC");
        all_tickers.push_back("^IRX");
        data::MarketData market(prices, dates, all_tickers);

        std::cout << "\nSaving prices to " << prices_file << "..." << std::endl;
        data::DataLoader::save_csv_wide(market, prices_file);

        std::cout << "Saving sectors to " << sectors_file << "..." << std::endl;
        std::ofstream sectors(sectors_file);
        if (!sectors.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + sectors_file);
        }
        sectors << "ticker,sector,name\n";
        for (const auto& instrument : kUniverse) {
            sectors << instrument.ticker << "," << instrument.sector << ",\"" << instrument.name << "\"\n";
        }
        sectors.close();

        // Summary statistics
        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << market.num_dates() << " ("
                  << market.get_dates().front() << " to "
                  << market.get_dates().back() << ")\n";
        std::cout << "Assets: " << market.num_assets() << "\n";

        analytics::MetricsEngine engine;
        std::cout << "\nAsset Statistics (Annualized):\n";
        std::cout << std::string(60, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(15) << "CAGR"
                  << std::setw(15) << "Volatility"
                  << std::setw(15) << "Sharpe\n";
        std::cout << std::string(60, '-') << "\n";

        for (const auto& ticker : all_tickers) {
            if (ticker == "^IRX") {
                continue;
            }
            auto metrics = engine.compute(engine.portfolio_values(market, {{ticker, 100.0}}));
            std::cout << std::setw(8) << ticker
                      << std::setw(14) << std::fixed << std::setprecision(2)
                      << metrics.annualized_return << "%"
                      << std::setw(14) << metrics.volatility << "%"
                      << std::setw(15) << std::setprecision(3) << metrics.sharpe_ratio << "\n";
        }
        std::cout << std::string(60, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/allocation_optimizer --config config.json --portfolio portfolio.json --verbose\n";
    std::cout << std::endl;

    return 0;
}

/**
 * @file main.cpp
 * @brief Main entry point for the Sector-Aware Allocation Optimizer
 *
 * Command-line application that loads configuration, price history and
 * sector metadata, then analyzes, optimizes or sector-checks a portfolio
 * request and writes the result as JSON.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/sector_mapper.hpp"
#include "engine/portfolio_engine.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

using namespace allocation;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Sector-Aware Allocation Optimizer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --portfolio PATH      Path to portfolio request JSON file (required)\n"
              << "  --mode MODE           analyze | optimize | check (default: optimize)\n"
              << "  --output PATH         Write the JSON result to PATH\n"
              << "  --frontier PATH       Export the efficient frontier to a CSV file (optimize mode)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config.json --portfolio portfolio.json --mode analyze\n"
              << "  " << program_name << " --config config.json --portfolio portfolio.json --output result.json\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Sector-Aware Allocation Optimizer v1.0.0                \n"
              << "       Stochastic search with sector balance rules             \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string portfolio_path;
    std::string mode = "optimize";
    std::string output_path;
    std::string frontier_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--portfolio" && i + 1 < argc)
            {
                args.portfolio_path = argv[++i];
            }
            else if (arg == "--mode" && i + 1 < argc)
            {
                args.mode = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--frontier" && i + 1 < argc)
            {
                args.frontier_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !portfolio_path.empty() &&
               (mode == "analyze" || mode == "optimize" || mode == "check");
    }
};

/**
 * @brief Print performance metrics
 */
void print_metrics(const std::string &title, const analytics::PerformanceMetrics &metrics)
{
    std::cout << "\n"
              << title << "\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << metrics.summary();
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Print sector balance report
 */
void print_sector_report(const analytics::SectorBalanceReport &report)
{
    std::cout << "\nSector Balance (score " << report.overall_score << "/100, "
              << report.hard_violations << " hard, " << report.soft_warnings << " soft, "
              << report.advisories << " advisory)\n";
    for (const auto &check : report.checks)
    {
        if (check.status == analytics::CheckStatus::OK)
        {
            continue;
        }
        std::cout << "  [" << analytics::to_string(check.status) << "] " << check.message << "\n";
    }
}

/**
 * @brief Print holdings with change against the reference
 */
void print_holdings(const std::vector<optimizer::OptimizedHolding> &holdings)
{
    std::vector<optimizer::OptimizedHolding> sorted = holdings;
    std::sort(sorted.begin(), sorted.end(),
              [](const auto &a, const auto &b)
              { return a.allocation > b.allocation; });

    std::cout << "\nAllocation:\n";
    for (const auto &h : sorted)
    {
        std::cout << "  " << std::setw(8) << std::left << h.ticker << std::right
                  << ": " << std::fixed << std::setprecision(2) << std::setw(6) << h.allocation
                  << "%  (" << std::showpos << h.change << std::noshowpos << ")\n";
    }
}

/**
 * @brief Write a JSON document to a file
 */
void write_json(const nlohmann::json &j, const std::string &path)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + path);
    }
    file << j.dump(2) << "\n";
}

/**
 * @brief Load sector metadata from CSV or JSON depending on the extension
 */
data::SectorMapping load_sectors(const std::string &path)
{
    const std::string suffix = ".json";
    if (path.size() >= suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
        return data::SectorMapping::from_json(data::DataLoader::load_json(path));
    }
    return data::SectorMapping::from_csv(path);
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = data::DataLoader::load_config(args.config_path);
        config.verbose = config.verbose || args.verbose;

        auto engine_config = engine::EngineConfig::from_config(config);
        engine_config.verbose = config.verbose;
        engine_config.search.verbose = engine_config.search.verbose || config.verbose;

        if (config.verbose)
        {
            std::cout << "  - Prices: " << config.data.prices_file << "\n";
            std::cout << "  - Sectors: " << config.data.sectors_file << "\n";
            std::cout << "  - Benchmark: " << config.data.benchmark
                      << ", risk-free: " << config.data.risk_free << "\n";
            std::cout << "  - Search: " << config.search.max_retries << " retries, "
                      << config.search.time_budget_seconds << "s budget, seed "
                      << config.search.seed << "\n";
        }

        // ====================================================================
        // 2. Load Portfolio Request
        // ====================================================================
        std::cout << "[2/5] Loading portfolio request..." << std::endl;

        auto request = optimizer::OptimizationRequest::from_json(
            data::DataLoader::load_json(args.portfolio_path));

        std::cout << "  - " << request.holdings.size() << " holding(s), risk tolerance "
                  << optimizer::to_string(request.risk_tolerance);
        if (request.target_return)
        {
            std::cout << ", target return " << *request.target_return << "%";
        }
        std::cout << (request.rebalance_sectors ? ", sector rebalancing" : "") << std::endl;

        // ====================================================================
        // 3. Load Sector Metadata
        // ====================================================================
        std::cout << "[3/5] Loading sector metadata..." << std::endl;

        auto sectors = load_sectors(config.data.sectors_file);
        std::cout << "  - " << sectors.all_tickers().size() << " mapped tickers" << std::endl;

        nlohmann::json output;

        if (args.mode == "check")
        {
            // Sector checks need no price history
            std::cout << "[4/5] Skipping market data (check mode)" << std::endl;
            std::cout << "[5/5] Checking sector balance..." << std::endl;

            data::MarketData empty(Eigen::MatrixXd(0, 0), {}, {});
            engine::PortfolioEngine engine(empty, sectors, engine_config);
            auto report = engine.check_sector_balance(request.holdings);
            print_sector_report(report);
            output = report;
        }
        else
        {
            // ====================================================================
            // 4. Load Market Data
            // ====================================================================
            std::cout << "[4/5] Loading market data..." << std::endl;

            auto prices = data::DataLoader::load_csv(config.data.prices_file);
            std::cout << "  - Loaded " << prices.num_dates() << " dates, "
                      << prices.num_assets() << " assets" << std::endl;

            if (config.verbose)
            {
                prices.print_summary();
            }

            engine::PortfolioEngine engine(prices, sectors, engine_config);

            // ====================================================================
            // 5. Analyze / Optimize
            // ====================================================================
            if (args.mode == "analyze")
            {
                std::cout << "[5/5] Analyzing portfolio..." << std::endl;

                auto analysis = engine.analyze(request.holdings, request.rebalance_sectors);
                std::cout << "  - Period: " << analysis.start_date << " to " << analysis.end_date
                          << " (" << std::fixed << std::setprecision(2) << analysis.period_years << " years)\n";
                print_metrics("PORTFOLIO METRICS", analysis.metrics);
                if (analysis.sector_balance)
                {
                    print_sector_report(*analysis.sector_balance);
                }
                output = analysis;
            }
            else
            {
                std::cout << "[5/5] Running allocation search..." << std::endl;

                auto result = engine.optimize(request);
                print_metrics("CURRENT PORTFOLIO", result.current.metrics);
                print_metrics("OPTIMIZED PORTFOLIO", result.optimized.metrics);
                print_holdings(result.optimized.holdings);
                print_sector_report(result.optimized.sector_balance_report);

                std::cout << "\nRecommendations:\n";
                for (const auto &rec : result.recommendations)
                {
                    std::cout << "  - " << rec.action << " " << rec.ticker << ": "
                              << std::fixed << std::setprecision(2) << rec.current_allocation << "% -> "
                              << rec.recommended_allocation << "%\n";
                }

                std::cout << "\n  - Search: " << result.statistics.iterations << " iteration(s), "
                          << result.statistics.candidates_evaluated << " candidates, "
                          << result.statistics.stop_reason << "\n";

                if (config.verbose)
                {
                    result.efficient_frontier.print_summary();
                }
                if (!args.frontier_path.empty())
                {
                    result.efficient_frontier.export_to_csv(args.frontier_path);
                    std::cout << "  Frontier data exported to: " << args.frontier_path << "\n";
                }
                output = result;
            }
        }

        if (!args.output_path.empty())
        {
            write_json(output, args.output_path);
            std::cout << "  Result written to: " << args.output_path << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}

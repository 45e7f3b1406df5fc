/**
 * @file portfolio_engine.hpp
 * @brief Facade over metrics, sector balance and allocation search
 *
 * The engine owns no data. It is handed a PriceSource and a SectorLookup by
 * reference, aligns the price history of each request to the common date
 * range of its holdings and runs the analytics and optimizer components on
 * the aligned block.
 *
 * Every call is a single synchronous computation; the engine keeps no
 * mutable state between calls.
 */

#ifndef ALLOCATION_ENGINE_PORTFOLIO_ENGINE_HPP
#define ALLOCATION_ENGINE_PORTFOLIO_ENGINE_HPP

#include "analytics/performance_metrics.hpp"
#include "analytics/sector_balance.hpp"
#include "data/data_loader.hpp"
#include "data/holding.hpp"
#include "data/price_source.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "optimizer/search_engine.hpp"
#include "optimizer/sector_adjuster.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace allocation
{
    namespace engine
    {

        /**
         * @struct EngineConfig
         * @brief Settings of every component the engine drives
         */
        struct EngineConfig
        {
            std::string benchmark = "^GSPC"; ///< Benchmark ticker, used when priced
            std::string risk_free = "^IRX";  ///< Risk-free yield ticker, used when priced
            double min_history_years = 0.1;
            analytics::MetricsSettings metrics; ///< risk_free_rate is the fallback rate
            analytics::SectorBalanceThresholds thresholds;
            optimizer::SearchSettings search;
            optimizer::SectorAdjusterSettings sector_adjuster;
            bool verbose = false;

            /**
             * @throws std::invalid_argument if any component setting is invalid
             */
            void validate() const;

            static EngineConfig from_config(const data::AllocationConfig &config);
        };

        /**
         * @struct PortfolioAnalysis
         * @brief Result of analyze()
         */
        struct PortfolioAnalysis
        {
            data::Holdings holdings; ///< Normalized, duplicates merged
            analytics::PerformanceMetrics metrics;
            analytics::ValueSeries value_series;
            std::vector<analytics::YearlyReturn> yearly_returns;
            std::vector<analytics::DrawdownPoint> drawdowns;
            analytics::SectorDistribution sector_distribution;
            std::string start_date;
            std::string end_date;
            double period_years = 0.0;
            double risk_free_rate = 0.0; ///< Percent

            std::optional<analytics::ValueSeries> benchmark;
            std::optional<analytics::PerformanceMetrics> benchmark_metrics;

            // Filled when sector rebalancing was requested
            std::optional<analytics::SectorBalanceReport> sector_balance;
            std::optional<data::Holdings> adjusted_holdings;
            std::optional<analytics::PerformanceMetrics> adjusted_metrics;
            std::optional<analytics::SectorBalanceReport> adjusted_sector_balance;
        };

        /**
         * @struct PortfolioSnapshot
         * @brief Metrics and sector state of one holdings set
         */
        struct PortfolioSnapshot
        {
            data::Holdings holdings;
            analytics::PerformanceMetrics metrics;
            analytics::SectorDistribution sector_distribution;
            analytics::SectorBalanceReport sector_balance_report;
        };

        /**
         * @struct OptimizedPortfolio
         * @brief The selected allocation with per-ticker change
         */
        struct OptimizedPortfolio
        {
            std::vector<optimizer::OptimizedHolding> holdings;
            analytics::PerformanceMetrics metrics;
            analytics::SectorDistribution sector_distribution;
            analytics::SectorBalanceReport sector_balance_report;
        };

        /**
         * @struct SearchStatistics
         * @brief Effort spent by the search
         */
        struct SearchStatistics
        {
            int iterations = 0;
            size_t candidates_evaluated = 0;
            size_t holdings_cap = 0;
            std::vector<std::string> must_include;
            size_t universe_size = 0;
            bool timed_out = false;
            bool conservative_cap_met = true;
            std::string stop_reason;
            double elapsed_seconds = 0.0;
        };

        /**
         * @struct OptimizationResult
         * @brief Result of optimize()
         */
        struct OptimizationResult
        {
            PortfolioSnapshot current;
            OptimizedPortfolio optimized;
            std::vector<optimizer::Recommendation> recommendations;
            optimizer::EfficientFrontierResult efficient_frontier;
            bool sector_rebalancing_applied = false;
            std::optional<analytics::SectorBalanceReport> current_sector_balance;
            std::optional<data::Holdings> sector_balanced_portfolio;
            std::string start_date;
            std::string end_date;
            double risk_free_rate = 0.0;
            SearchStatistics statistics;
        };

        void to_json(nlohmann::json &j, const PortfolioAnalysis &a);
        void to_json(nlohmann::json &j, const PortfolioSnapshot &s);
        void to_json(nlohmann::json &j, const OptimizedPortfolio &p);
        void to_json(nlohmann::json &j, const SearchStatistics &s);
        void to_json(nlohmann::json &j, const OptimizationResult &r);

        /**
         * @class PortfolioEngine
         * @brief Entry point for analysis, optimization and sector checks
         *
         * Usage Example:
         * @code
         * auto prices = data::DataLoader::load_csv("data/prices.csv");
         * auto sectors = data::SectorMapping::from_csv("data/sectors.csv");
         * engine::PortfolioEngine engine(prices, sectors, config);
         * auto result = engine.optimize(request);
         * @endcode
         */
        class PortfolioEngine
        {
        public:
            /**
             * @param prices Price history; must outlive the engine
             * @param sectors Sector metadata; must outlive the engine
             * @throws std::invalid_argument if @p config fails validation
             */
            PortfolioEngine(const data::PriceSource &prices,
                            const data::SectorLookup &sectors,
                            const EngineConfig &config = EngineConfig());

            /**
             * @brief Metrics, value series and sector distribution of a holdings set
             * @param holdings Holdings to analyze
             * @param rebalance_sectors Also run the sector adjuster and report its result
             * @throws std::invalid_argument if the holdings are invalid
             * @throws data::MissingInstrumentError if a ticker has no prices
             * @throws data::InsufficientHistoryError if the common history is too short
             */
            PortfolioAnalysis analyze(const data::Holdings &holdings, bool rebalance_sectors = false) const;

            /**
             * @brief Search for an improved allocation
             * @throws std::invalid_argument if the request is invalid
             * @throws data::MissingInstrumentError if a held ticker has no prices
             * @throws data::InsufficientHistoryError if the common history is too short
             */
            OptimizationResult optimize(const optimizer::OptimizationRequest &request) const;

            /**
             * @brief Sector-balance report of a holdings set (no price data needed)
             */
            analytics::SectorBalanceReport check_sector_balance(const data::Holdings &holdings) const;

            /**
             * @brief Tickers eligible for optimization over @p range
             *
             * Every held ticker plus every mapped ticker whose history covers
             * the whole range. The benchmark and risk-free tickers are excluded
             * unless held.
             */
            std::vector<std::string> optimization_universe(const data::Holdings &holdings,
                                                           const data::DateRange &range) const;

            /**
             * @brief Mean risk-free quote over @p range, or the configured fallback
             */
            double risk_free_rate(const data::DateRange &range) const;

            const EngineConfig &config() const { return config_; }

        private:
            analytics::MetricsEngine metrics_engine(double risk_free_rate) const;

            static data::Holdings prepare(const data::Holdings &holdings);

            const data::PriceSource &prices_;
            const data::SectorLookup &sectors_;
            EngineConfig config_;
            analytics::SectorBalanceEvaluator evaluator_;
            optimizer::SectorAdjuster adjuster_;
        };

    } // namespace engine
} // namespace allocation

#endif // ALLOCATION_ENGINE_PORTFOLIO_ENGINE_HPP

/**
 * @file portfolio_engine.cpp
 * @brief Implementation of the PortfolioEngine facade
 */

#include "engine/portfolio_engine.hpp"
#include "data/market_data.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace engine
    {

        // ============================================================================
        // EngineConfig Implementation
        // ============================================================================

        void EngineConfig::validate() const
        {
            if (min_history_years < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'min_history_years', got: " + std::to_string(min_history_years));
            }
            metrics.validate();
            search.validate();
            sector_adjuster.validate();
        }

        EngineConfig EngineConfig::from_config(const data::AllocationConfig &config)
        {
            EngineConfig engine_config;
            engine_config.benchmark = config.data.benchmark;
            engine_config.risk_free = config.data.risk_free;
            engine_config.min_history_years = config.data.min_history_years;
            engine_config.metrics = config.analytics;
            engine_config.search = config.search;
            engine_config.sector_adjuster = config.sector_adjuster;
            engine_config.verbose = config.verbose;
            engine_config.search.verbose = config.search.verbose || config.verbose;
            return engine_config;
        }

        // ============================================================================
        // JSON serialization
        // ============================================================================

        void to_json(nlohmann::json &j, const PortfolioAnalysis &a)
        {
            j = nlohmann::json{
                {"holdings", a.holdings},
                {"metrics", a.metrics},
                {"value_series", a.value_series},
                {"yearly_returns", a.yearly_returns},
                {"drawdowns", a.drawdowns},
                {"sector_distribution", a.sector_distribution},
                {"start_date", a.start_date},
                {"end_date", a.end_date},
                {"period_years", a.period_years},
                {"risk_free_rate", a.risk_free_rate}};
            if (a.benchmark)
                j["benchmark"] = *a.benchmark;
            if (a.benchmark_metrics)
                j["benchmark_metrics"] = *a.benchmark_metrics;
            if (a.sector_balance)
                j["sector_balance"] = *a.sector_balance;
            if (a.adjusted_holdings)
                j["adjusted_holdings"] = *a.adjusted_holdings;
            if (a.adjusted_metrics)
                j["adjusted_metrics"] = *a.adjusted_metrics;
            if (a.adjusted_sector_balance)
                j["adjusted_sector_balance"] = *a.adjusted_sector_balance;
        }

        void to_json(nlohmann::json &j, const PortfolioSnapshot &s)
        {
            j = nlohmann::json{
                {"holdings", s.holdings},
                {"metrics", s.metrics},
                {"sector_distribution", s.sector_distribution},
                {"sector_balance_report", s.sector_balance_report}};
        }

        void to_json(nlohmann::json &j, const OptimizedPortfolio &p)
        {
            j = nlohmann::json{
                {"holdings", p.holdings},
                {"metrics", p.metrics},
                {"sector_distribution", p.sector_distribution},
                {"sector_balance_report", p.sector_balance_report}};
        }

        void to_json(nlohmann::json &j, const SearchStatistics &s)
        {
            j = nlohmann::json{
                {"iterations", s.iterations},
                {"candidates_evaluated", s.candidates_evaluated},
                {"holdings_cap", s.holdings_cap},
                {"must_include", s.must_include},
                {"universe_size", s.universe_size},
                {"timed_out", s.timed_out},
                {"conservative_cap_met", s.conservative_cap_met},
                {"stop_reason", s.stop_reason},
                {"elapsed_seconds", s.elapsed_seconds}};
        }

        void to_json(nlohmann::json &j, const OptimizationResult &r)
        {
            j = nlohmann::json{
                {"current", r.current},
                {"optimized", r.optimized},
                {"recommendations", r.recommendations},
                {"efficient_frontier", r.efficient_frontier.points},
                {"sector_rebalancing_applied", r.sector_rebalancing_applied},
                {"start_date", r.start_date},
                {"end_date", r.end_date},
                {"risk_free_rate", r.risk_free_rate},
                {"statistics", r.statistics}};
            if (r.current_sector_balance)
                j["current_sector_balance"] = *r.current_sector_balance;
            if (r.sector_balanced_portfolio)
                j["sector_balanced_portfolio"] = *r.sector_balanced_portfolio;
        }

        // ============================================================================
        // PortfolioEngine Implementation
        // ============================================================================

        PortfolioEngine::PortfolioEngine(const data::PriceSource &prices,
                                         const data::SectorLookup &sectors,
                                         const EngineConfig &config)
            : prices_(prices),
              sectors_(sectors),
              config_(config),
              evaluator_(sectors, config.thresholds),
              adjuster_(evaluator_, config.sector_adjuster)
        {
            config_.validate();
        }

        data::Holdings PortfolioEngine::prepare(const data::Holdings &holdings)
        {
            optimizer::OptimizationRequest request;
            request.holdings = holdings;
            request.validate();
            return data::normalize(data::merge_duplicates(holdings));
        }

        analytics::MetricsEngine PortfolioEngine::metrics_engine(double risk_free_rate) const
        {
            analytics::MetricsSettings settings = config_.metrics;
            settings.risk_free_rate = risk_free_rate;
            return analytics::MetricsEngine(settings);
        }

        double PortfolioEngine::risk_free_rate(const data::DateRange &range) const
        {
            if (config_.risk_free.empty() || !prices_.has_ticker(config_.risk_free))
            {
                return config_.metrics.risk_free_rate;
            }
            data::PriceSeries quotes;
            for (const auto &point : prices_.get_series(config_.risk_free))
            {
                if (point.date >= range.start_date && point.date <= range.end_date)
                {
                    quotes.push_back(point);
                }
            }
            return analytics::MetricsEngine::risk_free_rate_from(quotes, config_.metrics.risk_free_rate);
        }

        std::vector<std::string> PortfolioEngine::optimization_universe(const data::Holdings &holdings,
                                                                        const data::DateRange &range) const
        {
            std::vector<std::string> universe;
            std::set<std::string> seen;
            for (const auto &h : holdings)
            {
                if (seen.insert(h.ticker).second)
                {
                    universe.push_back(h.ticker);
                }
            }

            for (const auto &ticker : sectors_.all_tickers())
            {
                if (seen.count(ticker) || ticker == config_.benchmark || ticker == config_.risk_free)
                {
                    continue;
                }
                if (!prices_.has_ticker(ticker))
                {
                    continue;
                }
                data::PriceSeries series = prices_.get_series(ticker);
                if (series.empty() || series.front().date > range.start_date || series.back().date < range.end_date)
                {
                    continue;
                }
                seen.insert(ticker);
                universe.push_back(ticker);
            }
            return universe;
        }

        PortfolioAnalysis PortfolioEngine::analyze(const data::Holdings &holdings, bool rebalance_sectors) const
        {
            PortfolioAnalysis analysis;
            analysis.holdings = prepare(holdings);
            const std::vector<std::string> tickers = data::tickers_of(analysis.holdings);

            const data::DateRange range = data::common_date_range(prices_, tickers, config_.min_history_years);
            analysis.start_date = range.start_date;
            analysis.end_date = range.end_date;
            analysis.risk_free_rate = risk_free_rate(range);

            const bool has_benchmark = !config_.benchmark.empty() && prices_.has_ticker(config_.benchmark);
            std::vector<std::string> aligned = tickers;
            if (has_benchmark && std::find(aligned.begin(), aligned.end(), config_.benchmark) == aligned.end())
            {
                aligned.push_back(config_.benchmark);
            }
            const data::MarketData block = data::align_prices(prices_, aligned, range);
            const analytics::MetricsEngine engine = metrics_engine(analysis.risk_free_rate);

            analysis.value_series = engine.portfolio_values(block, analysis.holdings);
            analytics::ValueSeries benchmark_values;
            if (has_benchmark)
            {
                benchmark_values = engine.portfolio_values(block, {{config_.benchmark, 100.0}});
                analysis.benchmark = benchmark_values;
                analysis.benchmark_metrics = engine.compute(benchmark_values);
            }

            analysis.metrics = engine.compute(analysis.value_series, benchmark_values);
            analysis.yearly_returns = engine.yearly_returns(analysis.value_series);
            analysis.drawdowns = engine.drawdowns(analysis.value_series);
            analysis.period_years = engine.period_years(analysis.value_series);
            analysis.sector_distribution = evaluator_.sector_distribution(analysis.holdings);

            if (config_.verbose)
                std::cerr << "  [engine] analyze: " << tickers.size() << " holding(s), "
                          << range.start_date << " to " << range.end_date
                          << ", risk-free " << std::fixed << std::setprecision(2) << analysis.risk_free_rate << "%\n";

            if (rebalance_sectors)
            {
                analytics::SectorBalanceReport report = evaluator_.check(analysis.holdings);
                analysis.sector_balance = report;

                optimizer::AdjustmentResult adjusted =
                    adjuster_.adjust(analysis.holdings, optimization_universe(analysis.holdings, range));
                analysis.adjusted_holdings = adjusted.holdings;
                analysis.adjusted_sector_balance = adjusted.report;

                std::vector<std::string> adjusted_tickers = data::tickers_of(adjusted.holdings);
                if (has_benchmark &&
                    std::find(adjusted_tickers.begin(), adjusted_tickers.end(), config_.benchmark) == adjusted_tickers.end())
                {
                    adjusted_tickers.push_back(config_.benchmark);
                }
                const data::MarketData adjusted_block = data::align_prices(prices_, adjusted_tickers, range);
                analytics::ValueSeries adjusted_benchmark;
                if (has_benchmark)
                {
                    adjusted_benchmark = engine.portfolio_values(adjusted_block, {{config_.benchmark, 100.0}});
                }
                analysis.adjusted_metrics =
                    engine.compute(engine.portfolio_values(adjusted_block, adjusted.holdings), adjusted_benchmark);

                if (config_.verbose)
                    std::cerr << "  [engine] sector adjustment: score " << report.overall_score << " -> "
                              << adjusted.report.overall_score << " after " << adjusted.iterations << " pass(es)\n";
            }

            return analysis;
        }

        OptimizationResult PortfolioEngine::optimize(const optimizer::OptimizationRequest &request) const
        {
            request.validate();
            const auto started = std::chrono::steady_clock::now();

            const data::Holdings baseline = prepare(request.holdings);
            const data::DateRange range =
                data::common_date_range(prices_, data::tickers_of(baseline), config_.min_history_years);
            const double rf = risk_free_rate(range);
            const analytics::MetricsEngine engine = metrics_engine(rf);

            const std::vector<std::string> universe = optimization_universe(baseline, range);
            const data::MarketData search_block = data::align_prices(prices_, universe, range);

            if (config_.verbose)
                std::cerr << "  [engine] optimize: universe " << universe.size() << " ticker(s), "
                          << range.start_date << " to " << range.end_date
                          << ", risk-free " << std::fixed << std::setprecision(2) << rf << "%\n";

            optimizer::OptimizationRequest normalized = request;
            normalized.holdings = baseline;

            std::mt19937_64 rng(config_.search.seed);
            optimizer::SearchEngine search(engine, evaluator_, config_.search, config_.sector_adjuster);
            optimizer::SearchOutcome outcome = search.optimize(normalized, search_block, rng);

            // Benchmark-relative metrics for the two reported portfolios
            const bool has_benchmark = !config_.benchmark.empty() && prices_.has_ticker(config_.benchmark);
            const auto full_metrics = [&](const data::Holdings &holdings)
            {
                std::vector<std::string> tickers = data::tickers_of(holdings);
                if (has_benchmark && std::find(tickers.begin(), tickers.end(), config_.benchmark) == tickers.end())
                {
                    tickers.push_back(config_.benchmark);
                }
                const data::MarketData block = data::align_prices(prices_, tickers, range);
                analytics::ValueSeries benchmark_values;
                if (has_benchmark)
                {
                    benchmark_values = engine.portfolio_values(block, {{config_.benchmark, 100.0}});
                }
                return engine.compute(engine.portfolio_values(block, holdings), benchmark_values);
            };

            OptimizationResult result;
            result.start_date = range.start_date;
            result.end_date = range.end_date;
            result.risk_free_rate = rf;

            result.current.holdings = baseline;
            result.current.metrics = full_metrics(baseline);
            result.current.sector_distribution = evaluator_.sector_distribution(baseline);
            result.current.sector_balance_report = evaluator_.check(baseline);

            result.optimized.holdings = outcome.holdings;
            result.optimized.metrics = full_metrics(outcome.selected.holdings);
            result.optimized.sector_distribution = evaluator_.sector_distribution(outcome.selected.holdings);
            result.optimized.sector_balance_report = outcome.selected_report;

            result.recommendations =
                optimizer::make_recommendations(outcome.reference, outcome.selected.holdings, request.risk_tolerance);

            optimizer::FrontierBuilder frontier(config_.search.frontier_points);
            result.efficient_frontier = frontier.build(outcome.pool, outcome.baseline_metrics,
                                                       outcome.selected.metrics, outcome.sector_balanced_metrics);

            result.sector_rebalancing_applied = outcome.sector_rebalancing_applied;
            result.current_sector_balance = outcome.current_sector_balance;
            result.sector_balanced_portfolio = outcome.sector_balanced;

            result.statistics.iterations = outcome.iterations;
            result.statistics.candidates_evaluated = outcome.pool.size();
            result.statistics.holdings_cap = outcome.holdings_cap;
            result.statistics.must_include = outcome.must_include;
            result.statistics.universe_size = universe.size();
            result.statistics.timed_out = outcome.timed_out;
            result.statistics.conservative_cap_met = outcome.conservative_cap_met;
            result.statistics.stop_reason = outcome.stop_reason;
            result.statistics.elapsed_seconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

            return result;
        }

        analytics::SectorBalanceReport PortfolioEngine::check_sector_balance(const data::Holdings &holdings) const
        {
            return evaluator_.check(data::merge_duplicates(holdings));
        }

    } // namespace engine
} // namespace allocation

/**
 * @file search_engine.cpp
 * @brief Implementation of SearchEngine
 */

#include "optimizer/search_engine.hpp"
#include "data/market_data.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {

            void append_unique(std::vector<std::string> &tickers, std::set<std::string> &seen,
                               const std::vector<std::string> &more)
            {
                for (const auto &ticker : more)
                {
                    if (seen.insert(ticker).second)
                    {
                        tickers.push_back(ticker);
                    }
                }
            }

            double max_allocation(const data::Holdings &holdings)
            {
                double largest = 0.0;
                for (const auto &h : holdings)
                {
                    largest = std::max(largest, h.allocation);
                }
                return largest;
            }

        } // anonymous namespace

        // ============================================================================
        // SearchSettings Implementation
        // ============================================================================

        void SearchSettings::validate() const
        {
            if (max_retries < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'max_retries', got: " + std::to_string(max_retries));
            }
            if (time_budget_seconds <= 0.0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'time_budget_seconds', got: " + std::to_string(time_budget_seconds));
            }
            if (local_batch_size < 0 || global_batch_size < 0 || local_batch_size + global_batch_size == 0)
            {
                throw std::invalid_argument(
                    "Batch sizes must be non-negative and not both zero, got: local=" +
                    std::to_string(local_batch_size) + ", global=" + std::to_string(global_batch_size));
            }
            if (mutation_rate <= 0.0 || mutation_rate > 1.0)
            {
                throw std::invalid_argument(
                    "mutation_rate must be in (0, 1], got: " + std::to_string(mutation_rate));
            }
            if (rebalancing_strength < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'rebalancing_strength', got: " + std::to_string(rebalancing_strength));
            }
            if (frontier_points < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'frontier_points', got: " + std::to_string(frontier_points));
            }
            if (target_stop_tolerance < 0.0 || target_select_tolerance < 0.0)
            {
                throw std::invalid_argument("Target return tolerances must be non-negative");
            }
            if (top_score_fraction <= 0.0 || top_score_fraction > 1.0)
            {
                throw std::invalid_argument(
                    "top_score_fraction must be in (0, 1], got: " + std::to_string(top_score_fraction));
            }
            if (fallback_pool_size < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'fallback_pool_size', got: " + std::to_string(fallback_pool_size));
            }
            if (conservative_cap <= 0.0 || conservative_cap > 100.0)
            {
                throw std::invalid_argument(
                    "conservative_cap must be in (0, 100], got: " + std::to_string(conservative_cap));
            }
            if (min_allocation < 0.0 || min_allocation >= 100.0)
            {
                throw std::invalid_argument(
                    "min_allocation must be in [0, 100), got: " + std::to_string(min_allocation));
            }
        }

        SearchSettings SearchSettings::from_json(const nlohmann::json &j)
        {
            SearchSettings s;
            s.max_retries = j.value("max_retries", s.max_retries);
            s.time_budget_seconds = j.value("time_budget_seconds", s.time_budget_seconds);
            s.local_batch_size = j.value("local_batch_size", s.local_batch_size);
            s.global_batch_size = j.value("global_batch_size", s.global_batch_size);
            s.mutation_rate = j.value("mutation_rate", s.mutation_rate);
            s.rebalancing_strength = j.value("rebalancing_strength", s.rebalancing_strength);
            s.seed = j.value("seed", s.seed);
            s.frontier_points = j.value("frontier_points", s.frontier_points);
            s.must_include_sharpe = j.value("must_include_sharpe", s.must_include_sharpe);
            s.stop_sharpe_multiplier = j.value("stop_sharpe_multiplier", s.stop_sharpe_multiplier);
            s.viable_sharpe_multiplier = j.value("viable_sharpe_multiplier", s.viable_sharpe_multiplier);
            s.target_stop_tolerance = j.value("target_stop_tolerance", s.target_stop_tolerance);
            s.target_select_tolerance = j.value("target_select_tolerance", s.target_select_tolerance);
            s.top_score_fraction = j.value("top_score_fraction", s.top_score_fraction);
            s.fallback_pool_size = j.value("fallback_pool_size", s.fallback_pool_size);
            s.conservative_cap = j.value("conservative_cap", s.conservative_cap);
            s.min_allocation = j.value("min_allocation", s.min_allocation);
            s.verbose = j.value("verbose", s.verbose);
            s.validate();
            return s;
        }

        nlohmann::json SearchSettings::to_json() const
        {
            return {
                {"max_retries", max_retries},
                {"time_budget_seconds", time_budget_seconds},
                {"local_batch_size", local_batch_size},
                {"global_batch_size", global_batch_size},
                {"mutation_rate", mutation_rate},
                {"rebalancing_strength", rebalancing_strength},
                {"seed", seed},
                {"frontier_points", frontier_points},
                {"must_include_sharpe", must_include_sharpe},
                {"stop_sharpe_multiplier", stop_sharpe_multiplier},
                {"viable_sharpe_multiplier", viable_sharpe_multiplier},
                {"target_stop_tolerance", target_stop_tolerance},
                {"target_select_tolerance", target_select_tolerance},
                {"top_score_fraction", top_score_fraction},
                {"fallback_pool_size", fallback_pool_size},
                {"conservative_cap", conservative_cap},
                {"min_allocation", min_allocation}};
        }

        std::string to_string(SearchState state)
        {
            switch (state)
            {
            case SearchState::INIT:
                return "INIT";
            case SearchState::BATCH_LOCAL:
                return "BATCH_LOCAL";
            case SearchState::BATCH_GLOBAL:
                return "BATCH_GLOBAL";
            case SearchState::CHECK_STOP:
                return "CHECK_STOP";
            case SearchState::SELECT:
                return "SELECT";
            case SearchState::DONE:
                return "DONE";
            }
            return "UNKNOWN";
        }

        // ============================================================================
        // SearchEngine Implementation
        // ============================================================================

        SearchEngine::SearchEngine(const analytics::MetricsEngine &metrics,
                                   const analytics::SectorBalanceEvaluator &evaluator,
                                   const SearchSettings &settings,
                                   const SectorAdjusterSettings &adjuster_settings)
            : metrics_(metrics),
              evaluator_(evaluator),
              settings_(settings),
              generator_(evaluator.lookup(), settings.min_allocation),
              adjuster_(evaluator, adjuster_settings)
        {
            settings_.validate();
        }

        nlohmann::json SearchEngine::get_parameters() const
        {
            nlohmann::json params = settings_.to_json();
            params["sector_adjuster"] = {
                {"max_iterations", adjuster_.settings().max_iterations},
                {"min_allocation", adjuster_.settings().min_allocation},
                {"new_tickers_per_sector", adjuster_.settings().new_tickers_per_sector}};
            return params;
        }

        Candidate SearchEngine::evaluate(const data::Holdings &holdings, const data::MarketData &prices) const
        {
            Candidate candidate;
            candidate.holdings = holdings;
            candidate.metrics = metrics_.compute(metrics_.portfolio_values(prices, holdings));
            candidate.sector_score = evaluator_.check(holdings).overall_score;
            return candidate;
        }

        size_t SearchEngine::holdings_cap(size_t baseline_count, size_t universe_size)
        {
            size_t cap = std::min<size_t>(std::max<size_t>(2 * baseline_count, 15), 50);
            return std::max<size_t>(1, std::min(cap, universe_size));
        }

        std::vector<std::string> SearchEngine::must_include(const data::Holdings &holdings,
                                                            const data::MarketData &prices,
                                                            size_t cap) const
        {
            std::vector<std::pair<std::string, double>> sharpe;
            for (const auto &ticker : data::tickers_of(data::merge_duplicates(holdings)))
            {
                data::Holdings single{{ticker, 100.0}};
                sharpe.emplace_back(ticker, metrics_.compute(metrics_.portfolio_values(prices, single)).sharpe_ratio);
            }
            if (sharpe.empty())
            {
                return {};
            }

            std::stable_sort(sharpe.begin(), sharpe.end(),
                             [](const auto &a, const auto &b)
                             { return a.second > b.second; });

            std::vector<std::string> kept;
            for (const auto &[ticker, ratio] : sharpe)
            {
                if (ratio > settings_.must_include_sharpe && kept.size() < cap)
                {
                    kept.push_back(ticker);
                }
            }
            if (kept.empty())
            {
                // Nothing qualifies: keep the best performer so the search space is never empty
                kept.push_back(sharpe.front().first);
            }
            return kept;
        }

        // ============================================================================
        // Search loop
        // ============================================================================

        SearchOutcome SearchEngine::optimize(const OptimizationRequest &request,
                                             const data::MarketData &prices,
                                             std::mt19937_64 &rng) const
        {
            request.validate();

            SearchState state = SearchState::INIT;
            const auto started = std::chrono::steady_clock::now();
            const auto elapsed = [&started]()
            {
                return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            };

            // ------------------------------------------------------------
            // INIT
            // ------------------------------------------------------------

            const std::vector<std::string> universe = prices.get_tickers();
            const data::Holdings baseline = data::normalize(data::merge_duplicates(request.holdings));

            std::vector<std::string> missing;
            for (const auto &h : baseline)
            {
                if (!prices.has_ticker(h.ticker))
                {
                    missing.push_back(h.ticker);
                }
            }
            if (!missing.empty())
            {
                throw data::MissingInstrumentError(missing);
            }

            SearchOutcome outcome;
            outcome.baseline_metrics = metrics_.compute(metrics_.portfolio_values(prices, baseline));
            outcome.reference = baseline;
            data::Holdings seed = baseline;

            if (request.rebalance_sectors)
            {
                analytics::SectorBalanceReport current = evaluator_.check(baseline);
                outcome.current_sector_balance = current;
                if (!current.compliant())
                {
                    outcome.target_adjustments = evaluator_.target_adjustments(current, baseline);
                    AdjustmentResult balanced = adjuster_.adjust(baseline, universe);
                    seed = balanced.holdings;
                    outcome.reference = seed;
                    outcome.sector_balanced = seed;
                    outcome.sector_balanced_metrics = metrics_.compute(metrics_.portfolio_values(prices, seed));
                    outcome.sector_rebalancing_applied = true;

                    if (settings_.verbose)
                        std::cerr << "  [search] sector adjuster: " << balanced.iterations << " pass(es), score "
                                  << current.overall_score << " -> " << balanced.report.overall_score
                                  << (balanced.converged ? "" : " (not converged)") << "\n";
                }
            }

            const bool rebalancing = outcome.sector_rebalancing_applied;
            const size_t cap = holdings_cap(baseline.size(), universe.size());
            outcome.holdings_cap = cap;

            data::Holdings must_source = seed;
            must_source.insert(must_source.end(), baseline.begin(), baseline.end());
            const std::vector<std::string> must = must_include(must_source, prices, cap);
            outcome.must_include = must;

            // Local universe: seed and baseline tickers plus the pool of sectors that need weight
            std::vector<std::string> local_universe;
            std::set<std::string> seen;
            append_unique(local_universe, seen, data::tickers_of(seed));
            append_unique(local_universe, seen, data::tickers_of(baseline));
            for (const auto &[sector, adjustment] : outcome.target_adjustments)
            {
                if (adjustment.delta <= 0.0)
                {
                    continue;
                }
                std::vector<std::string> priced;
                for (const auto &ticker : evaluator_.lookup().tickers_by_sector(sector))
                {
                    if (prices.has_ticker(ticker))
                    {
                        priced.push_back(ticker);
                    }
                }
                append_unique(local_universe, seen, priced);
            }

            if (settings_.verbose)
                std::cerr << "  [search] baseline Sharpe " << std::fixed << std::setprecision(3)
                          << outcome.baseline_metrics.sharpe_ratio << ", cap " << cap
                          << ", must-include " << must.size() << ", universe " << universe.size()
                          << " (local " << local_universe.size() << ")\n";

            std::vector<Candidate> &pool = outcome.pool;
            std::uniform_real_distribution<double> coin(0.0, 1.0);
            const size_t min_size = request.risk_tolerance == RiskTolerance::CONSERVATIVE ? 4 : 2;

            const auto add = [&](data::Holdings holdings)
            {
                holdings = CandidateGenerator::limit_holdings(holdings, cap, must);
                if (request.risk_tolerance == RiskTolerance::CONSERVATIVE && holdings.size() < min_size)
                {
                    holdings = top_up(holdings, min_size, universe, rng);
                }
                holdings = CandidateGenerator::apply_risk_tolerance(holdings, request.risk_tolerance,
                                                                   settings_.conservative_cap);
                if (holdings.empty())
                {
                    return;
                }
                if (request.risk_tolerance == RiskTolerance::CONSERVATIVE &&
                    max_allocation(holdings) > settings_.conservative_cap + 1e-6)
                {
                    return;
                }
                pool.push_back(evaluate(holdings, prices));
            };

            const auto best_so_far = [&]() -> const data::Holdings &
            {
                if (pool.empty())
                {
                    return seed;
                }
                size_t best = 0;
                for (size_t i = 1; i < pool.size(); ++i)
                {
                    if (better(pool[i], pool[best], request, rebalancing))
                    {
                        best = i;
                    }
                }
                return pool[best].holdings;
            };

            // ------------------------------------------------------------
            // BATCH_LOCAL <-> BATCH_GLOBAL -> CHECK_STOP
            // ------------------------------------------------------------

            for (int iteration = 1; iteration <= settings_.max_retries; ++iteration)
            {
                const size_t iteration_start = pool.size();
                outcome.iterations = iteration;

                if (elapsed() > settings_.time_budget_seconds)
                {
                    outcome.timed_out = true;
                    break;
                }
                transition(state, SearchState::BATCH_LOCAL, iteration);
                const data::Holdings best = best_so_far();
                for (int i = 0; i < settings_.local_batch_size; ++i)
                {
                    const data::Holdings &parent = coin(rng) < 0.5 ? seed : best;
                    data::Holdings child = coin(rng) < 0.5
                                               ? generator_.mutate_weights(parent, settings_.mutation_rate, rng)
                                               : generator_.swap_holding(parent, local_universe, must, rng);
                    if (rebalancing)
                    {
                        child = adjuster_.adjust(child, universe).holdings;
                    }
                    add(std::move(child));
                }

                if (elapsed() > settings_.time_budget_seconds)
                {
                    outcome.timed_out = true;
                    break;
                }
                transition(state, SearchState::BATCH_GLOBAL, iteration);
                const size_t lower = std::min(min_size, cap);
                std::uniform_int_distribution<size_t> size_dist(lower, cap);
                for (int i = 0; i < settings_.global_batch_size; ++i)
                {
                    const size_t target_size = size_dist(rng);
                    data::Holdings sampled =
                        outcome.target_adjustments.empty()
                            ? generator_.unbiased(universe, target_size, must, rng)
                            : generator_.sector_biased(universe, target_size, must, outcome.target_adjustments,
                                                       settings_.rebalancing_strength, rng);
                    add(std::move(sampled));
                }

                transition(state, SearchState::CHECK_STOP, iteration);
                if (settings_.verbose)
                    std::cerr << "  [search] iteration " << iteration << ": pool " << pool.size()
                              << " (+" << pool.size() - iteration_start << "), elapsed "
                              << std::fixed << std::setprecision(2) << elapsed() << "s\n";

                std::string reason;
                if (stop_reached(pool, iteration_start, outcome.baseline_metrics, request, rebalancing, reason))
                {
                    outcome.stop_reason = reason;
                    break;
                }
            }

            if (outcome.stop_reason.empty())
            {
                outcome.stop_reason = outcome.timed_out ? "time budget exhausted" : "retry limit reached";
            }

            // ------------------------------------------------------------
            // SELECT
            // ------------------------------------------------------------

            transition(state, SearchState::SELECT, outcome.iterations);
            if (pool.empty())
            {
                pool.push_back(evaluate(CandidateGenerator::apply_risk_tolerance(seed, request.risk_tolerance,
                                                                                 settings_.conservative_cap),
                                        prices));
            }
            const size_t chosen = select(pool, outcome.baseline_metrics, request);
            outcome.selected = pool[chosen];
            if (request.risk_tolerance == RiskTolerance::CONSERVATIVE &&
                max_allocation(outcome.selected.holdings) > settings_.conservative_cap + 1e-6)
            {
                // Too few tickers to spread the weight under the cap
                outcome.conservative_cap_met = false;
                outcome.stop_reason += "; conservative cap not met";
            }
            outcome.selected_report = evaluator_.check(outcome.selected.holdings);
            outcome.holdings = diff_holdings(outcome.reference, outcome.selected.holdings);

            transition(state, SearchState::DONE, outcome.iterations);
            if (settings_.verbose)
                std::cerr << "  [search] stop: " << outcome.stop_reason << "; selected candidate " << chosen
                          << " of " << pool.size() << " (Sharpe " << std::fixed << std::setprecision(3)
                          << outcome.selected.metrics.sharpe_ratio << ", score " << outcome.selected.sector_score
                          << ")\n";

            return outcome;
        }

        // ============================================================================
        // Stop rules and selection
        // ============================================================================

        bool SearchEngine::stop_reached(const std::vector<Candidate> &pool, size_t from,
                                        const analytics::PerformanceMetrics &baseline,
                                        const OptimizationRequest &request, bool rebalancing,
                                        std::string &reason) const
        {
            for (size_t i = from; i < pool.size(); ++i)
            {
                const Candidate &c = pool[i];
                if (request.target_return)
                {
                    if (std::abs(c.metrics.annualized_return - *request.target_return) <= settings_.target_stop_tolerance)
                    {
                        reason = "target return reached";
                        return true;
                    }
                }
                else if (rebalancing)
                {
                    if (c.sector_score == 100)
                    {
                        reason = "sector score 100 reached";
                        return true;
                    }
                }
                else if (c.metrics.sharpe_ratio > settings_.stop_sharpe_multiplier * baseline.sharpe_ratio)
                {
                    reason = "Sharpe improvement reached";
                    return true;
                }
            }
            return false;
        }

        bool SearchEngine::better(const Candidate &a, const Candidate &b, const OptimizationRequest &request,
                                  bool rebalancing) const
        {
            if (request.target_return)
            {
                return std::abs(a.metrics.annualized_return - *request.target_return) <
                       std::abs(b.metrics.annualized_return - *request.target_return);
            }
            if (rebalancing && a.sector_score != b.sector_score)
            {
                return a.sector_score > b.sector_score;
            }
            return a.metrics.sharpe_ratio > b.metrics.sharpe_ratio;
        }

        size_t SearchEngine::select(const std::vector<Candidate> &pool,
                                    const analytics::PerformanceMetrics &baseline,
                                    const OptimizationRequest &request) const
        {
            if (pool.empty())
            {
                throw std::invalid_argument("Cannot select from an empty candidate pool");
            }

            std::vector<size_t> viable;
            const double floor = settings_.viable_sharpe_multiplier * baseline.sharpe_ratio;
            for (size_t i = 0; i < pool.size(); ++i)
            {
                if (pool[i].metrics.sharpe_ratio >= floor)
                {
                    viable.push_back(i);
                }
            }
            if (viable.empty())
            {
                viable.resize(pool.size());
                std::iota(viable.begin(), viable.end(), 0);
                std::stable_sort(viable.begin(), viable.end(),
                                 [&pool](size_t a, size_t b)
                                 { return pool[a].metrics.sharpe_ratio > pool[b].metrics.sharpe_ratio; });
                viable.resize(std::min(viable.size(), static_cast<size_t>(settings_.fallback_pool_size)));
            }

            // Narrow by sector score
            std::vector<size_t> narrowed;
            if (request.rebalance_sectors)
            {
                int best_score = 0;
                for (size_t i : viable)
                {
                    best_score = std::max(best_score, pool[i].sector_score);
                }
                for (size_t i : viable)
                {
                    if (pool[i].sector_score == best_score)
                    {
                        narrowed.push_back(i);
                    }
                }
            }
            else
            {
                narrowed = viable;
                std::stable_sort(narrowed.begin(), narrowed.end(),
                                 [&pool](size_t a, size_t b)
                                 { return pool[a].sector_score > pool[b].sector_score; });
                const size_t keep = std::max<size_t>(
                    1, static_cast<size_t>(std::ceil(settings_.top_score_fraction * static_cast<double>(narrowed.size()))));
                narrowed.resize(std::min(keep, narrowed.size()));
            }

            const auto argbest = [&](auto key)
            {
                size_t best = narrowed.front();
                for (size_t i : narrowed)
                {
                    if (key(pool[i]) < key(pool[best]))
                    {
                        best = i;
                    }
                }
                return best;
            };

            if (request.target_return)
            {
                const double target = *request.target_return;
                std::vector<size_t> near;
                for (size_t i : narrowed)
                {
                    if (std::abs(pool[i].metrics.annualized_return - target) <= settings_.target_select_tolerance)
                    {
                        near.push_back(i);
                    }
                }
                if (!near.empty())
                {
                    narrowed = near;
                    return argbest([](const Candidate &c)
                                   { return c.metrics.volatility; });
                }
                return argbest([target](const Candidate &c)
                               { return std::abs(c.metrics.annualized_return - target); });
            }

            switch (request.risk_tolerance)
            {
            case RiskTolerance::CONSERVATIVE:
                return argbest([](const Candidate &c)
                               { return c.metrics.volatility; });
            case RiskTolerance::AGGRESSIVE:
                return argbest([](const Candidate &c)
                               { return -c.metrics.annualized_return; });
            case RiskTolerance::MODERATE:
            default:
                return argbest([](const Candidate &c)
                               { return -c.metrics.sharpe_ratio; });
            }
        }

        // ============================================================================
        // Helpers
        // ============================================================================

        data::Holdings SearchEngine::top_up(const data::Holdings &holdings, size_t min_size,
                                            const std::vector<std::string> &universe,
                                            std::mt19937_64 &rng) const
        {
            data::Holdings grown(holdings);
            std::set<std::string> held;
            for (const auto &h : holdings)
            {
                held.insert(h.ticker);
            }
            std::vector<std::string> unseen;
            for (const auto &ticker : universe)
            {
                if (!held.count(ticker))
                {
                    unseen.push_back(ticker);
                }
            }
            std::shuffle(unseen.begin(), unseen.end(), rng);

            const double average = holdings.empty()
                                       ? 1.0
                                       : data::total_allocation(holdings) / static_cast<double>(holdings.size());
            for (const auto &ticker : unseen)
            {
                if (grown.size() >= min_size)
                {
                    break;
                }
                grown.push_back({ticker, average});
            }
            return data::normalize(grown);
        }

        void SearchEngine::transition(SearchState &state, SearchState next, int iteration) const
        {
            if (settings_.verbose)
                std::cerr << "  [search] " << to_string(state) << " -> " << to_string(next)
                          << " (iteration " << iteration << ")\n";
            state = next;
        }

    } // namespace optimizer
} // namespace allocation

/**
 * @file performance_metrics.cpp
 * @brief Implementation of the MetricsEngine.
 *
 * Volatility uses the sample (n-1) standard deviation of daily returns.
 * Benchmark-relative statistics are delegated to BenchmarkAnalysis.
 */

#include "analytics/performance_metrics.hpp"
#include "analytics/benchmark_analysis.hpp"
#include "data/market_data.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace allocation
{
    namespace analytics
    {

        namespace
        {

            double finite_or_zero(double value)
            {
                return std::isfinite(value) ? value : 0.0;
            }

            double mean(const std::vector<double> &values)
            {
                if (values.empty())
                {
                    return 0.0;
                }
                return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
            }

            double sample_stdev(const std::vector<double> &values)
            {
                if (values.size() < 2)
                {
                    return 0.0;
                }
                double m = mean(values);
                double sum_sq = 0.0;
                for (double v : values)
                {
                    sum_sq += (v - m) * (v - m);
                }
                return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
            }

            int year_of(const std::string &date)
            {
                if (date.size() < 4)
                {
                    throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + date + "'");
                }
                return std::stoi(date.substr(0, 4));
            }

            /**
             * @brief Replace every non-finite field with 0.
             */
            void sanitize(PerformanceMetrics &m)
            {
                for (double *field : {&m.total_return, &m.annualized_return, &m.volatility,
                                      &m.sharpe_ratio, &m.sortino_ratio, &m.downside_deviation,
                                      &m.max_drawdown, &m.best_year, &m.worst_year, &m.beta,
                                      &m.alpha, &m.information_ratio, &m.tracking_error,
                                      &m.r_squared})
                {
                    *field = finite_or_zero(*field);
                }
            }

        } // anonymous namespace

        // ===================================================================
        // PerformanceMetrics
        // ===================================================================

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);

            oss << "Return Metrics:\n";
            oss << "  Total Return:        " << total_return << "%\n";
            oss << "  Annualized Return:   " << annualized_return << "%\n";
            oss << "  Best Year:           " << best_year << "%\n";
            oss << "  Worst Year:          " << worst_year << "%\n";
            oss << "  Positive/Negative:   " << positive_years << " / " << negative_years << "\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Volatility:          " << volatility << "%\n";
            oss << "  Downside Deviation:  " << std::setprecision(4) << downside_deviation << "\n";
            oss << "  Max Drawdown:        " << std::setprecision(2) << max_drawdown << "%\n";
            oss << "\n";

            oss << "Risk-Adjusted Metrics:\n";
            oss << std::setprecision(4);
            oss << "  Sharpe Ratio:        " << sharpe_ratio << "\n";
            oss << "  Sortino Ratio:       " << sortino_ratio << "\n";
            oss << "\n";

            oss << "Benchmark Metrics:\n";
            oss << "  Beta:                " << beta << "\n";
            oss << "  Alpha:               " << alpha << "%\n";
            oss << "  R-squared:           " << r_squared << "\n";
            oss << "  Tracking Error:      " << tracking_error << "%\n";
            oss << "  Information Ratio:   " << information_ratio << "\n";

            return oss.str();
        }

        void to_json(nlohmann::json &j, const PerformanceMetrics &m)
        {
            j = nlohmann::json{
                {"total_return", m.total_return},
                {"annualized_return", m.annualized_return},
                {"volatility", m.volatility},
                {"sharpe_ratio", m.sharpe_ratio},
                {"sortino_ratio", m.sortino_ratio},
                {"downside_deviation", m.downside_deviation},
                {"max_drawdown", m.max_drawdown},
                {"best_year", m.best_year},
                {"worst_year", m.worst_year},
                {"positive_years", m.positive_years},
                {"negative_years", m.negative_years},
                {"beta", m.beta},
                {"alpha", m.alpha},
                {"information_ratio", m.information_ratio},
                {"tracking_error", m.tracking_error},
                {"r_squared", m.r_squared}};
        }

        void to_json(nlohmann::json &j, const ValuePoint &p)
        {
            j = nlohmann::json{{"date", p.date}, {"value", p.value}};
        }

        void to_json(nlohmann::json &j, const YearlyReturn &r)
        {
            j = nlohmann::json{{"year", r.year}, {"return", r.return_pct}};
        }

        void to_json(nlohmann::json &j, const DrawdownPoint &d)
        {
            j = nlohmann::json{{"date", d.date}, {"drawdown", d.drawdown}};
        }

        void MetricsSettings::validate() const
        {
            if (!(initial_capital > 0.0))
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'initial_capital', got: " + std::to_string(initial_capital));
            }
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("Expected finite value for parameter 'risk_free_rate'");
            }
        }

        MetricsSettings MetricsSettings::from_json(const nlohmann::json &j)
        {
            MetricsSettings settings;
            settings.initial_capital = j.value("initial_capital", settings.initial_capital);
            settings.risk_free_rate = j.value("risk_free_rate", settings.risk_free_rate);
            settings.trading_days_per_year = j.value("trading_days_per_year", settings.trading_days_per_year);
            settings.validate();
            return settings;
        }

        // ===================================================================
        // MetricsEngine
        // ===================================================================

        MetricsEngine::MetricsEngine(const MetricsSettings &settings)
            : settings_(settings)
        {
            settings_.validate();
        }

        ValueSeries MetricsEngine::portfolio_values(const data::MarketData &prices,
                                                    const data::Holdings &holdings) const
        {
            std::vector<std::string> missing;
            std::vector<Eigen::Index> columns;
            columns.reserve(holdings.size());
            const auto &tickers = prices.get_tickers();
            for (const auto &h : holdings)
            {
                auto it = std::find(tickers.begin(), tickers.end(), h.ticker);
                if (it == tickers.end())
                {
                    missing.push_back(h.ticker);
                    continue;
                }
                columns.push_back(static_cast<Eigen::Index>(it - tickers.begin()));
            }
            if (!missing.empty())
            {
                throw data::MissingInstrumentError(missing);
            }

            const Eigen::MatrixXd &matrix = prices.get_price_matrix();
            const auto &dates = prices.get_dates();

            // Shares bought at each ticker's first available price
            std::vector<double> shares(holdings.size(), 0.0);
            for (size_t k = 0; k < holdings.size(); ++k)
            {
                for (Eigen::Index i = 0; i < matrix.rows(); ++i)
                {
                    double p = matrix(i, columns[k]);
                    if (!std::isnan(p) && p > 0.0)
                    {
                        shares[k] = settings_.initial_capital * (holdings[k].allocation / 100.0) / p;
                        break;
                    }
                }
            }

            ValueSeries values;
            values.reserve(dates.size());
            std::vector<double> last_price(holdings.size(), 0.0);
            for (Eigen::Index i = 0; i < matrix.rows(); ++i)
            {
                double total = 0.0;
                for (size_t k = 0; k < holdings.size(); ++k)
                {
                    double p = matrix(i, columns[k]);
                    if (!std::isnan(p))
                    {
                        last_price[k] = p;
                    }
                    total += shares[k] * last_price[k];
                }
                if (total > 0.0)
                {
                    values.push_back({dates[static_cast<size_t>(i)], total});
                }
            }
            return values;
        }

        PerformanceMetrics MetricsEngine::compute(const ValueSeries &values,
                                                  const ValueSeries &benchmark) const
        {
            return compute(values, benchmark, settings_.risk_free_rate);
        }

        PerformanceMetrics MetricsEngine::compute(const ValueSeries &values,
                                                  const ValueSeries &benchmark,
                                                  double risk_free_rate) const
        {
            PerformanceMetrics m;
            if (values.size() < 2)
            {
                return m;
            }

            const double days = static_cast<double>(settings_.trading_days_per_year);
            const double rf = finite_or_zero(risk_free_rate);
            const double first = values.front().value;
            const double last = values.back().value;
            const double years = period_years(values);

            m.total_return = (last - first) / first * 100.0;
            m.annualized_return = years > 0.0 ? (std::pow(last / first, 1.0 / years) - 1.0) * 100.0 : 0.0;

            std::vector<double> returns = daily_returns(values);
            m.volatility = sample_stdev(returns) * std::sqrt(days) * 100.0;
            m.sharpe_ratio = m.volatility > 0.0 ? (m.annualized_return - rf) / m.volatility : 0.0;

            // Downside deviation in daily percentage points against rf / days
            const double daily_rf = rf / days;
            double downside_sum = 0.0;
            size_t downside_count = 0;
            for (double r : returns)
            {
                double pct = r * 100.0;
                if (pct < daily_rf)
                {
                    downside_sum += (pct - daily_rf) * (pct - daily_rf);
                    ++downside_count;
                }
            }
            m.downside_deviation = downside_count > 0
                                       ? std::sqrt(downside_sum / static_cast<double>(downside_count))
                                       : 0.0;
            m.sortino_ratio = m.downside_deviation > 0.0
                                  ? (m.annualized_return - rf) / (m.downside_deviation * std::sqrt(days))
                                  : 0.0;

            double peak = first;
            for (const auto &point : values)
            {
                peak = std::max(peak, point.value);
                double dd = peak > 0.0 ? (point.value - peak) / peak * 100.0 : 0.0;
                m.max_drawdown = std::min(m.max_drawdown, dd);
            }

            std::vector<YearlyReturn> yearly = yearly_returns(values);
            if (!yearly.empty())
            {
                auto by_return = [](const YearlyReturn &a, const YearlyReturn &b)
                { return a.return_pct < b.return_pct; };
                m.best_year = std::max_element(yearly.begin(), yearly.end(), by_return)->return_pct;
                m.worst_year = std::min_element(yearly.begin(), yearly.end(), by_return)->return_pct;
                for (const auto &yr : yearly)
                {
                    if (yr.return_pct > 0.0)
                    {
                        ++m.positive_years;
                    }
                    else
                    {
                        ++m.negative_years;
                    }
                }
            }

            if (benchmark.size() == values.size())
            {
                BenchmarkAnalysis relative(returns, daily_returns(benchmark), rf,
                                           settings_.trading_days_per_year);
                m.beta = relative.beta();
                m.alpha = relative.alpha();
                m.r_squared = relative.r_squared();
                m.tracking_error = relative.tracking_error();
                m.information_ratio = relative.information_ratio();
            }

            sanitize(m);
            return m;
        }

        std::vector<YearlyReturn> MetricsEngine::yearly_returns(const ValueSeries &values) const
        {
            std::map<int, std::pair<double, double>> start_end;
            for (const auto &point : values)
            {
                int year = year_of(point.date);
                auto it = start_end.find(year);
                if (it == start_end.end())
                {
                    start_end[year] = {point.value, point.value};
                }
                else
                {
                    it->second.second = point.value;
                }
            }

            std::vector<YearlyReturn> result;
            result.reserve(start_end.size());
            for (const auto &[year, bounds] : start_end)
            {
                double ret = bounds.first != 0.0 ? (bounds.second - bounds.first) / bounds.first * 100.0 : 0.0;
                result.push_back({year, finite_or_zero(ret)});
            }
            return result;
        }

        std::vector<DrawdownPoint> MetricsEngine::drawdowns(const ValueSeries &values) const
        {
            std::vector<DrawdownPoint> result;
            if (values.empty())
            {
                return result;
            }
            result.reserve(values.size());
            double peak = values.front().value;
            for (const auto &point : values)
            {
                peak = std::max(peak, point.value);
                double dd = peak > 0.0 ? (point.value - peak) / peak * 100.0 : 0.0;
                result.push_back({point.date, dd});
            }
            return result;
        }

        std::vector<double> MetricsEngine::daily_returns(const ValueSeries &values)
        {
            std::vector<double> returns;
            if (values.size() < 2)
            {
                return returns;
            }
            returns.reserve(values.size() - 1);
            for (size_t i = 1; i < values.size(); ++i)
            {
                double prev = values[i - 1].value;
                returns.push_back(prev != 0.0 ? (values[i].value - prev) / prev : 0.0);
            }
            return returns;
        }

        double MetricsEngine::period_years(const ValueSeries &values) const
        {
            if (values.size() < 2)
            {
                return 0.0;
            }
            const std::string &start = values.front().date;
            const std::string &end = values.back().date;
            if (!start.empty() && !end.empty())
            {
                long days = data::days_between(start, end);
                if (days > 0)
                {
                    return static_cast<double>(days) / 365.25;
                }
            }
            return static_cast<double>(values.size() - 1) / static_cast<double>(settings_.trading_days_per_year);
        }

        double MetricsEngine::risk_free_rate_from(const data::PriceSeries &quotes, double fallback)
        {
            if (quotes.empty())
            {
                return fallback;
            }
            double sum = 0.0;
            for (const auto &q : quotes)
            {
                sum += q.adjusted_close;
            }
            return finite_or_zero(sum / static_cast<double>(quotes.size()));
        }

    } // namespace analytics
} // namespace allocation

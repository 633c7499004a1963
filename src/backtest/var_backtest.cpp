/**
 * @file var_backtest.cpp
 * @brief Implementation of the rolling VaR backtest.
 */

#include "backtest/var_backtest.hpp"
#include "backtest/coverage_tests.hpp"
#include "stats/sample_statistics.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tailrisk
{
    namespace backtest
    {

        namespace
        {
            bool is_99(double confidence)
            {
                return std::abs(confidence - 0.99) < 1e-12;
            }
        } // anonymous namespace

        size_t VaRSeries::num_defined() const
        {
            size_t count = 0;
            for (int i = 0; i < values.size(); ++i)
            {
                if (!std::isnan(values(i)))
                {
                    ++count;
                }
            }
            return count;
        }

        // ============================================================================
        // Rolling historical VaR
        // ============================================================================

        VaRSeries rolling_historical_var(const Eigen::VectorXd &returns,
                                         const std::vector<std::string> &dates,
                                         double confidence,
                                         int window)
        {
            if (window < 1)
            {
                throw std::invalid_argument(
                    "Rolling window must be at least 1, got: " + std::to_string(window));
            }
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Confidence level must be in the range (0, 1), got: " + std::to_string(confidence));
            }
            if (!dates.empty() && dates.size() != static_cast<size_t>(returns.size()))
            {
                throw std::invalid_argument("Dates must align with returns");
            }

            const int n = returns.size();
            const double p = 1.0 - confidence;

            VaRSeries series;
            series.dates = dates;
            series.values = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN());

            for (int t = window; t < n; ++t)
            {
                series.values(t) = stats::quantile(returns.segment(t - window, window), p);
            }

            return series;
        }

        // ============================================================================
        // Backtest
        // ============================================================================

        BacktestResult backtest_var(const Eigen::VectorXd &returns,
                                    const VaRSeries &var,
                                    double confidence)
        {
            if (static_cast<size_t>(returns.size()) != var.size())
            {
                throw std::invalid_argument(
                    "Returns (" + std::to_string(returns.size()) + ") and VaR series (" + std::to_string(var.size()) + ") must have the same length");
            }

            BacktestResult result;
            result.confidence = confidence;

            for (int t = 0; t < returns.size(); ++t)
            {
                if (std::isnan(var.values(t)))
                {
                    continue;
                }
                result.exception_mask.push_back(returns(t) < var.values(t));
                if (!var.dates.empty())
                {
                    result.dates.push_back(var.dates[t]);
                }
            }

            if (result.exception_mask.empty())
            {
                throw std::invalid_argument("No observations with a defined VaR remain after dropping undefined entries");
            }

            result.observations = static_cast<int>(result.exception_mask.size());
            result.kupiec = kupiec_pof(result.exception_mask, confidence);
            result.exceptions = result.kupiec.exceptions;
            result.exception_rate = static_cast<double>(result.exceptions) / result.observations;
            result.expected_exceptions = result.observations * (1.0 - confidence);

            result.independence = christoffersen_independence(result.exception_mask);
            result.conditional_coverage = conditional_coverage(result.kupiec, result.independence);

            if (is_99(confidence))
            {
                result.zone = basel_traffic_light_99(result.observations, result.exceptions);
                result.thresholds = basel_thresholds_99(result.observations);
            }
            else
            {
                result.zone = TrafficLight::NOT_APPLICABLE;
            }

            return result;
        }

        // ============================================================================
        // BacktestParams
        // ============================================================================

        void BacktestParams::validate() const
        {
            if (!(confidence > 0.0 && confidence < 1.0))
            {
                throw std::invalid_argument(
                    "Backtest confidence must be in the range (0, 1), got: " + std::to_string(confidence));
            }
            if (window < 1)
            {
                throw std::invalid_argument("Backtest window must be at least 1");
            }
            for (int w : sweep_windows)
            {
                if (w < 1)
                {
                    throw std::invalid_argument(
                        "Sweep windows must be at least 1, got: " + std::to_string(w));
                }
            }
        }

        BacktestParams BacktestParams::from_json(const nlohmann::json &j)
        {
            BacktestParams params;
            params.confidence = j.value("confidence", params.confidence);
            params.window = j.value("window", params.window);
            params.sweep_windows = j.value("sweep_windows", params.sweep_windows);
            params.verbose = j.value("verbose", params.verbose);
            return params;
        }

        // ============================================================================
        // VaRBacktester
        // ============================================================================

        VaRBacktester::VaRBacktester(const BacktestParams &params)
            : params_(params)
        {
            params_.validate();
        }

        BacktestResult VaRBacktester::run_window(const Eigen::VectorXd &returns,
                                                 const std::vector<std::string> &dates,
                                                 int window) const
        {
            VaRSeries var = rolling_historical_var(returns, dates, params_.confidence, window);
            BacktestResult result = backtest_var(returns, var, params_.confidence);
            result.window = window;

            if (params_.verbose)
            {
                std::cout << "  Window " << window << ": " << result.exceptions << " exceptions in "
                          << result.observations << " obs, zone " << to_string(result.zone) << "\n";
            }
            return result;
        }

        BacktestResult VaRBacktester::run(const Eigen::VectorXd &returns,
                                          const std::vector<std::string> &dates) const
        {
            return run_window(returns, dates, params_.window);
        }

        std::vector<BacktestResult> VaRBacktester::sweep(const Eigen::VectorXd &returns,
                                                         const std::vector<std::string> &dates) const
        {
            std::vector<BacktestResult> results;
            results.reserve(params_.sweep_windows.size());

            for (int window : params_.sweep_windows)
            {
                if (window >= returns.size())
                {
                    if (params_.verbose)
                    {
                        std::cerr << "Skipping window " << window << ": only " << returns.size()
                                  << " observations" << std::endl;
                    }
                    continue;
                }
                results.push_back(run_window(returns, dates, window));
            }

            return results;
        }

    } // namespace backtest
} // namespace tailrisk

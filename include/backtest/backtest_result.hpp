/**
 * @file backtest_result.hpp
 * @brief Result types of the VaR backtesting framework.
 *
 * Degenerate tests report NaN statistics (never zero) while the remaining
 * fields stay populated, so a backtest on a short or exception-free sample
 * still returns its counts.
 */

#ifndef TAILRISK_BACKTEST_BACKTEST_RESULT_HPP
#define TAILRISK_BACKTEST_BACKTEST_RESULT_HPP

#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace backtest
    {

        /**
         * @struct KupiecResult
         * @brief Kupiec proportion-of-failures test (chi-squared, 1 df).
         */
        struct KupiecResult
        {
            int observations = 0;
            int exceptions = 0;
            double pi_hat = std::numeric_limits<double>::quiet_NaN(); ///< Observed exception rate
            double lr = std::numeric_limits<double>::quiet_NaN();     ///< LR_pof statistic
            double p_value = std::numeric_limits<double>::quiet_NaN();
        };

        /**
         * @struct IndependenceResult
         * @brief Christoffersen independence test (chi-squared, 1 df).
         *
         * n_ij counts transitions from state i at t-1 to state j at t
         * (1 = exception).
         */
        struct IndependenceResult
        {
            int n00 = 0;
            int n01 = 0;
            int n10 = 0;
            int n11 = 0;
            double pi01 = std::numeric_limits<double>::quiet_NaN();
            double pi11 = std::numeric_limits<double>::quiet_NaN();
            double lr = std::numeric_limits<double>::quiet_NaN(); ///< LR_ind statistic
            double p_value = std::numeric_limits<double>::quiet_NaN();
        };

        /**
         * @struct ConditionalCoverageResult
         * @brief LR_cc = LR_pof + LR_ind (chi-squared, 2 df).
         */
        struct ConditionalCoverageResult
        {
            double lr = std::numeric_limits<double>::quiet_NaN();
            double p_value = std::numeric_limits<double>::quiet_NaN();
        };

        /**
         * @enum TrafficLight
         * @brief Basel-style regime of a 99% VaR model.
         */
        enum class TrafficLight
        {
            GREEN,
            YELLOW,
            RED,
            UNDEFINED,     ///< Fewer than 80 observations
            NOT_APPLICABLE ///< Confidence level other than 99%
        };

        /// "GREEN", "YELLOW", "RED", "UNDEFINED" or "N/A"
        std::string to_string(TrafficLight zone);

        /**
         * @struct BaselThresholds
         * @brief Largest exception counts of the green and yellow zones.
         *
         * Both are absent when the regime is undefined or not applicable.
         */
        struct BaselThresholds
        {
            std::optional<int> green_max;
            std::optional<int> yellow_max;
        };

        /**
         * @struct BacktestResult
         * @brief Complete VaR backtest over the defined part of a VaR series.
         */
        struct BacktestResult
        {
            double confidence = 0.99;            ///< VaR confidence level
            int window = 0;                      ///< Rolling lookback, 0 if not a rolling backtest
            int observations = 0;                ///< Dates with a defined VaR
            int exceptions = 0;                  ///< Realized return below VaR
            double exception_rate = 0.0;         ///< exceptions / observations
            double expected_exceptions = 0.0;    ///< observations * (1 - confidence)
            std::vector<bool> exception_mask;    ///< One flag per tested date
            std::vector<std::string> dates;      ///< Tested dates

            KupiecResult kupiec;
            IndependenceResult independence;
            ConditionalCoverageResult conditional_coverage;

            TrafficLight zone = TrafficLight::UNDEFINED;
            BaselThresholds thresholds;

            /**
             * @brief Summary fields as JSON (NaN statistics become null).
             */
            nlohmann::json to_json() const;
        };

    } // namespace backtest
} // namespace tailrisk

#endif // TAILRISK_BACKTEST_BACKTEST_RESULT_HPP

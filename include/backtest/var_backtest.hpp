/**
 * @file var_backtest.hpp
 * @brief Rolling historical VaR and its backtest against realized returns.
 *
 * Rolling VaR at date t uses only the returns strictly before t, in
 * [t - window, t). The first `window` dates carry an undefined VaR (NaN)
 * and are dropped before testing. An exception is a realized return
 * strictly below the VaR threshold.
 */

#ifndef TAILRISK_BACKTEST_VAR_BACKTEST_HPP
#define TAILRISK_BACKTEST_VAR_BACKTEST_HPP

#include "backtest/backtest_result.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace backtest
    {

        /**
         * @struct VaRSeries
         * @brief Signed VaR thresholds per date, NaN where undefined.
         */
        struct VaRSeries
        {
            std::vector<std::string> dates;
            Eigen::VectorXd values;

            size_t size() const { return static_cast<size_t>(values.size()); }

            /// Number of defined (non-NaN) entries
            size_t num_defined() const;
        };

        /**
         * @brief Rolling historical VaR.
         * @param returns Realized returns in date order.
         * @param dates Dates aligned with returns (may be empty).
         * @param confidence VaR confidence level, e.g. 0.99.
         * @param window Lookback length (>= 1).
         * @return Series with NaN at indices < window.
         * @throws std::invalid_argument on a bad window, confidence or date count.
         */
        VaRSeries rolling_historical_var(const Eigen::VectorXd &returns,
                                         const std::vector<std::string> &dates,
                                         double confidence,
                                         int window);

        /**
         * @brief Backtest a VaR series against realized returns.
         *
         * Undefined VaR entries are dropped first. The traffic light is only
         * evaluated for a 99% confidence level; other levels report "N/A".
         *
         * @throws std::invalid_argument if sizes differ or no defined VaR remains.
         */
        BacktestResult backtest_var(const Eigen::VectorXd &returns,
                                    const VaRSeries &var,
                                    double confidence);

        /**
         * @struct BacktestParams
         * @brief Settings of the rolling backtest and its window sweep.
         */
        struct BacktestParams
        {
            double confidence = 0.99;
            int window = 60;
            std::vector<int> sweep_windows{20, 30, 60, 90, 120};
            bool verbose = false;

            /**
             * @throws std::invalid_argument on a confidence outside (0, 1) or a window < 1
             */
            void validate() const;

            static BacktestParams from_json(const nlohmann::json &j);
        };

        /**
         * @class VaRBacktester
         * @brief Runs the rolling historical VaR backtest on a return series.
         *
         * Usage:
         * @code
         *   VaRBacktester backtester(params);
         *   BacktestResult r = backtester.run(portfolio_returns, dates);
         *   auto sweep = backtester.sweep(portfolio_returns, dates);
         * @endcode
         */
        class VaRBacktester
        {
        public:
            explicit VaRBacktester(const BacktestParams &params = BacktestParams());

            ~VaRBacktester() = default;

            /**
             * @brief Rolling VaR with params.window, then backtest.
             */
            BacktestResult run(const Eigen::VectorXd &returns,
                               const std::vector<std::string> &dates) const;

            /**
             * @brief One rolling backtest per sweep window.
             *
             * Windows that leave no defined VaR are skipped (reported on
             * std::cerr when verbose).
             */
            std::vector<BacktestResult> sweep(const Eigen::VectorXd &returns,
                                              const std::vector<std::string> &dates) const;

            const BacktestParams &params() const { return params_; }

        private:
            BacktestParams params_;

            BacktestResult run_window(const Eigen::VectorXd &returns,
                                      const std::vector<std::string> &dates,
                                      int window) const;
        };

    } // namespace backtest
} // namespace tailrisk

#endif // TAILRISK_BACKTEST_VAR_BACKTEST_HPP

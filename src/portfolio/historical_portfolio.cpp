/**
 * @file historical_portfolio.cpp
 * @brief Implementation of the historical VaR / ES aggregator
 */

#include "portfolio/historical_portfolio.hpp"
#include "stats/sample_statistics.hpp"

#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace portfolio
    {

        std::pair<double, double> HistoricalPortfolio::var_es(const Eigen::VectorXd &returns, double alpha)
        {
            if (!(alpha > 0.0 && alpha < 1.0))
            {
                throw std::invalid_argument(
                    "Tail probability must be in the range (0, 1), got: " + std::to_string(alpha));
            }

            if (returns.size() == 0)
            {
                throw std::invalid_argument("Cannot compute historical VaR / ES of an empty return series");
            }

            const double var = stats::quantile(returns, alpha);
            const double es = stats::tail_mean(returns, var);
            return {var, es};
        }

        TailRiskMeasures HistoricalPortfolio::from_series(const Eigen::VectorXd &returns)
        {
            TailRiskMeasures m;
            std::pair<double, double> r95 = var_es(returns, 0.05);
            std::pair<double, double> r99 = var_es(returns, 0.01);
            m.var95 = r95.first;
            m.es95 = r95.second;
            m.var99 = r99.first;
            m.es99 = r99.second;
            return m;
        }

        TailRiskMeasures HistoricalPortfolio::compute(const ReturnPanel &panel,
                                                      const Eigen::VectorXd &weights) const
        {
            return from_series(panel.portfolio_returns(validate_weights(panel, weights)));
        }

        std::string HistoricalPortfolio::get_name() const
        {
            return "Historical";
        }

    } // namespace portfolio
} // namespace tailrisk

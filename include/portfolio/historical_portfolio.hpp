/**
 * @file historical_portfolio.hpp
 * @brief Non-parametric (historical simulation) VaR / ES
 *
 * VaR(a) = empirical a-quantile of the portfolio series (linear
 * interpolation); ES(a) = mean of all returns at or below VaR(a).
 */

#pragma once

#include "portfolio/portfolio_var_model.hpp"

#include <utility>

namespace tailrisk
{
    namespace portfolio
    {

        /**
         * @class HistoricalPortfolio
         * @brief Empirical quantile aggregator
         */
        class HistoricalPortfolio : public PortfolioVaRModel
        {
        public:
            HistoricalPortfolio() = default;

            ~HistoricalPortfolio() override = default;

            /**
             * @brief Historical (VaR, ES) of a series at tail probability alpha
             * @throws std::invalid_argument if the series is empty or alpha not in (0, 1)
             */
            static std::pair<double, double> var_es(const Eigen::VectorXd &returns, double alpha);

            /**
             * @brief Historical measures of an arbitrary return series
             */
            static TailRiskMeasures from_series(const Eigen::VectorXd &returns);

            TailRiskMeasures compute(const ReturnPanel &panel,
                                     const Eigen::VectorXd &weights) const override;

            std::string get_name() const override;
        };

    } // namespace portfolio
} // namespace tailrisk

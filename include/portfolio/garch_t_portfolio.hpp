/**
 * @file garch_t_portfolio.hpp
 * @brief GARCH-t portfolio VaR / ES from per-asset conditional forecasts
 *
 *     Sigma   = D * Corr * D,  D = diag(conditional sigma_i)
 *     mu_p    = sum w_i mu_i
 *     sigma_p = sqrt(w^T Sigma w)
 *     nu_p    = sum |w_i| nu_i / sum |w_i|
 *
 * Corr is the sample correlation of the panel. The weighted average of the
 * asset degrees of freedom is an approximation: a weighted sum of t
 * variables is not t-distributed.
 */

#pragma once

#include "portfolio/portfolio_var_model.hpp"
#include "marginal/garch_fitter.hpp"

#include <vector>

namespace tailrisk
{
    namespace portfolio
    {

        /**
         * @class GarchTPortfolio
         * @brief Portfolio aggregator over per-asset GARCH(1,1)-t fits
         */
        class GarchTPortfolio : public PortfolioVaRModel
        {
        public:
            explicit GarchTPortfolio(const marginal::GarchConfig &config = marginal::GarchConfig());

            ~GarchTPortfolio() override = default;

            /**
             * @brief Conditional model of every asset, in ticker order
             */
            std::vector<marginal::MarginalModel> fit_assets(const ReturnPanel &panel) const;

            /**
             * @brief Combine per-asset conditional models into the portfolio model
             * @param marginals One model per asset
             * @param correlation Asset correlation (N x N)
             * @param weights Portfolio weights (N)
             * @throws std::invalid_argument on size mismatches or all-zero weights
             */
            static marginal::MarginalModel aggregate(const std::vector<marginal::MarginalModel> &marginals,
                                                     const Eigen::MatrixXd &correlation,
                                                     const Eigen::VectorXd &weights);

            TailRiskMeasures compute(const ReturnPanel &panel,
                                     const Eigen::VectorXd &weights) const override;

            std::string get_name() const override;

        private:
            marginal::GarchFitter fitter_;
        };

    } // namespace portfolio
} // namespace tailrisk

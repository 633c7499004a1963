/**
 * @file static_t_portfolio.hpp
 * @brief Static Student-t portfolio VaR / ES
 *
 *     mu_p    = w^T mu
 *     sigma_p = sqrt(w^T Sigma w),  Sigma = full sample covariance
 *     nu_p    = KS search on the realized portfolio series
 *
 * For independent equal-variance assets held 50/50, sigma_p equals
 * sqrt(0.5) times the single-asset sigma.
 */

#pragma once

#include "portfolio/portfolio_var_model.hpp"
#include "marginal/student_t_fitter.hpp"

#include <cstdint>

namespace tailrisk
{
    namespace portfolio
    {

        /**
         * @class StaticTPortfolio
         * @brief Portfolio aggregator using the static Student-t marginal
         *
         * The KS search draws from a generator seeded afresh on every call,
         * so repeated calls on the same inputs agree.
         */
        class StaticTPortfolio : public PortfolioVaRModel
        {
        public:
            explicit StaticTPortfolio(const marginal::StudentTFitConfig &config = marginal::StudentTFitConfig(),
                                      std::uint64_t seed = 42);

            ~StaticTPortfolio() override = default;

            /**
             * @brief Fit (nu_p, mu_p, sigma_p) of the weighted portfolio
             * @throws tailrisk::NumericalError if the selected nu <= 2
             */
            marginal::MarginalModel fit_portfolio(const ReturnPanel &panel,
                                                  const Eigen::VectorXd &weights) const;

            TailRiskMeasures compute(const ReturnPanel &panel,
                                     const Eigen::VectorXd &weights) const override;

            std::string get_name() const override;

        private:
            marginal::StudentTFitter fitter_;
            std::uint64_t seed_;
        };

    } // namespace portfolio
} // namespace tailrisk

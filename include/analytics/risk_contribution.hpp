/**
 * @file risk_contribution.hpp
 * @brief Decomposition of portfolio tail risk into per-asset contributions.
 *
 * Both decompositions are Euler allocations: components add up to the
 * portfolio total and shares add up to one.
 *
 * Component ES (simulation based), at tail probability a:
 *
 *     tail  = scenarios with portfolio return <= a-quantile
 *     ES    = mean portfolio return over the tail
 *     MES_i = mean return of asset i over the tail
 *     CES_i = w_i * MES_i,  share_i = CES_i / ES
 *
 * Component VaR (parametric, from the sample covariance):
 *
 *     VaR_p  = -(a-quantile of the historical portfolio series)
 *     MVaR_i = (Sigma w)_i / sigma_p^2 * VaR_p
 *     CVaR_i = w_i * MVaR_i,  share_i = CVaR_i / VaR_p
 */

#ifndef TAILRISK_ANALYTICS_RISK_CONTRIBUTION_HPP
#define TAILRISK_ANALYTICS_RISK_CONTRIBUTION_HPP

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tailrisk
{
    namespace analytics
    {

        /**
         * @struct RiskContribution
         * @brief Marginal and component risk per asset.
         */
        struct RiskContribution
        {
            std::string measure;              ///< "ES" or "VaR"
            double alpha = 0.0;               ///< Tail probability
            double total = 0.0;               ///< Portfolio ES (signed) or VaR (positive loss)
            std::vector<std::string> tickers; ///< Asset labels (may be empty)
            Eigen::VectorXd weights;
            Eigen::VectorXd marginal;         ///< MES or MVaR
            Eigen::VectorXd component;        ///< w_i * marginal_i
            Eigen::VectorXd share;            ///< component_i / total

            /**
             * @brief Asset indices sorted by share of the total, largest first.
             */
            std::vector<int> ranking() const;

            nlohmann::json to_json() const;
        };

        /**
         * @brief Component ES from simulated scenarios.
         * @param scenarios n_sims x N simulated asset returns.
         * @param weights Portfolio weights (N).
         * @param alpha Tail probability in (0, 1), default 0.05.
         * @throws std::invalid_argument on empty input, size mismatch or bad alpha.
         */
        RiskContribution component_es(const Eigen::MatrixXd &scenarios,
                                      const Eigen::VectorXd &weights,
                                      double alpha = 0.05);

        /**
         * @brief Parametric component VaR from historical returns.
         * @param returns T x N historical returns (T >= 2).
         * @param weights Portfolio weights (N).
         * @param alpha Tail probability in (0, 1), default 0.01.
         * @throws std::invalid_argument on bad input or zero portfolio volatility.
         */
        RiskContribution component_var(const Eigen::MatrixXd &returns,
                                       const Eigen::VectorXd &weights,
                                       double alpha = 0.01);

    } // namespace analytics
} // namespace tailrisk

#endif // TAILRISK_ANALYTICS_RISK_CONTRIBUTION_HPP

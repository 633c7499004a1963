/**
 * @file portfolio_var_model.hpp
 * @brief Abstract interface for portfolio-level VaR / ES aggregation
 *
 * Every aggregator maps (return panel, weights) to the same four signed
 * tail measures, so reports and tests can treat the static-t, GARCH-t and
 * historical models interchangeably.
 */

#pragma once

#include "data/return_panel.hpp"
#include "marginal/marginal_model.hpp"

#include <Eigen/Dense>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

namespace tailrisk
{
    namespace portfolio
    {

        /**
         * @struct TailRiskMeasures
         * @brief 95% and 99% VaR / ES as signed returns (or signed PnL)
         *
         * Losses are negative. ES is at least as extreme as the VaR at the
         * same level.
         */
        struct TailRiskMeasures
        {
            double var95 = std::numeric_limits<double>::quiet_NaN();
            double es95 = std::numeric_limits<double>::quiet_NaN();
            double var99 = std::numeric_limits<double>::quiet_NaN();
            double es99 = std::numeric_limits<double>::quiet_NaN();

            /**
             * @brief Evaluate a location-scale t model at 5% and 1%
             * @throws tailrisk::NumericalError if nu <= 1
             */
            static TailRiskMeasures from_marginal(const marginal::MarginalModel &model);

            nlohmann::json to_json() const;
        };

        /**
         * @class PortfolioVaRModel
         * @brief Abstract base class of the portfolio aggregators
         */
        class PortfolioVaRModel
        {
        public:
            virtual ~PortfolioVaRModel() = default;

            /**
             * @brief Compute portfolio tail measures
             * @param panel Return panel
             * @param weights Weights aligned with panel.tickers(), renormalized to sum to one
             * @throws std::invalid_argument on a weight size mismatch or zero-sum weights
             */
            virtual TailRiskMeasures compute(const ReturnPanel &panel,
                                             const Eigen::VectorXd &weights) const = 0;

            virtual std::string get_name() const = 0;

        protected:
            /**
             * @return Weights renormalized to sum to one
             * @throws std::invalid_argument if sizes differ, weights are not finite or sum to zero
             */
            static Eigen::VectorXd validate_weights(const ReturnPanel &panel, const Eigen::VectorXd &weights);
        };

    } // namespace portfolio
} // namespace tailrisk

/**
 * @file portfolio_var_model.cpp
 * @brief Shared helpers of the portfolio aggregators
 */

#include "portfolio/portfolio_var_model.hpp"

#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace portfolio
    {

        TailRiskMeasures TailRiskMeasures::from_marginal(const marginal::MarginalModel &model)
        {
            TailRiskMeasures m;
            m.var95 = model.value_at_risk(0.05);
            m.es95 = model.expected_shortfall(0.05);
            m.var99 = model.value_at_risk(0.01);
            m.es99 = model.expected_shortfall(0.01);
            return m;
        }

        nlohmann::json TailRiskMeasures::to_json() const
        {
            return nlohmann::json{
                {"VaR95", var95},
                {"ES95", es95},
                {"VaR99", var99},
                {"ES99", es99}};
        }

        Eigen::VectorXd PortfolioVaRModel::validate_weights(const ReturnPanel &panel, const Eigen::VectorXd &weights)
        {
            if (weights.size() != static_cast<int>(panel.num_assets()))
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) + ") does not match number of assets (" + std::to_string(panel.num_assets()) + ")");
            }
            if (!weights.allFinite())
            {
                throw std::invalid_argument("Weights contain NaN or Inf values");
            }
            return normalize_weights(weights);
        }

    } // namespace portfolio
} // namespace tailrisk

/**
 * @file risk_contribution.cpp
 * @brief Implementation of component ES / VaR.
 */

#include "analytics/risk_contribution.hpp"
#include "risk/sample_covariance.hpp"
#include "stats/sample_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tailrisk
{
    namespace analytics
    {

        namespace
        {
            void validate_inputs(const Eigen::MatrixXd &data,
                                 const Eigen::VectorXd &weights,
                                 double alpha)
            {
                if (data.rows() == 0 || data.cols() == 0)
                {
                    throw std::invalid_argument("Return matrix cannot be empty");
                }
                if (weights.size() != data.cols())
                {
                    throw std::invalid_argument(
                        "Weight vector size (" + std::to_string(weights.size()) + ") does not match number of assets (" + std::to_string(data.cols()) + ")");
                }
                if (!(alpha > 0.0 && alpha < 1.0))
                {
                    throw std::invalid_argument(
                        "Tail probability must be in the range (0, 1), got: " + std::to_string(alpha));
                }
            }
        } // anonymous namespace

        // ============================================================================
        // RiskContribution
        // ============================================================================

        std::vector<int> RiskContribution::ranking() const
        {
            std::vector<int> order(share.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [this](int a, int b)
                             { return share(a) > share(b); });
            return order;
        }

        nlohmann::json RiskContribution::to_json() const
        {
            nlohmann::json rows = nlohmann::json::array();
            for (int i = 0; i < component.size(); ++i)
            {
                nlohmann::json row;
                row["ticker"] = i < static_cast<int>(tickers.size()) ? tickers[i] : std::to_string(i);
                row["weight"] = weights(i);
                row["marginal"] = marginal(i);
                row["component"] = component(i);
                row["share"] = share(i);
                rows.push_back(row);
            }

            return nlohmann::json{
                {"measure", measure},
                {"alpha", alpha},
                {"total", total},
                {"assets", rows}};
        }

        // ============================================================================
        // Component ES
        // ============================================================================

        RiskContribution component_es(const Eigen::MatrixXd &scenarios,
                                      const Eigen::VectorXd &weights,
                                      double alpha)
        {
            validate_inputs(scenarios, weights, alpha);

            const int n_assets = scenarios.cols();
            Eigen::VectorXd portfolio = scenarios * weights;
            const double cutoff = stats::quantile(portfolio, alpha);

            std::vector<int> tail;
            for (int i = 0; i < portfolio.size(); ++i)
            {
                if (portfolio(i) <= cutoff)
                {
                    tail.push_back(i);
                }
            }

            const int k = static_cast<int>(tail.size());
            Eigen::MatrixXd tail_assets(k, n_assets);
            Eigen::VectorXd tail_portfolio(k);
            for (int r = 0; r < k; ++r)
            {
                tail_assets.row(r) = scenarios.row(tail[r]);
                tail_portfolio(r) = portfolio(tail[r]);
            }

            const double es = tail_portfolio.mean();
            Eigen::VectorXd tail_means = tail_assets.colwise().mean().transpose();

            RiskContribution result;
            result.measure = "ES";
            result.alpha = alpha;
            result.total = es;
            result.weights = weights;
            result.marginal = tail_means;
            result.component = weights.cwiseProduct(result.marginal);
            result.share = result.component / es;
            return result;
        }

        // ============================================================================
        // Component VaR
        // ============================================================================

        RiskContribution component_var(const Eigen::MatrixXd &returns,
                                       const Eigen::VectorXd &weights,
                                       double alpha)
        {
            validate_inputs(returns, weights, alpha);

            risk::SampleCovariance sample(true);
            Eigen::MatrixXd covariance = sample.estimate_covariance(returns);

            const double sigma_p = std::sqrt(std::max(weights.dot(covariance * weights), 0.0));
            if (!(sigma_p > 0.0))
            {
                throw std::invalid_argument("Portfolio volatility is zero; component VaR is undefined");
            }

            Eigen::VectorXd portfolio = returns * weights;
            const double var_p = -stats::quantile(portfolio, alpha);

            RiskContribution result;
            result.measure = "VaR";
            result.alpha = alpha;
            result.total = var_p;
            result.weights = weights;
            result.marginal = (covariance * weights) / (sigma_p * sigma_p) * var_p;
            result.component = weights.cwiseProduct(result.marginal);
            result.share = result.component / var_p;
            return result;
        }

    } // namespace analytics
} // namespace tailrisk

/**
 * @file static_t_portfolio.cpp
 * @brief Implementation of the static Student-t portfolio aggregator
 */

#include "portfolio/static_t_portfolio.hpp"
#include "risk/sample_covariance.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace tailrisk
{
    namespace portfolio
    {

        StaticTPortfolio::StaticTPortfolio(const marginal::StudentTFitConfig &config, std::uint64_t seed)
            : fitter_(config), seed_(seed)
        {
        }

        marginal::MarginalModel StaticTPortfolio::fit_portfolio(const ReturnPanel &panel,
                                                                const Eigen::VectorXd &raw_weights) const
        {
            const Eigen::VectorXd weights = validate_weights(panel, raw_weights);

            const Eigen::MatrixXd &returns = panel.returns();

            std::mt19937_64 rng(seed_);
            marginal::MarginalModel model = fitter_.fit(panel.portfolio_returns(weights), rng);

            risk::SampleCovariance sample(true);
            Eigen::MatrixXd covariance = sample.estimate_covariance(returns);
            Eigen::VectorXd means = returns.colwise().mean().transpose();

            model.mu = weights.dot(means);
            model.sigma = std::sqrt(std::max(weights.dot(covariance * weights), 0.0));
            return model;
        }

        TailRiskMeasures StaticTPortfolio::compute(const ReturnPanel &panel,
                                                   const Eigen::VectorXd &weights) const
        {
            return TailRiskMeasures::from_marginal(fit_portfolio(panel, weights));
        }

        std::string StaticTPortfolio::get_name() const
        {
            return "StaticStudentT";
        }

    } // namespace portfolio
} // namespace tailrisk

/**
 * @file garch_t_portfolio.cpp
 * @brief Implementation of the GARCH-t portfolio aggregator
 */

#include "portfolio/garch_t_portfolio.hpp"
#include "risk/sample_covariance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tailrisk
{
    namespace portfolio
    {

        GarchTPortfolio::GarchTPortfolio(const marginal::GarchConfig &config)
            : fitter_(config)
        {
        }

        std::vector<marginal::MarginalModel> GarchTPortfolio::fit_assets(const ReturnPanel &panel) const
        {
            std::vector<marginal::MarginalModel> marginals;
            marginals.reserve(panel.num_assets());

            for (size_t j = 0; j < panel.num_assets(); ++j)
            {
                marginals.push_back(fitter_.fit(panel.returns().col(j)));
            }
            return marginals;
        }

        marginal::MarginalModel GarchTPortfolio::aggregate(const std::vector<marginal::MarginalModel> &marginals,
                                                           const Eigen::MatrixXd &correlation,
                                                           const Eigen::VectorXd &weights)
        {
            const int n = weights.size();

            if (static_cast<int>(marginals.size()) != n || correlation.rows() != n || correlation.cols() != n)
            {
                throw std::invalid_argument("Marginals, correlation and weights must have matching dimensions");
            }

            const double abs_total = weights.cwiseAbs().sum();
            if (!(abs_total > 0.0))
            {
                throw std::invalid_argument("Weights must not all be zero");
            }

            Eigen::VectorXd sigma(n);
            Eigen::VectorXd mu(n);
            Eigen::VectorXd nu(n);
            for (int i = 0; i < n; ++i)
            {
                sigma(i) = marginals[i].sigma;
                mu(i) = marginals[i].mu;
                nu(i) = marginals[i].nu;
            }

            Eigen::MatrixXd D = sigma.asDiagonal();
            Eigen::MatrixXd covariance = D * correlation * D;

            marginal::MarginalModel model;
            model.mu = weights.dot(mu);
            model.sigma = std::sqrt(std::max(weights.dot(covariance * weights), 0.0));
            model.nu = weights.cwiseAbs().dot(nu) / abs_total;
            model.kind = marginal::MarginalKind::CONDITIONAL;

            // Report the portfolio as converged only if every asset fit did
            for (const auto &m : marginals)
            {
                model.diagnostics.converged = model.diagnostics.converged && m.diagnostics.converged;
                model.diagnostics.used_fallback = model.diagnostics.used_fallback || m.diagnostics.used_fallback;
            }

            return model;
        }

        TailRiskMeasures GarchTPortfolio::compute(const ReturnPanel &panel,
                                                  const Eigen::VectorXd &raw_weights) const
        {
            const Eigen::VectorXd weights = validate_weights(panel, raw_weights);

            risk::SampleCovariance sample(true);
            Eigen::MatrixXd correlation = sample.estimate_correlation(panel.returns());

            marginal::MarginalModel model = aggregate(fit_assets(panel), correlation, weights);
            return TailRiskMeasures::from_marginal(model);
        }

        std::string GarchTPortfolio::get_name() const
        {
            return "GarchStudentT";
        }

    } // namespace portfolio
} // namespace tailrisk

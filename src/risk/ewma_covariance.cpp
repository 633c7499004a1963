/**
 * @file ewma_covariance.cpp
 * @brief Implementation of EWMA covariance estimator
 */

#include "risk/ewma_covariance.hpp"
#include "risk/sample_covariance.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace risk
    {

        EWMACovariance::EWMACovariance(double lambda, int seed_window)
            : lambda_(lambda), seed_window_(seed_window)
        {
            validate_lambda(lambda);

            if (seed_window < 2)
            {
                throw std::invalid_argument(
                    "EWMA seed window must be at least 2, got: " + std::to_string(seed_window));
            }
        }

        void EWMACovariance::validate_lambda(double lambda)
        {
            if (!(lambda > 0.0 && lambda < 1.0))
            {
                throw std::invalid_argument(
                    "Lambda must be in the range (0, 1), got: " +
                    std::to_string(lambda));
            }
        }

        Eigen::MatrixXd EWMACovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const int n_obs = returns.rows();
            const int init = std::min(seed_window_, n_obs);

            // Seed with the Bessel-corrected covariance of the first window
            SampleCovariance seed_estimator(true);
            Eigen::MatrixXd ewma_cov = seed_estimator.estimate_covariance(returns.topRows(init));

            // S_t = λ * S_{t-1} + (1-λ) * r_t * r_t^T on raw returns
            for (int t = init; t < n_obs; ++t)
            {
                Eigen::VectorXd return_t = returns.row(t).transpose();
                ewma_cov = lambda_ * ewma_cov + (1.0 - lambda_) * (return_t * return_t.transpose());
            }

            return ensure_symmetric(ewma_cov);
        }

        std::string EWMACovariance::get_name() const
        {
            return "EWMACovariance";
        }

        double EWMACovariance::get_weight(int i) const
        {
            if (i < 0)
            {
                throw std::invalid_argument(
                    "Lag must be non-negative, got: " + std::to_string(i));
            }

            return (1.0 - lambda_) * std::pow(lambda_, static_cast<double>(i));
        }

    } // namespace risk
} // namespace tailrisk

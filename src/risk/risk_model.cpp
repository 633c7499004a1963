/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tailrisk
{
    namespace risk
    {
        namespace
        {
            constexpr double kMinStdDev = 1e-12;
        }

        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns)
            const
        {
            Eigen::MatrixXd covariance = estimate_covariance(returns);
            return covariance_to_correlation(covariance);
        }

        DependenceMatrix RiskModel::estimate_dependence(const Eigen::MatrixXd &returns) const
        {
            return DependenceMatrix::from_covariance(estimate_covariance(returns));
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            // Check if matrix is empty
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty.");
            }

            // Check minimum number of observations
            if (returns.rows() < 2)
            {
                throw std::invalid_argument("Need at least 2 observations to compute covariance. Received: " + std::to_string(returns.rows()));
            }

            // Check for NaN or Inf values
            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const int n = covariance.rows();

            if (n == 0 || covariance.cols() != n)
            {
                throw std::invalid_argument("Covariance matrix must be square and non-empty");
            }

            // Extract standard deviations from diagonal, flooring zero-variance assets
            Eigen::VectorXd std_devs(n);
            for (int i = 0; i < n; ++i)
            {
                double variance = std::max(covariance(i, i), 0.0);
                std_devs(i) = std::max(std::sqrt(variance), kMinStdDev);
            }

            Eigen::MatrixXd correlation(n, n);

            for (int i = 0; i < n; ++i)
            {
                for (int j = 0; j < n; ++j)
                {
                    if (i == j)
                    {
                        correlation(i, j) = 1.0;
                    }
                    else
                    {
                        double c = covariance(i, j) / (std_devs(i) * std_devs(j));
                        // Clamp to [-1, 1] to handle numerical errors
                        correlation(i, j) = std::min(1.0, std::max(-1.0, c));
                    }
                }
            }

            return correlation;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace tailrisk

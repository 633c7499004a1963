/**
 * @file dependence_matrix.cpp
 * @brief Implementation of DependenceMatrix
 */

#include "risk/dependence_matrix.hpp"
#include "risk/risk_model.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace tailrisk
{
    namespace risk
    {

        DependenceMatrix DependenceMatrix::from_covariance(const Eigen::MatrixXd &covariance)
        {
            DependenceMatrix dep;
            dep.covariance = covariance;
            dep.correlation = RiskModel::covariance_to_correlation(covariance);

            const int n = covariance.rows();
            dep.vols.resize(n);
            for (int i = 0; i < n; ++i)
            {
                dep.vols(i) = std::max(std::sqrt(std::max(covariance(i, i), 0.0)), 1e-12);
            }

            return dep;
        }

        Eigen::MatrixXd DependenceMatrix::cholesky_factor() const
        {
            Eigen::LLT<Eigen::MatrixXd> llt(correlation);
            if (llt.info() != Eigen::Success)
            {
                throw NumericalError(
                    "Correlation matrix (" + std::to_string(correlation.rows()) + "x" + std::to_string(correlation.cols()) + ") is not positive definite; Cholesky factorization failed");
            }

            Eigen::MatrixXd L = llt.matrixL();
            return L;
        }

    } // namespace risk
} // namespace tailrisk

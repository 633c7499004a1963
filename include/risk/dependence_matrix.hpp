/**
 * @file dependence_matrix.hpp
 * @brief Covariance, correlation and volatilities estimated together
 *
 * The Monte Carlo engine consumes the correlation through its Cholesky
 * factor. A correlation that cannot be factored is a hard error: there is
 * no silent repair here, regularization belongs in the covariance model.
 */

#pragma once

#include <Eigen/Dense>

namespace tailrisk
{
    namespace risk
    {

        /**
         * @struct DependenceMatrix
         * @brief N x N correlation (unit diagonal) with its vols and covariance
         */
        struct DependenceMatrix
        {
            Eigen::MatrixXd covariance;  ///< Source covariance (N x N)
            Eigen::MatrixXd correlation; ///< D^-1 * covariance * D^-1
            Eigen::VectorXd vols;        ///< sqrt(diag(covariance)), floored at 1e-12

            /**
             * @brief Build from a covariance matrix
             * @throws std::invalid_argument if the matrix is empty or not square
             */
            static DependenceMatrix from_covariance(const Eigen::MatrixXd &covariance);

            /**
             * @brief Lower Cholesky factor L of the correlation (corr = L * L^T)
             * @throws tailrisk::NumericalError if the correlation is not positive definite
             */
            Eigen::MatrixXd cholesky_factor() const;

            int size() const { return static_cast<int>(correlation.rows()); }
        };

    } // namespace risk
} // namespace tailrisk

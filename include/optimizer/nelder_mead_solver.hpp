/**
 * @file nelder_mead_solver.hpp
 * @brief Derivative-free Nelder-Mead simplex minimizer
 *
 * Minimizes an unconstrained objective f: R^n -> R. Used by the GARCH
 * maximum-likelihood fit, whose parameters are reparameterized so that
 * every point of R^n maps to an admissible model.
 *
 * Non-finite objective values are treated as +infinity, which lets the
 * objective reject points it cannot evaluate without throwing.
 *
 * Algorithm: standard simplex with reflection (1), expansion (2),
 * contraction (0.5) and shrink (0.5) coefficients.
 */

#pragma once

#include <Eigen/Dense>
#include <functional>
#include <string>

namespace tailrisk
{
    namespace optimizer
    {

        /**
         * @struct SolverOptions
         * @brief Options for the simplex solver
         */
        struct SolverOptions
        {
            int max_iterations = 2000;      ///< Maximum iterations
            double tolerance = 1e-8;        ///< Spread of objective values across the simplex
            double x_tolerance = 1e-8;      ///< Spread of vertices around the best point
            double initial_step = 0.05;     ///< Relative size of the initial simplex
            bool verbose = false;           ///< Print progress

            SolverOptions() = default;
        };

        /**
         * @struct SolverResult
         * @brief Result from the simplex solver
         *
         * When success is false the solution is still the best vertex found.
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Best point found
            double objective_value;   ///< Objective at solution
            bool success;             ///< Convergence achieved
            int iterations;           ///< Number of iterations
            int evaluations;          ///< Number of objective evaluations
            std::string message;      ///< Status message

            SolverResult();
        };

        /**
         * @class NelderMeadSolver
         * @brief Nelder-Mead downhill simplex
         *
         * Usage Example:
         * @code
         * NelderMeadSolver solver;
         * auto result = solver.minimize(
         *     [](const Eigen::VectorXd &x) { return (x.array() - 1.0).square().sum(); },
         *     Eigen::VectorXd::Zero(3));
         * @endcode
         */
        class NelderMeadSolver
        {
        public:
            using Objective = std::function<double(const Eigen::VectorXd &)>;

            explicit NelderMeadSolver(const SolverOptions &options = SolverOptions());

            ~NelderMeadSolver() = default;

            /**
             * @brief Minimize objective starting at x0
             * @param objective Function to minimize
             * @param x0 Starting point
             * @return Solver result (best point even without convergence)
             * @throws std::invalid_argument if x0 is empty or not finite,
             *         or the objective is not finite at x0
             */
            SolverResult minimize(const Objective &objective, const Eigen::VectorXd &x0) const;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

        private:
            SolverOptions options_; ///< Solver configuration

            /**
             * @brief Evaluate with non-finite values mapped to +infinity
             */
            static double evaluate(const Objective &objective, const Eigen::VectorXd &x, int &evaluations);

            bool check_convergence(const Eigen::MatrixXd &simplex,
                                   const Eigen::VectorXd &values) const;
        };

    } // namespace optimizer
} // namespace tailrisk

/**
 * @file nelder_mead_solver.cpp
 * @brief Implementation of the Nelder-Mead simplex minimizer
 */

#include "optimizer/nelder_mead_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace tailrisk
{
    namespace optimizer
    {

        namespace
        {
            constexpr double kReflection = 1.0;
            constexpr double kExpansion = 2.0;
            constexpr double kContraction = 0.5;
            constexpr double kShrink = 0.5;
            constexpr double kZeroStep = 0.00025;
        } // anonymous namespace

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(std::numeric_limits<double>::infinity()),
              success(false),
              iterations(0),
              evaluations(0)
        {
        }

        // ============================================================================
        // NelderMeadSolver Implementation
        // ============================================================================

        NelderMeadSolver::NelderMeadSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        void NelderMeadSolver::set_options(const SolverOptions &options)
        {
            options_ = options;
        }

        double NelderMeadSolver::evaluate(const Objective &objective, const Eigen::VectorXd &x, int &evaluations)
        {
            ++evaluations;
            double value = objective(x);
            if (!std::isfinite(value))
            {
                return std::numeric_limits<double>::infinity();
            }
            return value;
        }

        bool NelderMeadSolver::check_convergence(const Eigen::MatrixXd &simplex,
                                                 const Eigen::VectorXd &values) const
        {
            // Columns are vertices, column 0 is the best one
            const int m = simplex.cols();
            double f_spread = 0.0;
            double x_spread = 0.0;

            for (int k = 1; k < m; ++k)
            {
                f_spread = std::max(f_spread, std::abs(values(k) - values(0)));
                x_spread = std::max(x_spread, (simplex.col(k) - simplex.col(0)).cwiseAbs().maxCoeff());
            }

            return std::isfinite(f_spread) && f_spread <= options_.tolerance && x_spread <= options_.x_tolerance;
        }

        SolverResult NelderMeadSolver::minimize(const Objective &objective, const Eigen::VectorXd &x0) const
        {
            const int n = x0.size();

            if (n == 0)
            {
                throw std::invalid_argument("Starting point must not be empty");
            }
            if (!x0.allFinite())
            {
                throw std::invalid_argument("Starting point contains NaN or Inf");
            }

            SolverResult result;
            int evaluations = 0;

            // Initial simplex: x0 plus one perturbed vertex per coordinate
            Eigen::MatrixXd simplex(n, n + 1);
            Eigen::VectorXd values(n + 1);

            simplex.col(0) = x0;
            values(0) = evaluate(objective, x0, evaluations);

            if (!std::isfinite(values(0)))
            {
                throw std::invalid_argument("Objective is not finite at the starting point");
            }

            for (int k = 0; k < n; ++k)
            {
                Eigen::VectorXd vertex = x0;
                vertex(k) = (x0(k) != 0.0) ? (1.0 + options_.initial_step) * x0(k) : kZeroStep;
                simplex.col(k + 1) = vertex;
                values(k + 1) = evaluate(objective, vertex, evaluations);
            }

            std::vector<int> order(n + 1);

            int iter = 0;
            for (; iter < options_.max_iterations; ++iter)
            {
                // Sort vertices by objective value
                std::iota(order.begin(), order.end(), 0);
                std::sort(order.begin(), order.end(), [&values](int a, int b)
                          { return values(a) < values(b); });

                Eigen::MatrixXd sorted_simplex(n, n + 1);
                Eigen::VectorXd sorted_values(n + 1);
                for (int k = 0; k <= n; ++k)
                {
                    sorted_simplex.col(k) = simplex.col(order[k]);
                    sorted_values(k) = values(order[k]);
                }
                simplex = sorted_simplex;
                values = sorted_values;

                if (check_convergence(simplex, values))
                {
                    result.success = true;
                    result.message = "Converged";
                    break;
                }

                if (options_.verbose && iter % 200 == 0)
                {
                    std::cout << "Iter " << iter << ": obj = " << values(0) << "\n";
                }

                // Centroid of all vertices but the worst
                Eigen::VectorXd centroid = simplex.leftCols(n).rowwise().mean();
                const Eigen::VectorXd worst = simplex.col(n);

                Eigen::VectorXd reflected = centroid + kReflection * (centroid - worst);
                double f_reflected = evaluate(objective, reflected, evaluations);

                if (f_reflected < values(0))
                {
                    Eigen::VectorXd expanded = centroid + kExpansion * (reflected - centroid);
                    double f_expanded = evaluate(objective, expanded, evaluations);

                    if (f_expanded < f_reflected)
                    {
                        simplex.col(n) = expanded;
                        values(n) = f_expanded;
                    }
                    else
                    {
                        simplex.col(n) = reflected;
                        values(n) = f_reflected;
                    }
                    continue;
                }

                if (f_reflected < values(n - 1))
                {
                    simplex.col(n) = reflected;
                    values(n) = f_reflected;
                    continue;
                }

                // Contraction, outside if the reflection improved on the worst vertex
                bool outside = f_reflected < values(n);
                Eigen::VectorXd contracted = outside
                                                 ? Eigen::VectorXd(centroid + kContraction * (reflected - centroid))
                                                 : Eigen::VectorXd(centroid + kContraction * (worst - centroid));
                double f_contracted = evaluate(objective, contracted, evaluations);

                if (f_contracted < std::min(f_reflected, values(n)))
                {
                    simplex.col(n) = contracted;
                    values(n) = f_contracted;
                    continue;
                }

                // Shrink towards the best vertex
                for (int k = 1; k <= n; ++k)
                {
                    simplex.col(k) = simplex.col(0) + kShrink * (simplex.col(k) - simplex.col(0));
                    values(k) = evaluate(objective, simplex.col(k), evaluations);
                }
            }

            // Best vertex
            Eigen::Index best = 0;
            values.minCoeff(&best);

            result.solution = simplex.col(best);
            result.objective_value = values(best);
            result.iterations = iter;
            result.evaluations = evaluations;

            if (!result.success)
            {
                result.message = "Maximum iterations reached";
            }

            if (options_.verbose)
            {
                std::cout << "Nelder-Mead: " << result.message << " after " << iter
                          << " iterations, obj = " << result.objective_value << "\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace tailrisk

/**
 * @file student_t_fitter.cpp
 * @brief Implementation of the static Student-t estimator
 */

#include "marginal/student_t_fitter.hpp"
#include "core/errors.hpp"
#include "stats/sample_statistics.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace marginal
    {

        void StudentTFitConfig::validate() const
        {
            if (min_df < 2)
            {
                throw std::invalid_argument(
                    "Minimum degrees of freedom must be at least 2, got: " + std::to_string(min_df));
            }
            if (max_df < min_df)
            {
                throw std::invalid_argument(
                    "Maximum degrees of freedom (" + std::to_string(max_df) + ") must not be below the minimum (" + std::to_string(min_df) + ")");
            }
        }

        StudentTFitConfig StudentTFitConfig::from_json(const nlohmann::json &j)
        {
            StudentTFitConfig config;
            config.min_df = j.value("min_df", config.min_df);
            config.max_df = j.value("max_df", config.max_df);
            return config;
        }

        StudentTFitter::StudentTFitter(const StudentTFitConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        int StudentTFitter::estimate_df(const Eigen::VectorXd &returns, std::mt19937_64 &rng) const
        {
            if (returns.size() == 0)
            {
                throw std::invalid_argument("Cannot fit a Student-t to an empty series");
            }

            // Throws on fewer than 2 observations or zero variance
            Eigen::VectorXd z = stats::standardize(returns);
            const int n = z.size();

            int best_df = config_.min_df;
            double best_ks = std::numeric_limits<double>::infinity();

            Eigen::VectorXd sample(n);
            for (int df = config_.min_df; df <= config_.max_df; ++df)
            {
                std::student_t_distribution<double> dist(static_cast<double>(df));
                for (int i = 0; i < n; ++i)
                {
                    sample(i) = dist(rng);
                }

                double ks = stats::ks_statistic(z, sample);

                // Strict comparison keeps the smallest nu on ties
                if (ks < best_ks)
                {
                    best_ks = ks;
                    best_df = df;
                }
            }

            return best_df;
        }

        MarginalModel StudentTFitter::fit(const Eigen::VectorXd &returns, std::mt19937_64 &rng) const
        {
            const int df = estimate_df(returns, rng);

            if (df <= 2)
            {
                throw NumericalError(
                    "Selected degrees of freedom " + std::to_string(df) + " <= 2; expected shortfall is undefined");
            }

            MarginalModel model;
            model.nu = static_cast<double>(df);
            model.mu = stats::mean(returns);
            model.sigma = stats::sample_std(returns);
            model.kind = MarginalKind::STATIC;
            return model;
        }

    } // namespace marginal
} // namespace tailrisk

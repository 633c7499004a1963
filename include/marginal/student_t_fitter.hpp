/**
 * @file student_t_fitter.hpp
 * @brief Static Student-t marginal estimator
 *
 * Selects integer degrees of freedom by a Kolmogorov-Smirnov search: for
 * each candidate nu a same-length i.i.d. standard t(nu) sample is drawn
 * from the caller's generator and compared with the standardized series.
 * The candidate with the smallest KS statistic wins, ties resolving to the
 * smallest nu. Location and scale are the sample mean and the
 * Bessel-corrected standard deviation.
 *
 * The search is reproducible only through the injected generator: the same
 * seed and the same series give the same nu.
 */

#ifndef TAILRISK_MARGINAL_STUDENT_T_FITTER_HPP
#define TAILRISK_MARGINAL_STUDENT_T_FITTER_HPP

#include "marginal/marginal_model.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <random>

namespace tailrisk
{
    namespace marginal
    {

        /**
         * @struct StudentTFitConfig
         * @brief Bounds of the degrees-of-freedom search
         */
        struct StudentTFitConfig
        {
            int min_df = 3;  ///< Smallest candidate (>= 2)
            int max_df = 99; ///< Largest candidate

            /**
             * @throws std::invalid_argument if min_df < 2 or max_df < min_df
             */
            void validate() const;

            static StudentTFitConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class StudentTFitter
         * @brief KS-search fit of (nu, mu, sigma)
         *
         * Usage Example:
         * @code
         * std::mt19937_64 rng(42);
         * StudentTFitter fitter;
         * MarginalModel m = fitter.fit(returns, rng);
         * double es95 = m.expected_shortfall(0.05);
         * @endcode
         */
        class StudentTFitter
        {
        public:
            /**
             * @throws std::invalid_argument if the config is invalid
             */
            explicit StudentTFitter(const StudentTFitConfig &config = StudentTFitConfig());

            /**
             * @brief Degrees of freedom minimizing the KS distance
             * @param returns Return series (at least 2 observations, non-zero variance)
             * @param rng Generator the reference samples are drawn from
             * @throws std::invalid_argument on empty, short or constant series
             */
            int estimate_df(const Eigen::VectorXd &returns, std::mt19937_64 &rng) const;

            /**
             * @brief Fit the static marginal model
             * @throws std::invalid_argument on empty, short or constant series
             * @throws tailrisk::NumericalError if the selected nu <= 2 (ES undefined)
             */
            MarginalModel fit(const Eigen::VectorXd &returns, std::mt19937_64 &rng) const;

            const StudentTFitConfig &get_config() const { return config_; }

        private:
            StudentTFitConfig config_;
        };

    } // namespace marginal
} // namespace tailrisk

#endif // TAILRISK_MARGINAL_STUDENT_T_FITTER_HPP

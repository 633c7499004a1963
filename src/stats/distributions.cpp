/**
 * @file distributions.cpp
 * @brief Boost.Math backed distribution helpers
 */

#include "stats/distributions.hpp"
#include "core/errors.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace tailrisk
{
    namespace stats
    {

        namespace
        {
            void validate_probability(double p)
            {
                if (!(p > 0.0 && p < 1.0))
                {
                    throw std::invalid_argument(
                        "Probability must be in the range (0, 1), got: " + std::to_string(p));
                }
            }

            void validate_df(double nu)
            {
                if (!(nu > 0.0) || !std::isfinite(nu))
                {
                    throw std::invalid_argument(
                        "Degrees of freedom must be positive and finite, got: " + std::to_string(nu));
                }
            }
        } // anonymous namespace

        double student_t_quantile(double p, double nu)
        {
            validate_probability(p);
            validate_df(nu);
            boost::math::students_t_distribution<double> dist(nu);
            return boost::math::quantile(dist, p);
        }

        double student_t_cdf(double x, double nu)
        {
            validate_df(nu);
            if (std::isinf(x))
            {
                return x > 0.0 ? 1.0 : 0.0;
            }
            boost::math::students_t_distribution<double> dist(nu);
            return boost::math::cdf(dist, x);
        }

        double student_t_pdf(double x, double nu)
        {
            validate_df(nu);
            boost::math::students_t_distribution<double> dist(nu);
            return boost::math::pdf(dist, x);
        }

        double es_factor_t(double alpha, double nu)
        {
            validate_probability(alpha);
            if (!(nu > 1.0))
            {
                throw NumericalError(
                    "Expected shortfall is undefined for degrees of freedom <= 1, got: " + std::to_string(nu));
            }

            const double q = student_t_quantile(alpha, nu);
            const double density = student_t_pdf(q, nu);
            return -((nu + q * q) / (nu - 1.0)) * (density / alpha);
        }

        double chi_squared_sf(double x, double df)
        {
            if (std::isnan(x))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            validate_df(df);
            if (x <= 0.0)
            {
                return 1.0;
            }
            boost::math::chi_squared_distribution<double> dist(df);
            return boost::math::cdf(boost::math::complement(dist, x));
        }

        double normal_quantile(double p)
        {
            validate_probability(p);
            return boost::math::quantile(boost::math::normal_distribution<double>(), p);
        }

    } // namespace stats
} // namespace tailrisk

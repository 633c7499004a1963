/**
 * @file marginal_model.cpp
 * @brief Implementation of MarginalModel risk measures
 */

#include "marginal/marginal_model.hpp"
#include "core/errors.hpp"
#include "stats/distributions.hpp"

#include <string>

namespace tailrisk
{
    namespace marginal
    {

        std::string to_string(MarginalKind kind)
        {
            switch (kind)
            {
            case MarginalKind::STATIC:
                return "static";
            case MarginalKind::CONDITIONAL:
                return "conditional";
            }
            return "unknown";
        }

        double MarginalModel::value_at_risk(double alpha) const
        {
            return mu + sigma * stats::student_t_quantile(alpha, nu);
        }

        double MarginalModel::expected_shortfall(double alpha) const
        {
            return mu + sigma * stats::es_factor_t(alpha, nu);
        }

        void MarginalModel::validate_for_simulation() const
        {
            if (!(nu > 2.0))
            {
                throw NumericalError(
                    "Student-t variance is undefined for degrees of freedom <= 2, got: " + std::to_string(nu));
            }
        }

    } // namespace marginal
} // namespace tailrisk

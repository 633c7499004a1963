/**
 * @file errors.hpp
 * @brief Exception types raised by the risk engine
 *
 * Input errors (empty series, zero weights, too few observations) are
 * reported with std::invalid_argument. NumericalError marks estimates that
 * cannot be used downstream: a correlation matrix that is not positive
 * definite, or a degrees-of-freedom value that leaves ES or the simulated
 * variance undefined.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tailrisk
{

    /**
     * @class NumericalError
     * @brief Raised when an estimate is numerically degenerate
     */
    class NumericalError : public std::runtime_error
    {
    public:
        explicit NumericalError(const std::string &msg)
            : std::runtime_error("Numerical error: " + msg) {}
    };

} // namespace tailrisk

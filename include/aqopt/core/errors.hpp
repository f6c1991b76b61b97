/**
 * @file errors.hpp
 * @brief Exception types for aqopt
 *
 * Non-physical inputs raise InvalidParameter; well-function arguments
 * outside their domain raise NumericalDomainError. Infeasibility and
 * non-convergence are not exceptions, they are reported in results.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace aqopt {

/**
 * @brief Non-physical or malformed input (T <= 0, empty well list, ...)
 */
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Argument outside a well function's valid domain (u <= 0, ...)
 */
class NumericalDomainError : public std::domain_error {
public:
    explicit NumericalDomainError(const std::string& what)
        : std::domain_error(what) {}
};

/**
 * @brief Carries an exception out of an OpenMP loop
 *
 * Loop bodies catch into capture(i); rethrow() after the region raises
 * the exception of the lowest failing iteration, so the error seen by the
 * caller matches a serial run.
 */
class ParallelError {
public:
    void capture(int64_t iteration) {
        #pragma omp critical(aqopt_parallel_error)
        {
            if (!error_ || iteration < iteration_) {
                error_ = std::current_exception();
                iteration_ = iteration;
            }
        }
    }

    void rethrow() const {
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::exception_ptr error_;
    int64_t iteration_ = 0;
};

} // namespace aqopt

#ifndef GBM_ERRORS_HPP
#define GBM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gbm {

// Bad input detected before any simulation work starts.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

// A well-defined metric whose denominator is exactly zero for this input.
class DegenerateComputation : public std::domain_error {
public:
    explicit DegenerateComputation(const std::string& what)
        : std::domain_error(what) {}
};

} // namespace gbm

#endif // GBM_ERRORS_HPP

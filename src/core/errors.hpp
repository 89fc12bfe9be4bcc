// File: src/core/errors.hpp
//
// Exception types raised when a cluster invariant would be violated.
// Both derive from std::invalid_argument so callers that only care about
// "bad input" can keep catching the standard type.

#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace clustra {

/// Raised at construction or mutation time when an input breaks an invariant.
/// The target object is left exactly as it was before the call.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/// Raised when a vector's length differs from the dimension it must match,
/// typically because the embedding model changed under a cluster.
class DimensionMismatchError : public ValidationError {
public:
    DimensionMismatchError(size_t expected, size_t actual);

    size_t GetExpected() const { return expected_; }
    size_t GetActual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

inline DimensionMismatchError::DimensionMismatchError(size_t expected, size_t actual)
    : ValidationError("Dimension mismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)),
      expected_(expected),
      actual_(actual) {}

} // namespace clustra

#pragma once

#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace vecdist {

/// Raised when an operation needs a numerics provider that is not registered.
/// Thrown before any computation takes place.
class MissingDependency : public std::runtime_error {
public:
    explicit MissingDependency(std::string dependency)
        : std::runtime_error(fmt::format(
              "the '{}' numerics provider is required for this operation but none is registered",
              dependency)),
          dependency_(std::move(dependency)) {}

    [[nodiscard]] const std::string& dependency() const noexcept { return dependency_; }

private:
    std::string dependency_;
};

/// Mean, covariance or observation shapes do not agree.
class ShapeMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Covariance is not symmetric, or cannot be factorized.
class InvalidCovariance : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace vecdist

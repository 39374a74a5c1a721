#pragma once

#include "vecdist/distributions/distribution.hpp"
#include <Eigen/Dense>
#include <fmt/format.h>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace vecdist::distributions {

/// Apply fn to each observation and collect one value per observation,
/// in input order. fn returns either a scalar or an Eigen vector; a vector
/// result must hold exactly one value.
template <typename Fn>
[[nodiscard]] Eigen::VectorXd map_observations(const ObservationList& at, Fn&& fn) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(at.size()));
    for (std::size_t i = 0; i < at.size(); ++i) {
        const auto value = fn(at[i]);
        if constexpr (std::is_arithmetic_v<std::decay_t<decltype(value)>>) {
            out(static_cast<Eigen::Index>(i)) = value;
        } else {
            if (value.size() != 1) {
                throw std::invalid_argument(fmt::format(
                    "values must be length 1, but element {} produced {} values", i, value.size()));
            }
            out(static_cast<Eigen::Index>(i)) = value(0);
        }
    }
    return out;
}

/// Common length of two recycled argument lists: equal lengths, or either of
/// length one.
[[nodiscard]] inline std::size_t recycled_size(std::size_t a, std::size_t b, std::string_view what) {
    if (a == b || b == 1) return a;
    if (a == 1) return b;
    throw std::invalid_argument(fmt::format(
        "{}: cannot recycle arguments of length {} and {}", what, a, b));
}

/// Element i of a list recycled to a longer length.
template <typename T>
[[nodiscard]] const T& recycled_at(const std::vector<T>& values, std::size_t i) {
    return values.size() == 1 ? values.front() : values[i];
}

} // namespace vecdist::distributions

#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>

// Truncates d toward zero into T, or nullopt when d is not finite or the
// result would not fit (negative values never fit an unsigned T).
template <typename T>
std::optional<T> to_integral(double d) {
    static_assert(std::is_integral<T>::value, "integral target required");
    if (!std::isfinite(d)) return std::nullopt;
    // 2^digits is exact in a double and one past T's maximum
    const double hi = std::ldexp(1.0, std::numeric_limits<T>::digits);
    const double lo = std::is_signed<T>::value ? -hi : 0.0;
    if (d < lo || d >= hi) return std::nullopt;
    return static_cast<T>(d);
}

// Same contract for a JSON number; integers are compared without a detour
// through double. Non-numbers give nullopt.
template <typename T>
std::optional<T> json_integral(const nlohmann::json &v) {
    static_assert(std::is_integral<T>::value, "integral target required");
    if (v.is_number_unsigned()) {
        const uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<T>::max())) return std::nullopt;
        return static_cast<T>(u);
    }
    if (v.is_number_integer()) {
        const int64_t i = v.get<int64_t>();
        if (i < 0) {
            if (!std::is_signed<T>::value) return std::nullopt;
            if (i < static_cast<int64_t>(std::numeric_limits<T>::min())) return std::nullopt;
            return static_cast<T>(i);
        }
        if (static_cast<uint64_t>(i) > static_cast<uint64_t>(std::numeric_limits<T>::max())) return std::nullopt;
        return static_cast<T>(i);
    }
    if (v.is_number_float()) return to_integral<T>(v.get<double>());
    return std::nullopt;
}

#ifndef STRATA_INTERNAL_JSON_FIELDS_HPP
#define STRATA_INTERNAL_JSON_FIELDS_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <strata/types.hpp>

namespace strata
{
namespace internal
{

// Numeric JSON value as an int. Out-of-range values saturate, fractions are
// truncated toward zero; NaN and non-numbers give nullopt.
inline std::optional<int> clamped_int(const json& value)
{
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();

    if (value.is_number_unsigned())
    {
        auto n = value.get<std::uint64_t>();
        return n > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<int>(n);
    }
    if (value.is_number_integer())
    {
        auto n = value.get<std::int64_t>();
        if (n > kMax)
            return kMax;
        if (n < kMin)
            return kMin;
        return static_cast<int>(n);
    }
    if (value.is_number_float())
    {
        double d = value.get<double>();
        if (std::isnan(d))
            return std::nullopt;
        if (d >= static_cast<double>(kMax))
            return kMax;
        if (d <= static_cast<double>(kMin))
            return kMin;
        return static_cast<int>(d);
    }
    return std::nullopt;
}

inline std::optional<int> int_field(const json& j, const char* key)
{
    if (!j.is_object())
        return std::nullopt;
    auto it = j.find(key);
    if (it == j.end())
        return std::nullopt;
    return clamped_int(*it);
}

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_JSON_FIELDS_HPP

#pragma once

#include <compare>
#include <concepts>
#include <type_traits>

namespace Keystone
{

// Convert a partial ordering to a weak ordering.
// Unordered values sort first and are equivalent to each other,
// so that values which are unordered with respect to themselves
// (e.g. NaN) still produce a total order.
inline std::weak_ordering to_weak_ordering(
    std::partial_ordering ordering,
    bool leftIsUnordered,
    bool rightIsUnordered
) noexcept
{
    if (ordering == std::partial_ordering::less)
    {
        return std::weak_ordering::less;
    }
    if (ordering == std::partial_ordering::greater)
    {
        return std::weak_ordering::greater;
    }
    if (ordering == std::partial_ordering::equivalent)
    {
        return std::weak_ordering::equivalent;
    }

    if (leftIsUnordered && rightIsUnordered)
    {
        return std::weak_ordering::equivalent;
    }
    if (leftIsUnordered)
    {
        return std::weak_ordering::less;
    }
    return std::weak_ordering::greater;
}

// Compare two values by their native ordering, producing a weak_ordering
// for any three-way comparable type.
template<
    std::three_way_comparable T
> std::weak_ordering compare_weak(
    const T& value1,
    const T& value2)
{
    using ordering_type = std::compare_three_way_result_t<T>;

    if constexpr (std::same_as<ordering_type, std::partial_ordering>)
    {
        auto result = value1 <=> value2;
        if (result != std::partial_ordering::unordered)
        {
            return to_weak_ordering(result, false, false);
        }

        return to_weak_ordering(
            result,
            (value1 <=> value1) == std::partial_ordering::unordered,
            (value2 <=> value2) == std::partial_ordering::unordered);
    }
    else
    {
        return std::weak_ordering(value1 <=> value2);
    }
}

// Map an ordering to -1, 0, or +1.
inline int to_int(
    std::weak_ordering ordering) noexcept
{
    if (ordering < 0)
    {
        return -1;
    }
    if (ordering > 0)
    {
        return 1;
    }
    return 0;
}

inline std::weak_ordering reverse(
    std::weak_ordering ordering) noexcept
{
    return 0 <=> ordering;
}

}

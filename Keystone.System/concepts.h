#pragma once

#include <compare>
#include <concepts>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace Keystone
{

// Determine if a given type is an instantiation of a template
// accepting type arguments.
namespace detail
{
template<
    typename T,
    template <typename ...> typename Template
> constexpr bool is_template_instantiation_v = false;

template<
    typename... Args,
    template <typename ...> typename Template
> constexpr bool is_template_instantiation_v<
    Template<Args...>,
    Template
> = true;
}

template<
    typename T,
    template <typename ...> typename Template
> concept is_template_instantiation = detail::is_template_instantiation_v<std::remove_cvref_t<T>, Template>;

template<
    typename T
> concept is_optional = is_template_instantiation<T, std::optional>;

// The value type of an optional, or the type itself.
namespace detail
{
template<
    typename T
> struct unwrap_optional
{
    using type = T;
};

template<
    typename T
> struct unwrap_optional<std::optional<T>>
{
    using type = T;
};
}

template<
    typename T
> using unwrap_optional_t = typename detail::unwrap_optional<std::remove_cvref_t<T>>::type;

template<
    typename T
> concept is_string_like =
    std::convertible_to<const T&, std::string_view>
    || is_template_instantiation<T, std::basic_string>;

// A sized sequence of ordered elements, other than a string.
template<
    typename T
> concept is_ordered_sequence =
    std::ranges::sized_range<const T>
    && !is_string_like<T>
    && std::three_way_comparable<std::ranges::range_value_t<const T>>;

}

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <fmt/format.h>
#include "Keystone.System/concepts.h"
#include "Keystone.System/ordering.h"
#include "CurrentValueComparer.h"
#include "Value.h"

namespace Keystone::StateManager
{

// A type that compares itself against a loosely-typed value.
template<
    typename T
> concept LooselyComparableObject = requires (const T& value, const Value& other)
{
    { value.CompareTo(other) } -> std::convertible_to<std::weak_ordering>;
};

// A type that compares itself element by element against a loosely-typed value,
// using the supplied comparer for its elements.
template<
    typename T
> concept StructuralComparableObject = requires (const T& value, const Value& other, const IValueComparer& comparer)
{
    { value.CompareTo(other, comparer) } -> std::convertible_to<std::weak_ordering>;
};

template<
    typename T
> concept StructuralSequence = is_ordered_sequence<T>;

namespace detail
{
template<
    typename T
> constexpr bool is_generic_comparable_v =
    (std::three_way_comparable<T> && !StructuralSequence<T>)
    || std::is_enum_v<T>;
}

// The type, or the T of std::optional<T>, has a native same-typed ordering.
// Sequences are compared structurally rather than by their native ordering.
template<
    typename T
> concept GenericComparable = detail::is_generic_comparable_v<unwrap_optional_t<T>>;

template<
    typename T
> concept StructuralComparable =
    StructuralSequence<unwrap_optional_t<T>>
    || StructuralComparableObject<unwrap_optional_t<T>>;

// Types with a native ordering can also compare themselves
// against a loosely-typed value of the same type.
template<
    typename T
> concept LooselyComparable =
    LooselyComparableObject<unwrap_optional_t<T>>
    || GenericComparable<T>;

std::string DemangleTypeName(
    const std::type_info& typeInfo);

[[noreturn]]
void ThrowValueTypeMismatch(
    const ValueType* expectedType,
    const ValueType* actualType);

// The display name of a value type. Types may declare
// a static TypeName member to provide their own.
template<
    typename T
> struct ValueTypeName
{
    static std::string Get()
    {
        if constexpr (requires { { T::TypeName } -> std::convertible_to<std::string_view>; })
        {
            return std::string(T::TypeName);
        }
        else
        {
            return DemangleTypeName(typeid(T));
        }
    }
};

template<typename T> struct ValueTypeName<std::optional<T>> { static std::string Get() { return ValueTypeName<T>::Get() + "?"; } };
template<> struct ValueTypeName<bool> { static std::string Get() { return "bool"; } };
template<> struct ValueTypeName<std::int8_t> { static std::string Get() { return "int8"; } };
template<> struct ValueTypeName<std::uint8_t> { static std::string Get() { return "uint8"; } };
template<> struct ValueTypeName<std::int16_t> { static std::string Get() { return "int16"; } };
template<> struct ValueTypeName<std::uint16_t> { static std::string Get() { return "uint16"; } };
template<> struct ValueTypeName<std::int32_t> { static std::string Get() { return "int32"; } };
template<> struct ValueTypeName<std::uint32_t> { static std::string Get() { return "uint32"; } };
template<> struct ValueTypeName<std::int64_t> { static std::string Get() { return "int64"; } };
template<> struct ValueTypeName<std::uint64_t> { static std::string Get() { return "uint64"; } };
template<> struct ValueTypeName<float> { static std::string Get() { return "float"; } };
template<> struct ValueTypeName<double> { static std::string Get() { return "double"; } };
template<> struct ValueTypeName<std::string> { static std::string Get() { return "string"; } };
template<> struct ValueTypeName<Bytes> { static std::string Get() { return "bytes"; } };

namespace detail
{

template<
    typename T
> std::string FormatValue(
    const T& value);

template<
    typename T
> std::string FormatElement(
    const T& element)
{
    if constexpr (std::same_as<T, std::uint8_t> || std::same_as<T, std::byte>)
    {
        return fmt::format("0x{:02X}", static_cast<unsigned>(element));
    }
    else
    {
        return FormatValue(element);
    }
}

template<
    typename T
> std::string FormatValue(
    const T& value)
{
    if constexpr (is_optional<T>)
    {
        return value ? FormatValue(*value) : std::string("<null>");
    }
    else if constexpr (is_string_like<T>)
    {
        return fmt::format("'{}'", std::string_view(value));
    }
    else if constexpr (std::same_as<T, bool>)
    {
        return value ? "true" : "false";
    }
    else if constexpr (std::is_enum_v<T>)
    {
        return fmt::format("{}", +static_cast<std::underlying_type_t<T>>(value));
    }
    else if constexpr (StructuralSequence<T>)
    {
        std::string result = "{";
        bool first = true;
        for (const auto& element : value)
        {
            if (!first)
            {
                result += ", ";
            }
            first = false;
            result += FormatElement(element);
        }
        result += "}";
        return result;
    }
    else if constexpr (requires { { value.ToString() } -> std::convertible_to<std::string>; })
    {
        return value.ToString();
    }
    else if constexpr (fmt::is_formattable<T>::value)
    {
        return fmt::format("{}", value);
    }
    else
    {
        return "<" + ValueTypeName<T>::Get() + ">";
    }
}

template<
    typename T
> std::shared_ptr<const ICurrentValueComparer> CreateCurrentValueComparer(
    const Property& property)
{
    return std::make_shared<TypedCurrentValueComparer<T>>(property);
}

template<
    typename T
> std::weak_ordering CompareLoosely(
    const Value& value,
    const Value& other)
{
    using value_type = unwrap_optional_t<T>;

    if constexpr (LooselyComparableObject<value_type>)
    {
        return value.As<value_type>().CompareTo(other);
    }
    else
    {
        if (!other.Type() || other.Type()->UnwrapNullable() != ValueType::Of<value_type>())
        {
            ThrowValueTypeMismatch(ValueType::Of<value_type>(), other.Type());
        }

        return compare_weak(
            value.As<value_type>(),
            other.As<value_type>());
    }
}

template<
    typename T
> std::weak_ordering CompareStructurally(
    const Value& value,
    const Value& other,
    const IValueComparer& comparer)
{
    using value_type = unwrap_optional_t<T>;

    if constexpr (StructuralComparableObject<value_type>)
    {
        return value.As<value_type>().CompareTo(other, comparer);
    }
    else
    {
        if (!other.Type() || other.Type()->UnwrapNullable() != ValueType::Of<value_type>())
        {
            ThrowValueTypeMismatch(ValueType::Of<value_type>(), other.Type());
        }

        const auto& sequence1 = value.As<value_type>();
        const auto& sequence2 = other.As<value_type>();

        auto iterator1 = std::ranges::begin(sequence1);
        auto iterator2 = std::ranges::begin(sequence2);
        auto size1 = std::ranges::size(sequence1);
        auto size2 = std::ranges::size(sequence2);

        for (decltype(size1) index = 0; index < size1 && index < size2; ++index, ++iterator1, ++iterator2)
        {
            auto result = compare_weak(*iterator1, *iterator2);
            if (result != std::weak_ordering::equivalent)
            {
                return result;
            }
        }

        return size1 <=> size2;
    }
}

template<
    typename T
> bool IsNull(
    const std::any& value)
{
    if constexpr (is_optional<T>)
    {
        auto optionalValue = std::any_cast<T>(&value);
        return !optionalValue || !optionalValue->has_value();
    }
    else
    {
        return !value.has_value();
    }
}

template<
    typename T
> std::string Format(
    const Value& value)
{
    if (value.IsNull())
    {
        return "<null>";
    }
    return FormatValue(value.As<unwrap_optional_t<T>>());
}

}

template<
    typename T
> const ValueType* ValueType::Of()
{
    static_assert(std::same_as<T, std::remove_cvref_t<T>>, "ValueType::Of requires an unqualified type");
    static_assert(std::copy_constructible<T>, "Values must be copy constructible");

    static const ValueType valueType(Descriptor
    {
        .Name = ValueTypeName<T>::Get(),
        .UnderlyingType = is_optional<T> ? Of<unwrap_optional_t<T>>() : nullptr,
        .IsEnum = std::is_enum_v<T>,
        .IsGenericComparable = GenericComparable<T>,
        .IsStructuralComparable = StructuralComparable<T>,
        .IsLooselyComparable = LooselyComparable<T>,
        .CreateCurrentValueComparer = [] {
            if constexpr (GenericComparable<T>)
            {
                return &detail::CreateCurrentValueComparer<T>;
            }
            else
            {
                return CreateCurrentValueComparerFunction{ nullptr };
            }
        }(),
        .CompareLoosely = [] {
            if constexpr (LooselyComparable<T>)
            {
                return &detail::CompareLoosely<T>;
            }
            else
            {
                return CompareLooselyFunction{ nullptr };
            }
        }(),
        .CompareStructurally = [] {
            if constexpr (StructuralComparable<T>)
            {
                return &detail::CompareStructurally<T>;
            }
            else
            {
                return CompareStructurallyFunction{ nullptr };
            }
        }(),
        .IsNull = &detail::IsNull<T>,
        .Format = &detail::Format<T>,
    });

    return &valueType;
}

}

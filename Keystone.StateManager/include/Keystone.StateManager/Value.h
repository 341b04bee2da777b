#pragma once

#include <any>
#include <compare>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include "Keystone.System/concepts.h"
#include "Primitives.h"

namespace Keystone::StateManager
{

// Compares two loosely-typed values.
class IValueComparer
{
public:
    virtual ~IValueComparer() = default;

    virtual std::weak_ordering Compare(
        const Value& value1,
        const Value& value2
    ) const = 0;

    std::weak_ordering operator()(
        const Value& value1,
        const Value& value2
        ) const
    {
        return Compare(value1, value2);
    }
};

// Runtime descriptor of a C++ value type, holding the capabilities
// used to select a comparison strategy and the entry points
// that implement them for the type.
//
// Descriptors are obtained with ValueType::Of<T>(), which returns
// one immutable instance per type for the lifetime of the process.
class ValueType
{
public:
    using CompareLooselyFunction = std::weak_ordering(*)(
        const Value& value,
        const Value& other);

    using CompareStructurallyFunction = std::weak_ordering(*)(
        const Value& value,
        const Value& other,
        const IValueComparer& comparer);

    using CreateCurrentValueComparerFunction = std::shared_ptr<const ICurrentValueComparer>(*)(
        const Property& property);

    using IsNullFunction = bool(*)(
        const std::any& value);

    using FormatFunction = std::string(*)(
        const Value& value);

    struct Descriptor
    {
        std::string Name;
        const ValueType* UnderlyingType = nullptr;
        bool IsEnum = false;
        bool IsGenericComparable = false;
        bool IsStructuralComparable = false;
        bool IsLooselyComparable = false;
        CreateCurrentValueComparerFunction CreateCurrentValueComparer = nullptr;
        CompareLooselyFunction CompareLoosely = nullptr;
        CompareStructurallyFunction CompareStructurally = nullptr;
        IsNullFunction IsNull = nullptr;
        FormatFunction Format = nullptr;
    };

private:
    Descriptor m_descriptor;

public:
    explicit ValueType(
        Descriptor descriptor);

    ValueType(const ValueType&) = delete;
    ValueType& operator=(const ValueType&) = delete;

    const std::string& Name() const noexcept;

    // True for std::optional<T>.
    bool IsNullable() const noexcept;

    // The T of std::optional<T>, or this type if it is not nullable.
    const ValueType* UnwrapNullable() const noexcept;

    bool IsEnum() const noexcept;

    // The type has a native, same-typed ordering.
    bool IsGenericComparable() const noexcept;

    // The type is compared element by element.
    bool IsStructuralComparable() const noexcept;

    // The type can compare itself against a loosely-typed value.
    bool IsLooselyComparable() const noexcept;

    // Construct the typed comparer of current values of a property of this type.
    // Only valid for generic-comparable types.
    std::shared_ptr<const ICurrentValueComparer> CreateCurrentValueComparer(
        const Property& property
    ) const;

    // Compare a non-null value of this type with another non-null value.
    std::weak_ordering CompareLoosely(
        const Value& value,
        const Value& other
    ) const;

    // Compare a non-null value of this type structurally with another non-null value.
    std::weak_ordering CompareStructurally(
        const Value& value,
        const Value& other,
        const IValueComparer& comparer
    ) const;

    bool IsNull(
        const std::any& value
    ) const;

    std::string Format(
        const Value& value
    ) const;

    template<
        typename T
    > static const ValueType* Of();
};

[[noreturn]]
void ThrowInvalidValueCast(
    const ValueType* valueType,
    const ValueType* requestedType);

// A type-erased value: either null, or a value of some type T
// together with ValueType::Of<T>().
class Value
{
    const ValueType* m_type = nullptr;
    std::any m_value;

public:
    Value() = default;

    Value(
        std::nullptr_t)
    {}

    Value(
        const char* value
    ) :
        Value(std::string(value))
    {}

    template<
        typename T
    >
        requires (!std::same_as<std::remove_cvref_t<T>, Value>
            && !std::same_as<std::remove_cvref_t<T>, std::nullptr_t>
            && !std::is_array_v<std::remove_reference_t<T>>)
    Value(
        T&& value
    ) :
        m_type(ValueType::Of<std::remove_cvref_t<T>>()),
        m_value(std::forward<T>(value))
    {}

    bool IsNull() const
    {
        return !m_type || m_type->IsNull(m_value);
    }

    // The type of the held value, or nullptr for a default-constructed null value.
    // A disengaged std::optional<T> keeps its type but IsNull() returns true.
    const ValueType* Type() const noexcept
    {
        return m_type;
    }

    const std::any& Any() const noexcept
    {
        return m_value;
    }

    // Get a pointer to the held value if it is exactly of type T.
    template<
        typename T
    > const T* TryGet() const noexcept
    {
        return std::any_cast<T>(&m_value);
    }

    // Read the value as T. A null value can be read as std::optional<T>,
    // and a value of type T and std::optional<T> can be read as either.
    template<
        typename T
    > T Get() const
    {
        if (IsNull())
        {
            if constexpr (is_optional<T>)
            {
                return std::nullopt;
            }
            else
            {
                ThrowInvalidValueCast(m_type, ValueType::Of<T>());
            }
        }

        if (auto value = std::any_cast<T>(&m_value))
        {
            return *value;
        }

        if constexpr (is_optional<T>)
        {
            if (auto value = std::any_cast<unwrap_optional_t<T>>(&m_value))
            {
                return T{ *value };
            }
        }
        else
        {
            if (auto value = std::any_cast<std::optional<T>>(&m_value))
            {
                return **value;
            }
        }

        ThrowInvalidValueCast(m_type, ValueType::Of<T>());
    }

    // Get a reference to the held value of type T, or to the value
    // of a held engaged std::optional<T>.
    template<
        typename T
    > requires (!is_optional<T>)
    const T& As() const
    {
        if (auto value = std::any_cast<T>(&m_value))
        {
            return *value;
        }

        if (auto value = std::any_cast<std::optional<T>>(&m_value);
            value && value->has_value())
        {
            return **value;
        }

        ThrowInvalidValueCast(m_type, ValueType::Of<T>());
    }

    std::string ToString() const;
};

}

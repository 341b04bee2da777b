#pragma once

#include <compare>
#include <string_view>
#include "Keystone.System/ordering.h"
#include "EntityEntry.h"
#include "ValueComparer.h"

namespace Keystone::StateManager
{

template<
    typename TModel,
    typename TProvider
> class TypedValueConverter;

enum class CurrentValueComparerKind
{
    Typed,
    ConvertedTyped,
    Default,
    ConvertedDefault,
    Structural,
    ConvertedStructural,
};

std::string_view ToString(
    CurrentValueComparerKind kind);

// Compares two entries by the current value of one property.
class ICurrentValueComparer
{
public:
    virtual ~ICurrentValueComparer() = default;

    virtual std::weak_ordering Compare(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
    ) const = 0;

    virtual CurrentValueComparerKind Kind() const noexcept = 0;

    virtual const Property& GetProperty() const noexcept = 0;

    std::weak_ordering operator()(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
        ) const
    {
        return Compare(entry1, entry2);
    }
};

// Compares current values of type TProperty by their native ordering.
template<
    typename TProperty
> class TypedCurrentValueComparer : public ICurrentValueComparer
{
    const Property& m_property;

public:
    explicit TypedCurrentValueComparer(
        const Property& property
    ) : m_property(property)
    {}

    std::weak_ordering Compare(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
    ) const override
    {
        return compare_weak(
            entry1.GetCurrentValue<TProperty>(m_property),
            entry2.GetCurrentValue<TProperty>(m_property));
    }

    CurrentValueComparerKind Kind() const noexcept override
    {
        return CurrentValueComparerKind::Typed;
    }

    const Property& GetProperty() const noexcept override
    {
        return m_property;
    }
};

// Converts current values of type TModel to TProvider,
// then compares them by TProvider's native ordering.
// Null values sort first and are not passed to the converter.
template<
    typename TModel,
    typename TProvider
> class ConvertedTypedCurrentValueComparer : public ICurrentValueComparer
{
    const Property& m_property;
    const TypedValueConverter<TModel, TProvider>& m_converter;

public:
    ConvertedTypedCurrentValueComparer(
        const Property& property,
        const TypedValueConverter<TModel, TProvider>& converter
    ) :
        m_property(property),
        m_converter(converter)
    {}

    std::weak_ordering Compare(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
    ) const override
    {
        const auto& value1 = entry1.GetCurrentValue(m_property);
        const auto& value2 = entry2.GetCurrentValue(m_property);

        if (value1.IsNull() || value2.IsNull())
        {
            return !value1.IsNull() <=> !value2.IsNull();
        }

        return compare_weak(
            m_converter.ConvertToProviderTyped(value1.Get<TModel>()),
            m_converter.ConvertToProviderTyped(value2.Get<TModel>()));
    }

    CurrentValueComparerKind Kind() const noexcept override
    {
        return CurrentValueComparerKind::ConvertedTyped;
    }

    const Property& GetProperty() const noexcept override
    {
        return m_property;
    }
};

// Compares loosely-typed current values with an underlying value comparer,
// by default the DefaultValueComparer.
class CurrentValueComparer : public ICurrentValueComparer
{
    const Property& m_property;
    const IValueComparer& m_underlyingComparer;

protected:
    CurrentValueComparer(
        const Property& property,
        const IValueComparer& underlyingComparer);

    std::weak_ordering CompareValues(
        const Value& value1,
        const Value& value2
    ) const;

public:
    explicit CurrentValueComparer(
        const Property& property);

    virtual Value GetCurrentValue(
        const IUpdateEntry& entry
    ) const;

    std::weak_ordering Compare(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
    ) const override;

    CurrentValueComparerKind Kind() const noexcept override;

    const Property& GetProperty() const noexcept override;
};

// Converts current values to the provider type before comparing them.
class ConvertedCurrentValueComparer : public CurrentValueComparer
{
    const ValueConverter& m_converter;

public:
    ConvertedCurrentValueComparer(
        const Property& property,
        const ValueConverter& converter);

    Value GetCurrentValue(
        const IUpdateEntry& entry
    ) const override;

    CurrentValueComparerKind Kind() const noexcept override;
};

// Compares current values with the StructuralValueComparer.
class StructuralCurrentValueComparer : public CurrentValueComparer
{
public:
    explicit StructuralCurrentValueComparer(
        const Property& property);

    CurrentValueComparerKind Kind() const noexcept override;
};

// Converts current values to the provider type,
// then compares them with the StructuralValueComparer.
class ConvertedStructuralCurrentValueComparer : public StructuralCurrentValueComparer
{
    const ValueConverter& m_converter;

public:
    ConvertedStructuralCurrentValueComparer(
        const Property& property,
        const ValueConverter& converter);

    Value GetCurrentValue(
        const IUpdateEntry& entry
    ) const override;

    CurrentValueComparerKind Kind() const noexcept override;
};

}

#include "Keystone.StateManager/CurrentValueComparer.h"
#include "Keystone.StateManager/ValueConverter.h"

namespace Keystone::StateManager
{

std::string_view ToString(
    CurrentValueComparerKind kind)
{
    switch (kind)
    {
    case CurrentValueComparerKind::Typed:
        return "Typed";
    case CurrentValueComparerKind::ConvertedTyped:
        return "ConvertedTyped";
    case CurrentValueComparerKind::Default:
        return "Default";
    case CurrentValueComparerKind::ConvertedDefault:
        return "ConvertedDefault";
    case CurrentValueComparerKind::Structural:
        return "Structural";
    case CurrentValueComparerKind::ConvertedStructural:
        return "ConvertedStructural";
    }
    return "Unknown";
}

CurrentValueComparer::CurrentValueComparer(
    const Property& property,
    const IValueComparer& underlyingComparer)
    :
    m_property(property),
    m_underlyingComparer(underlyingComparer)
{}

CurrentValueComparer::CurrentValueComparer(
    const Property& property)
    :
    CurrentValueComparer(
        property,
        DefaultValueComparer::Instance())
{}

std::weak_ordering CurrentValueComparer::CompareValues(
    const Value& value1,
    const Value& value2
) const
{
    return m_underlyingComparer.Compare(
        value1,
        value2);
}

Value CurrentValueComparer::GetCurrentValue(
    const IUpdateEntry& entry
) const
{
    return entry.GetCurrentValue(m_property);
}

std::weak_ordering CurrentValueComparer::Compare(
    const IUpdateEntry& entry1,
    const IUpdateEntry& entry2
) const
{
    return CompareValues(
        GetCurrentValue(entry1),
        GetCurrentValue(entry2));
}

CurrentValueComparerKind CurrentValueComparer::Kind() const noexcept
{
    return CurrentValueComparerKind::Default;
}

const Property& CurrentValueComparer::GetProperty() const noexcept
{
    return m_property;
}

ConvertedCurrentValueComparer::ConvertedCurrentValueComparer(
    const Property& property,
    const ValueConverter& converter)
    :
    CurrentValueComparer(property),
    m_converter(converter)
{}

Value ConvertedCurrentValueComparer::GetCurrentValue(
    const IUpdateEntry& entry
) const
{
    return m_converter.ConvertToProvider(
        CurrentValueComparer::GetCurrentValue(entry));
}

CurrentValueComparerKind ConvertedCurrentValueComparer::Kind() const noexcept
{
    return CurrentValueComparerKind::ConvertedDefault;
}

StructuralCurrentValueComparer::StructuralCurrentValueComparer(
    const Property& property)
    :
    CurrentValueComparer(
        property,
        StructuralValueComparer::Instance())
{}

CurrentValueComparerKind StructuralCurrentValueComparer::Kind() const noexcept
{
    return CurrentValueComparerKind::Structural;
}

ConvertedStructuralCurrentValueComparer::ConvertedStructuralCurrentValueComparer(
    const Property& property,
    const ValueConverter& converter)
    :
    StructuralCurrentValueComparer(property),
    m_converter(converter)
{}

Value ConvertedStructuralCurrentValueComparer::GetCurrentValue(
    const IUpdateEntry& entry
) const
{
    return m_converter.ConvertToProvider(
        StructuralCurrentValueComparer::GetCurrentValue(entry));
}

CurrentValueComparerKind ConvertedStructuralCurrentValueComparer::Kind() const noexcept
{
    return CurrentValueComparerKind::ConvertedStructural;
}

}

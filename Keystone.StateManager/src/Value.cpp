#include "Keystone.StateManager/ValueType.h"
#include "Keystone.StateManager/Errors.h"
#include <cxxabi.h>
#include <cstdlib>
#include <fmt/format.h>

namespace Keystone::StateManager
{

ValueType::ValueType(
    Descriptor descriptor)
    :
    m_descriptor(std::move(descriptor))
{}

const std::string& ValueType::Name() const noexcept
{
    return m_descriptor.Name;
}

bool ValueType::IsNullable() const noexcept
{
    return m_descriptor.UnderlyingType != nullptr;
}

const ValueType* ValueType::UnwrapNullable() const noexcept
{
    return m_descriptor.UnderlyingType
        ? m_descriptor.UnderlyingType
        : this;
}

bool ValueType::IsEnum() const noexcept
{
    return m_descriptor.IsEnum;
}

bool ValueType::IsGenericComparable() const noexcept
{
    return m_descriptor.IsGenericComparable;
}

bool ValueType::IsStructuralComparable() const noexcept
{
    return m_descriptor.IsStructuralComparable;
}

bool ValueType::IsLooselyComparable() const noexcept
{
    return m_descriptor.IsLooselyComparable;
}

std::shared_ptr<const ICurrentValueComparer> ValueType::CreateCurrentValueComparer(
    const Property& property
) const
{
    if (!m_descriptor.CreateCurrentValueComparer)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::TypeNotComparable,
            fmt::format("Type {} has no native ordering", Name()));
    }
    return m_descriptor.CreateCurrentValueComparer(property);
}

std::weak_ordering ValueType::CompareLoosely(
    const Value& value,
    const Value& other
) const
{
    if (!m_descriptor.CompareLoosely)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::ValueNotComparable,
            fmt::format("Type {} cannot be compared", Name()));
    }
    return m_descriptor.CompareLoosely(value, other);
}

std::weak_ordering ValueType::CompareStructurally(
    const Value& value,
    const Value& other,
    const IValueComparer& comparer
) const
{
    if (!m_descriptor.CompareStructurally)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::ValueNotComparable,
            fmt::format("Type {} cannot be compared structurally", Name()));
    }
    return m_descriptor.CompareStructurally(value, other, comparer);
}

bool ValueType::IsNull(
    const std::any& value
) const
{
    return m_descriptor.IsNull(value);
}

std::string ValueType::Format(
    const Value& value
) const
{
    return m_descriptor.Format(value);
}

std::string DemangleTypeName(
    const std::type_info& typeInfo)
{
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(typeInfo.name(), nullptr, nullptr, &status),
        &std::free);

    if (status != 0 || !demangled)
    {
        return typeInfo.name();
    }

    std::string_view name = demangled.get();
    // Drop namespaces, keeping template arguments intact.
    auto templateStart = name.find('<');
    auto lastSeparator = name.substr(0, templateStart).rfind("::");
    if (lastSeparator != std::string_view::npos)
    {
        name.remove_prefix(lastSeparator + 2);
    }
    return std::string(name);
}

static std::string_view GetTypeName(
    const ValueType* valueType)
{
    return valueType
        ? std::string_view(valueType->Name())
        : std::string_view("<null>");
}

void ThrowInvalidValueCast(
    const ValueType* valueType,
    const ValueType* requestedType)
{
    ThrowStateManagerException(
        StateManagerErrorCode::InvalidValueCast,
        fmt::format(
            "Cannot read a value of type {} as {}",
            GetTypeName(valueType),
            GetTypeName(requestedType)));
}

void ThrowValueTypeMismatch(
    const ValueType* expectedType,
    const ValueType* actualType)
{
    ThrowStateManagerException(
        StateManagerErrorCode::ValueTypeMismatch,
        fmt::format(
            "Value must be of type {} but was {}",
            GetTypeName(expectedType),
            GetTypeName(actualType)));
}

std::string Value::ToString() const
{
    if (IsNull())
    {
        return "<null>";
    }
    return m_type->Format(*this);
}

}

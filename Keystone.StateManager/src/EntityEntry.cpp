#include "Keystone.StateManager/EntityEntry.h"
#include "Keystone.StateManager/Errors.h"
#include "Keystone.StateManager/ValueComparer.h"
#include "Keystone.StateManager/ValueType.h"
#include <fmt/format.h>

namespace Keystone::StateManager
{

namespace
{
void ValidateValue(
    const Property& property,
    const Value& value)
{
    if (value.IsNull())
    {
        if (!property.IsNullable())
        {
            ThrowStateManagerException(
                StateManagerErrorCode::ValueTypeMismatch,
                fmt::format(
                    "{}.{} does not accept null",
                    property.DeclaringEntityType().Name(),
                    property.Name()));
        }
        return;
    }

    if (value.Type()->UnwrapNullable() != property.Type()->UnwrapNullable())
    {
        ThrowStateManagerException(
            StateManagerErrorCode::ValueTypeMismatch,
            fmt::format(
                "{}.{} is of type {}, not {}",
                property.DeclaringEntityType().Name(),
                property.Name(),
                property.Type()->Name(),
                value.Type()->Name()));
    }
}

// Values of types without any comparison capability are never equivalent,
// so assigning one always marks the property modified.
bool AreEquivalent(
    const Value& value1,
    const Value& value2)
{
    if (value1.IsNull() || value2.IsNull())
    {
        return value1.IsNull() && value2.IsNull();
    }

    auto valueType = value1.Type();
    if (!valueType->IsStructuralComparable() && !valueType->IsLooselyComparable())
    {
        return false;
    }

    return StructuralValueComparer::Instance().Compare(value1, value2) == 0;
}
}

InternalEntityEntry::InternalEntityEntry(
    const EntityType& entityType,
    std::vector<Value> values,
    EntityState entityState)
    :
    m_entityType(entityType),
    m_entityState(entityState),
    m_currentValues(std::move(values))
{
    const auto& properties = m_entityType.GetProperties();
    if (m_currentValues.size() != properties.size())
    {
        ThrowStateManagerException(
            StateManagerErrorCode::ValueTypeMismatch,
            fmt::format(
                "{} has {} properties but {} values were given",
                m_entityType.Name(),
                properties.size(),
                m_currentValues.size()));
    }

    for (auto property : properties)
    {
        ValidateValue(
            *property,
            m_currentValues[property->Index()]);
    }

    m_originalValues = m_currentValues;
    m_modifiedProperties.assign(m_currentValues.size(), false);
}

const EntityType& InternalEntityEntry::GetEntityType() const
{
    return m_entityType;
}

EntityState InternalEntityEntry::GetEntityState() const
{
    return m_entityState;
}

void InternalEntityEntry::SetEntityState(
    EntityState entityState)
{
    m_entityState = entityState;
}

const Value& InternalEntityEntry::GetCurrentValue(
    const Property& property
) const
{
    return m_currentValues.at(property.Index());
}

void InternalEntityEntry::SetCurrentValue(
    const Property& property,
    Value value)
{
    ValidateValue(
        property,
        value);

    m_currentValues.at(property.Index()) = std::move(value);

    bool isModified = !AreEquivalent(
        m_currentValues[property.Index()],
        m_originalValues[property.Index()]);
    m_modifiedProperties[property.Index()] = isModified;

    if (m_entityState == EntityState::Unchanged
        && isModified)
    {
        m_entityState = EntityState::Modified;
    }
}

const Value& InternalEntityEntry::GetOriginalValue(
    const Property& property
) const
{
    return m_originalValues.at(property.Index());
}

bool InternalEntityEntry::IsModified(
    const Property& property
) const
{
    return m_modifiedProperties.at(property.Index());
}

void InternalEntityEntry::AcceptChanges()
{
    m_originalValues = m_currentValues;
    m_modifiedProperties.assign(m_currentValues.size(), false);

    switch (m_entityState)
    {
    case EntityState::Added:
    case EntityState::Modified:
        m_entityState = EntityState::Unchanged;
        break;
    case EntityState::Deleted:
        m_entityState = EntityState::Detached;
        break;
    default:
        break;
    }
}

std::string InternalEntityEntry::BuildKeyString() const
{
    auto primaryKey = m_entityType.FindPrimaryKey();
    if (!primaryKey)
    {
        return "(keyless)";
    }

    std::string keyString = "{";
    for (auto keyProperty : primaryKey->Properties())
    {
        if (keyString.size() > 1)
        {
            keyString += ", ";
        }
        keyString += fmt::format(
            "{}: {}",
            keyProperty->Name(),
            GetCurrentValue(*keyProperty).ToString());
    }
    keyString += "}";
    return keyString;
}

std::string InternalEntityEntry::ToDebugString(
    StateManagerDebugStringOptions options
) const
{
    auto debugString = fmt::format(
        "{} {} {}",
        m_entityType.Name(),
        BuildKeyString(),
        ToString(m_entityState));

    if (!HasFlag(options, StateManagerDebugStringOptions::IncludeProperties))
    {
        return debugString;
    }

    for (auto property : m_entityType.GetProperties())
    {
        debugString += fmt::format(
            "\n  {}: {}",
            property->Name(),
            GetCurrentValue(*property).ToString());

        if (property->IsPrimaryKey())
        {
            debugString += " PK";
        }

        if (m_entityState != EntityState::Added
            && IsModified(*property))
        {
            debugString += fmt::format(
                " Modified Originally {}",
                GetOriginalValue(*property).ToString());
        }
    }

    return debugString;
}

}

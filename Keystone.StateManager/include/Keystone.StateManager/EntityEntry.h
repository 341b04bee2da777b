#pragma once

#include <string>
#include <vector>
#include "Model.h"
#include "Value.h"

namespace Keystone::StateManager
{

// An entity instance as seen by comparers: its type, state,
// and the current value of each of its properties.
class IUpdateEntry
{
public:
    virtual ~IUpdateEntry() = default;

    virtual const EntityType& GetEntityType() const = 0;

    virtual EntityState GetEntityState() const = 0;

    virtual const Value& GetCurrentValue(
        const Property& property
    ) const = 0;

    template<
        typename T
    > T GetCurrentValue(
        const Property& property
    ) const
    {
        return GetCurrentValue(property).Get<T>();
    }
};

class InternalEntityEntry : public IUpdateEntry
{
    const EntityType& m_entityType;
    EntityState m_entityState;
    std::vector<Value> m_currentValues;
    std::vector<Value> m_originalValues;
    std::vector<bool> m_modifiedProperties;

    std::string BuildKeyString() const;

public:
    InternalEntityEntry(
        const EntityType& entityType,
        std::vector<Value> values,
        EntityState entityState);

    using IUpdateEntry::GetCurrentValue;

    const EntityType& GetEntityType() const override;

    EntityState GetEntityState() const override;

    void SetEntityState(
        EntityState entityState);

    const Value& GetCurrentValue(
        const Property& property
    ) const override;

    // Set the current value of a property. An Unchanged entry
    // becomes Modified when the value differs from the original value.
    void SetCurrentValue(
        const Property& property,
        Value value);

    // The value of the property when tracking started,
    // or when AcceptChanges was last called.
    const Value& GetOriginalValue(
        const Property& property
    ) const;

    // The property was assigned a value that differs from its original value.
    bool IsModified(
        const Property& property
    ) const;

    // Make the current values the original values and mark
    // Added and Modified entries Unchanged.
    void AcceptChanges();

    std::string ToDebugString(
        StateManagerDebugStringOptions options = StateManagerDebugStringOptions::LongDefault
    ) const;
};

}

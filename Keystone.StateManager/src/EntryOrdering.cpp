#include "Keystone.StateManager/EntryOrdering.h"
#include "Keystone.StateManager/Errors.h"
#include "Keystone.StateManager/Logging.h"
#include "Keystone.StateManager/ValueComparer.h"

namespace Keystone::StateManager
{

std::weak_ordering EntityEntryComparer::Compare(
    const IUpdateEntry& entry1,
    const IUpdateEntry& entry2
) const
{
    const auto& entityType = entry1.GetEntityType();

    // std::string compares characters as unsigned char, independent of locale.
    auto result = std::weak_ordering(
        entityType.Name() <=> entry2.GetEntityType().Name());
    if (result != 0)
    {
        return result;
    }

    auto primaryKey = entityType.FindPrimaryKey();
    if (!primaryKey)
    {
        return std::weak_ordering::equivalent;
    }

    for (auto keyProperty : primaryKey->Properties())
    {
        if (!keyProperty->Type()->IsLooselyComparable())
        {
            continue;
        }

        try
        {
            result = DefaultValueComparer::Instance().Compare(
                entry1.GetCurrentValue(*keyProperty),
                entry2.GetCurrentValue(*keyProperty));
        }
        catch (const StateManagerException& exception)
        {
            Logging::Logger()->debug(
                "Skipping key property {}.{} in debug order: {}",
                entityType.Name(),
                keyProperty->Name(),
                exception.what());
            continue;
        }

        if (result != 0)
        {
            return result;
        }
    }

    return std::weak_ordering::equivalent;
}

const EntityEntryComparer& EntityEntryComparer::Instance()
{
    static const EntityEntryComparer instance;
    return instance;
}

}

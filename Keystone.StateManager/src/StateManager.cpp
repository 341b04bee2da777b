#include "Keystone.StateManager/StateManager.h"
#include "Keystone.StateManager/EntryOrdering.h"
#include "Keystone.StateManager/Errors.h"
#include <algorithm>
#include <fmt/format.h>

namespace Keystone::StateManager
{

StateManager::StateManager(
    std::shared_ptr<const Model> model)
    :
    m_model(std::move(model))
{}

const Model& StateManager::GetModel() const noexcept
{
    return *m_model;
}

bool StateManager::MatchesState(
    EntityState entityState,
    bool added,
    bool modified,
    bool deleted,
    bool unchanged)
{
    switch (entityState)
    {
    case EntityState::Added:
        return added;
    case EntityState::Modified:
        return modified;
    case EntityState::Deleted:
        return deleted;
    case EntityState::Unchanged:
        return unchanged;
    default:
        return false;
    }
}

InternalEntityEntry& StateManager::StartTracking(
    const EntityType& entityType,
    std::vector<Value> values,
    EntityState entityState)
{
    if (entityState == EntityState::Detached)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::InvalidEntityState,
            fmt::format("Cannot track a Detached {}", entityType.Name()));
    }

    if (&entityType.GetModel() != m_model.get())
    {
        ThrowStateManagerException(
            StateManagerErrorCode::EntityTypeNotFound,
            fmt::format("Entity type {} is not part of this model", entityType.Name()));
    }

    m_entries.push_back(std::make_unique<InternalEntityEntry>(
        entityType,
        std::move(values),
        entityState));

    return *m_entries.back();
}

InternalEntityEntry& StateManager::StartTracking(
    std::string_view entityTypeName,
    std::vector<Value> values,
    EntityState entityState)
{
    auto entityType = m_model->FindEntityType(entityTypeName);
    if (!entityType)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::EntityTypeNotFound,
            fmt::format("Entity type {} not found", entityTypeName));
    }

    return StartTracking(
        *entityType,
        std::move(values),
        entityState);
}

std::unique_ptr<InternalEntityEntry> StateManager::StopTracking(
    const InternalEntityEntry& entry)
{
    auto trackedEntry = std::ranges::find_if(
        m_entries,
        [&](const auto& candidate) { return candidate.get() == &entry; });

    if (trackedEntry == m_entries.end())
    {
        ThrowStateManagerException(
            StateManagerErrorCode::InvalidEntityState,
            fmt::format("The {} entry is not tracked", entry.GetEntityType().Name()));
    }

    auto detachedEntry = std::move(*trackedEntry);
    m_entries.erase(trackedEntry);
    detachedEntry->SetEntityState(EntityState::Detached);
    return detachedEntry;
}

std::vector<InternalEntityEntry*> StateManager::Entries() const
{
    std::vector<InternalEntityEntry*> entries;
    entries.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        entries.push_back(entry.get());
    }
    return entries;
}

size_t StateManager::GetCountForState(
    bool added,
    bool modified,
    bool deleted,
    bool unchanged
) const
{
    return std::ranges::count_if(
        m_entries,
        [&](const auto& entry)
    {
        return MatchesState(
            entry->GetEntityState(),
            added,
            modified,
            deleted,
            unchanged);
    });
}

std::vector<InternalEntityEntry*> StateManager::ToListForState(
    bool added,
    bool modified,
    bool deleted,
    bool unchanged
) const
{
    std::vector<InternalEntityEntry*> entries;
    entries.reserve(GetCountForState(added, modified, deleted, unchanged));

    for (auto entry : GetEntriesForState(added, modified, deleted, unchanged))
    {
        entries.push_back(entry);
    }

    return entries;
}

std::vector<InternalEntityEntry*> StateManager::ToList() const
{
    return ToListForState(
        true,
        true,
        true,
        true);
}

std::string StateManager::ToDebugString(
    StateManagerDebugStringOptions options
) const
{
    std::string debugString;

    for (auto entry : EntryOrdering::ToDebugOrder(Entries()))
    {
        debugString += entry->ToDebugString(options);
        debugString += "\n";
    }

    return debugString;
}

const ICurrentValueComparer& StateManager::GetCurrentValueComparer(
    const Property& property
) const
{
    return m_model->GetCurrentValueComparer(property);
}

}

#pragma once

#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>
#include "EntityEntry.h"
#include "Model.h"

namespace Keystone::StateManager
{

// Tracks entries of the entity types of one model.
class StateManager
{
    std::shared_ptr<const Model> m_model;
    std::vector<std::unique_ptr<InternalEntityEntry>> m_entries;

    static bool MatchesState(
        EntityState entityState,
        bool added,
        bool modified,
        bool deleted,
        bool unchanged);

public:
    explicit StateManager(
        std::shared_ptr<const Model> model);

    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    const Model& GetModel() const noexcept;

    // Start tracking an entity with one value per property, in declaration order.
    // Throws StateManagerException with InvalidEntityState for the Detached state,
    // EntityTypeNotFound for an entity type of another model,
    // and ValueTypeMismatch for values that do not match the properties.
    InternalEntityEntry& StartTracking(
        const EntityType& entityType,
        std::vector<Value> values,
        EntityState entityState = EntityState::Unchanged);

    InternalEntityEntry& StartTracking(
        std::string_view entityTypeName,
        std::vector<Value> values,
        EntityState entityState = EntityState::Unchanged);

    // Stop tracking the entry, which becomes Detached and is returned to the caller.
    std::unique_ptr<InternalEntityEntry> StopTracking(
        const InternalEntityEntry& entry);

    // The tracked entries, in the order tracking started, including entries
    // whose state was set to Detached without calling StopTracking.
    std::vector<InternalEntityEntry*> Entries() const;

    auto GetEntriesForState(
        bool added = false,
        bool modified = false,
        bool deleted = false,
        bool unchanged = false
    ) const
    {
        return m_entries
            | std::views::transform([](const std::unique_ptr<InternalEntityEntry>& entry)
            {
                return entry.get();
            })
            | std::views::filter([=](const InternalEntityEntry* entry)
            {
                return MatchesState(
                    entry->GetEntityState(),
                    added,
                    modified,
                    deleted,
                    unchanged);
            });
    }

    size_t GetCountForState(
        bool added = false,
        bool modified = false,
        bool deleted = false,
        bool unchanged = false
    ) const;

    std::vector<InternalEntityEntry*> ToListForState(
        bool added = false,
        bool modified = false,
        bool deleted = false,
        bool unchanged = false
    ) const;

    std::vector<InternalEntityEntry*> ToList() const;

    // One line per entry, or one block per entry with IncludeProperties,
    // with entries in debug order.
    std::string ToDebugString(
        StateManagerDebugStringOptions options = StateManagerDebugStringOptions::ShortDefault
    ) const;

    const ICurrentValueComparer& GetCurrentValueComparer(
        const Property& property
    ) const;
};

}

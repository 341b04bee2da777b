#pragma once

#include <algorithm>
#include <compare>
#include <concepts>
#include <vector>
#include "EntityEntry.h"

namespace Keystone::StateManager
{

// Orders entries for diagnostic output: by entity type name, compared
// ordinally, then by the current values of the primary key properties
// in declaration order.
//
// Key values are compared with the DefaultValueComparer on the raw current
// values, without the property's converter or cached comparer. Key properties
// whose type cannot be compared loosely are skipped, as are comparisons that
// fail, so Compare never reports an error for an uncomparable key.
//
// A failed comparison is skipped for that pair of entries only. A key type
// that refuses some pairs and accepts others therefore does not give a strict
// weak ordering: the relative order of its entries then depends on the input
// order, though every entry is still returned exactly once.
class EntityEntryComparer
{
public:
    std::weak_ordering Compare(
        const IUpdateEntry& entry1,
        const IUpdateEntry& entry2
    ) const;

    bool operator()(
        const IUpdateEntry* entry1,
        const IUpdateEntry* entry2
        ) const
    {
        return Compare(*entry1, *entry2) < 0;
    }

    static const EntityEntryComparer& Instance();
};

class EntryOrdering
{
public:
    // Sort entries into debug order. Entries that compare equivalent
    // keep their relative order.
    template<
        typename TEntry
    > requires std::derived_from<TEntry, IUpdateEntry>
    static std::vector<TEntry*> ToDebugOrder(
        std::vector<TEntry*> entries)
    {
        std::stable_sort(
            entries.begin(),
            entries.end(),
            EntityEntryComparer::Instance());

        return entries;
    }
};

}

#pragma once

#include <memory>
#include "Keystone.System/load_once_map.h"
#include "Keystone.StateManager/CurrentValueComparer.h"

namespace Keystone::StateManager
{

// The comparers of a model's properties, each built once on first request.
// A failed construction stores nothing, so the next request fails the same way.
class CurrentValueComparerCache
{
    load_once_map<const Property*, std::shared_ptr<const ICurrentValueComparer>> m_comparers;

public:
    const ICurrentValueComparer& GetOrCreate(
        const Property& property);

    const ICurrentValueComparer* Find(
        const Property& property
    ) const;

    size_t Count() const;
};

}

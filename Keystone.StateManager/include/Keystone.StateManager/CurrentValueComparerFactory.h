#pragma once

#include <memory>
#include "CurrentValueComparer.h"
#include "Errors.h"

namespace Keystone::StateManager
{

// Selects the comparison strategy of a property and constructs its comparer.
//
// The property's declared type is tried first, then, if it has no comparison
// capability and the property has a converter, the converter's provider type.
// For each type the strategies are tried in order: native ordering,
// structural comparison, loose comparison. A strategy selected on the provider
// type compares converted values.
//
// Selection depends only on the property, so repeated calls build comparers
// of the same kind. Model::GetCurrentValueComparer caches them.
class CurrentValueComparerFactory
{
public:
    // Fails with TypeNotComparable if neither the declared type nor the
    // provider type offers a comparison capability.
    static OperationResult<std::shared_ptr<const ICurrentValueComparer>> TryCreate(
        const Property& property);

    // Throws StateManagerException with TypeNotComparable if neither the
    // declared type nor the provider type offers a comparison capability.
    static std::shared_ptr<const ICurrentValueComparer> Create(
        const Property& property);
};

}

#pragma once

#include "Value.h"

namespace Keystone::StateManager
{

// The default comparer of loosely-typed values.
// Null sorts before any non-null value, and two nulls are equivalent.
// Otherwise the first value that can compare itself loosely performs the comparison.
// Throws StateManagerException with ValueNotComparable if neither value can.
class DefaultValueComparer : public IValueComparer
{
public:
    std::weak_ordering Compare(
        const Value& value1,
        const Value& value2
    ) const override;

    static const DefaultValueComparer& Instance();
};

// The comparer of structurally-comparable values.
// Sequences are compared element by element over their common length,
// and the first unequal element decides the order. When every common
// element is equivalent, the shorter sequence sorts first.
// Values that are not structurally comparable are compared with the DefaultValueComparer.
class StructuralValueComparer : public IValueComparer
{
public:
    std::weak_ordering Compare(
        const Value& value1,
        const Value& value2
    ) const override;

    static const StructuralValueComparer& Instance();
};

}

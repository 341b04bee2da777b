#include "Keystone.StateManager/ValueComparer.h"
#include "Keystone.StateManager/ValueType.h"
#include "Keystone.StateManager/Errors.h"
#include "Keystone.System/ordering.h"
#include <fmt/format.h>

namespace Keystone::StateManager
{

namespace
{
// Nulls sort first. Returns nullopt if neither value is null.
std::optional<std::weak_ordering> CompareNulls(
    const Value& value1,
    const Value& value2)
{
    auto isNull1 = value1.IsNull();
    auto isNull2 = value2.IsNull();
    if (!isNull1 && !isNull2)
    {
        return {};
    }
    return !isNull1 <=> !isNull2;
}
}

std::weak_ordering DefaultValueComparer::Compare(
    const Value& value1,
    const Value& value2
) const
{
    if (auto nullOrdering = CompareNulls(value1, value2))
    {
        return *nullOrdering;
    }

    if (value1.Type()->IsLooselyComparable())
    {
        return value1.Type()->CompareLoosely(
            value1,
            value2);
    }

    if (value2.Type()->IsLooselyComparable())
    {
        return reverse(value2.Type()->CompareLoosely(
            value2,
            value1));
    }

    ThrowStateManagerException(
        StateManagerErrorCode::ValueNotComparable,
        fmt::format(
            "Values of type {} and {} cannot be compared",
            value1.Type()->Name(),
            value2.Type()->Name()));
}

const DefaultValueComparer& DefaultValueComparer::Instance()
{
    static const DefaultValueComparer instance;
    return instance;
}

std::weak_ordering StructuralValueComparer::Compare(
    const Value& value1,
    const Value& value2
) const
{
    if (auto nullOrdering = CompareNulls(value1, value2))
    {
        return *nullOrdering;
    }

    if (value1.Type()->IsStructuralComparable())
    {
        return value1.Type()->CompareStructurally(
            value1,
            value2,
            *this);
    }

    if (value2.Type()->IsStructuralComparable())
    {
        return reverse(value2.Type()->CompareStructurally(
            value2,
            value1,
            *this));
    }

    return DefaultValueComparer::Instance().Compare(
        value1,
        value2);
}

const StructuralValueComparer& StructuralValueComparer::Instance()
{
    static const StructuralValueComparer instance;
    return instance;
}

}

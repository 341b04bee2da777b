#include "CurrentValueComparerCache.h"
#include "Keystone.StateManager/CurrentValueComparerFactory.h"

namespace Keystone::StateManager
{

const ICurrentValueComparer& CurrentValueComparerCache::GetOrCreate(
    const Property& property)
{
    return *m_comparers.get_or_load(
        &property,
        [](const Property* property)
    {
        return CurrentValueComparerFactory::Create(*property);
    });
}

const ICurrentValueComparer* CurrentValueComparerCache::Find(
    const Property& property
) const
{
    auto comparer = m_comparers.find(&property);
    return comparer
        ? comparer->get()
        : nullptr;
}

size_t CurrentValueComparerCache::Count() const
{
    return m_comparers.size();
}

}

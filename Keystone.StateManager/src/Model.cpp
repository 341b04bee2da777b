#include "Keystone.StateManager/Model.h"
#include "Keystone.StateManager/Errors.h"
#include "CurrentValueComparerCache.h"
#include <algorithm>
#include <functional>
#include <fmt/format.h>

namespace Keystone::StateManager
{

Property::Property(
    std::string name,
    const EntityType* declaringEntityType,
    const ValueType* type,
    std::shared_ptr<const ValueConverter> valueConverter,
    size_t index,
    bool isNullable)
    :
    m_name(std::move(name)),
    m_declaringEntityType(declaringEntityType),
    m_type(type),
    m_valueConverter(std::move(valueConverter)),
    m_index(index),
    m_isNullable(isNullable)
{}

const std::string& Property::Name() const noexcept
{
    return m_name;
}

const EntityType& Property::DeclaringEntityType() const noexcept
{
    return *m_declaringEntityType;
}

const ValueType* Property::Type() const noexcept
{
    return m_type;
}

const ValueConverter* Property::GetValueConverter() const noexcept
{
    return m_valueConverter.get();
}

size_t Property::Index() const noexcept
{
    return m_index;
}

bool Property::IsNullable() const noexcept
{
    return m_isNullable;
}

bool Property::IsPrimaryKey() const noexcept
{
    return m_isPrimaryKey;
}

Key::Key(
    std::vector<const Property*> properties)
    :
    m_properties(std::move(properties))
{}

const std::vector<const Property*>& Key::Properties() const noexcept
{
    return m_properties;
}

EntityType::EntityType(
    std::string name,
    const Model* model)
    :
    m_name(std::move(name)),
    m_model(model)
{}

const std::string& EntityType::Name() const noexcept
{
    return m_name;
}

const Model& EntityType::GetModel() const noexcept
{
    return *m_model;
}

const std::vector<const Property*>& EntityType::GetProperties() const noexcept
{
    return m_propertyPointers;
}

const Property* EntityType::FindProperty(
    std::string_view name
) const
{
    auto property = std::ranges::find(
        m_propertyPointers,
        name,
        &Property::Name);

    return property == m_propertyPointers.end()
        ? nullptr
        : *property;
}

const Key* EntityType::FindPrimaryKey() const noexcept
{
    return m_primaryKey
        ? &*m_primaryKey
        : nullptr;
}

Model::Model()
    :
    m_comparerCache(std::make_unique<CurrentValueComparerCache>())
{}

Model::~Model() = default;

const EntityType* Model::FindEntityType(
    std::string_view name
) const
{
    auto entityType = m_entityTypesByName.find(name);
    return entityType == m_entityTypesByName.end()
        ? nullptr
        : entityType->second;
}

std::vector<const EntityType*> Model::GetEntityTypes() const
{
    std::vector<const EntityType*> entityTypes;
    entityTypes.reserve(m_entityTypes.size());
    for (const auto& entityType : m_entityTypes)
    {
        entityTypes.push_back(entityType.get());
    }

    std::ranges::sort(
        entityTypes,
        std::less<>(),
        &EntityType::Name);

    return entityTypes;
}

const ICurrentValueComparer& Model::GetCurrentValueComparer(
    const Property& property
) const
{
    if (&property.DeclaringEntityType().GetModel() != this)
    {
        ThrowStateManagerException(
            StateManagerErrorCode::PropertyNotFound,
            fmt::format(
                "Property {}.{} does not belong to this model",
                property.DeclaringEntityType().Name(),
                property.Name()));
    }

    return m_comparerCache->GetOrCreate(property);
}

size_t Model::GetCachedComparerCount() const
{
    return m_comparerCache->Count();
}

}

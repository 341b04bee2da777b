#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "Primitives.h"

namespace Keystone::StateManager
{

class CurrentValueComparerCache;

class Property
{
    friend class ModelBuilder;

    std::string m_name;
    const EntityType* m_declaringEntityType;
    const ValueType* m_type;
    std::shared_ptr<const ValueConverter> m_valueConverter;
    size_t m_index;
    bool m_isNullable;
    bool m_isPrimaryKey = false;

public:
    Property(
        std::string name,
        const EntityType* declaringEntityType,
        const ValueType* type,
        std::shared_ptr<const ValueConverter> valueConverter,
        size_t index,
        bool isNullable);

    Property(const Property&) = delete;
    Property& operator=(const Property&) = delete;

    const std::string& Name() const noexcept;
    const EntityType& DeclaringEntityType() const noexcept;

    // The declared type of the property's values.
    const ValueType* Type() const noexcept;

    // The converter from the declared type to the provider type, if any.
    const ValueConverter* GetValueConverter() const noexcept;

    // The position of this property's value in an entry's value storage.
    size_t Index() const noexcept;

    bool IsNullable() const noexcept;
    bool IsPrimaryKey() const noexcept;
};

class Key
{
    std::vector<const Property*> m_properties;

public:
    explicit Key(
        std::vector<const Property*> properties);

    // The key properties, in declaration order.
    const std::vector<const Property*>& Properties() const noexcept;
};

class EntityType
{
    friend class ModelBuilder;

    std::string m_name;
    const Model* m_model;
    std::vector<std::unique_ptr<Property>> m_properties;
    std::vector<const Property*> m_propertyPointers;
    std::optional<Key> m_primaryKey;

public:
    EntityType(
        std::string name,
        const Model* model);

    EntityType(const EntityType&) = delete;
    EntityType& operator=(const EntityType&) = delete;

    const std::string& Name() const noexcept;
    const Model& GetModel() const noexcept;

    // The properties, in declaration order.
    const std::vector<const Property*>& GetProperties() const noexcept;

    const Property* FindProperty(
        std::string_view name
    ) const;

    // Returns nullptr for a keyless entity type.
    const Key* FindPrimaryKey() const noexcept;
};

struct ModelOptions
{
    // Build the comparer of every primary key property while finalizing
    // the model, so that uncomparable key types fail at model-build time.
    bool ValidateKeyComparers = false;
};

class Model
{
    friend class ModelBuilder;

    std::vector<std::unique_ptr<EntityType>> m_entityTypes;
    std::unordered_map<std::string_view, const EntityType*> m_entityTypesByName;
    std::unique_ptr<CurrentValueComparerCache> m_comparerCache;

public:
    Model();
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    const EntityType* FindEntityType(
        std::string_view name
    ) const;

    // The entity types, ordered by name.
    std::vector<const EntityType*> GetEntityTypes() const;

    // Get the comparer of current values of a property of this model.
    // The comparer is built on first request and cached for the lifetime of the model.
    // Throws StateManagerException with TypeNotComparable if the property's type
    // offers no comparison capability.
    const ICurrentValueComparer& GetCurrentValueComparer(
        const Property& property
    ) const;

    // The number of comparers built so far.
    size_t GetCachedComparerCount() const;
};

}

#include "Keystone.StateManager/ModelBuilder.h"
#include "Keystone.StateManager/Errors.h"
#include "Keystone.StateManager/Logging.h"
#include <algorithm>
#include <fmt/format.h>

namespace Keystone::StateManager
{

ModelBuilder::PropertyBuilder::PropertyBuilder(
    std::string name,
    const ValueType* type)
    :
    m_name(std::move(name)),
    m_type(type)
{}

ModelBuilder::PropertyBuilder& ModelBuilder::PropertyBuilder::HasConversion(
    std::shared_ptr<const ValueConverter> valueConverter)
{
    m_valueConverter = std::move(valueConverter);
    return *this;
}

ModelBuilder::PropertyBuilder& ModelBuilder::PropertyBuilder::IsRequired(
    bool isRequired)
{
    m_isRequired = isRequired;
    return *this;
}

ModelBuilder::EntityTypeBuilder::EntityTypeBuilder(
    std::string name)
    :
    m_name(std::move(name))
{}

ModelBuilder::PropertyBuilder& ModelBuilder::EntityTypeBuilder::Property(
    std::string name,
    const ValueType* type)
{
    m_properties.push_back(std::make_unique<PropertyBuilder>(
        std::move(name),
        type));
    return *m_properties.back();
}

ModelBuilder::EntityTypeBuilder& ModelBuilder::EntityTypeBuilder::HasKey(
    std::vector<std::string> propertyNames)
{
    m_keyPropertyNames = std::move(propertyNames);
    return *this;
}

ModelBuilder::EntityTypeBuilder& ModelBuilder::Entity(
    std::string_view name)
{
    for (auto& entityType : m_entityTypes)
    {
        if (entityType->m_name == name)
        {
            return *entityType;
        }
    }

    return AddEntity(std::string(name));
}

ModelBuilder::EntityTypeBuilder& ModelBuilder::AddEntity(
    std::string name)
{
    m_entityTypes.push_back(std::make_unique<EntityTypeBuilder>(
        std::move(name)));
    return *m_entityTypes.back();
}

std::shared_ptr<const Model> ModelBuilder::FinalizeModel(
    ModelOptions options
) const
{
    auto model = std::make_shared<Model>();
    size_t propertyCount = 0;

    for (const auto& entityTypeBuilder : m_entityTypes)
    {
        if (model->m_entityTypesByName.contains(entityTypeBuilder->m_name))
        {
            ThrowStateManagerException(
                StateManagerErrorCode::DuplicateName,
                fmt::format("Duplicate entity type name {}", entityTypeBuilder->m_name));
        }

        auto entityType = std::make_unique<EntityType>(
            entityTypeBuilder->m_name,
            model.get());

        for (const auto& propertyBuilder : entityTypeBuilder->m_properties)
        {
            if (entityType->FindProperty(propertyBuilder->m_name))
            {
                ThrowStateManagerException(
                    StateManagerErrorCode::DuplicateName,
                    fmt::format(
                        "Duplicate property name {}.{}",
                        entityType->Name(),
                        propertyBuilder->m_name));
            }

            const auto& converter = propertyBuilder->m_valueConverter;
            if (converter
                && converter->ModelType() != propertyBuilder->m_type
                && converter->ModelType() != propertyBuilder->m_type->UnwrapNullable())
            {
                ThrowStateManagerException(
                    StateManagerErrorCode::ConverterTypeMismatch,
                    fmt::format(
                        "The converter of {}.{} converts {}, not {}",
                        entityType->Name(),
                        propertyBuilder->m_name,
                        converter->ModelType()->Name(),
                        propertyBuilder->m_type->Name()));
            }

            auto property = std::make_unique<Property>(
                propertyBuilder->m_name,
                entityType.get(),
                propertyBuilder->m_type,
                converter,
                entityType->m_properties.size(),
                propertyBuilder->m_type->IsNullable() && !propertyBuilder->m_isRequired);

            entityType->m_propertyPointers.push_back(property.get());
            entityType->m_properties.push_back(std::move(property));
        }

        if (entityTypeBuilder->m_keyPropertyNames)
        {
            std::vector<const Property*> keyProperties;
            for (const auto& keyPropertyName : *entityTypeBuilder->m_keyPropertyNames)
            {
                auto keyPropertyIterator = std::ranges::find(
                    entityType->m_properties,
                    keyPropertyName,
                    &Property::Name);
                if (keyPropertyIterator == entityType->m_properties.end())
                {
                    ThrowStateManagerException(
                        StateManagerErrorCode::PropertyNotFound,
                        fmt::format(
                            "Key property {}.{} not found",
                            entityType->Name(),
                            keyPropertyName));
                }
                if (std::ranges::find(keyProperties, keyPropertyIterator->get()) != keyProperties.end())
                {
                    ThrowStateManagerException(
                        StateManagerErrorCode::DuplicateName,
                        fmt::format(
                            "Duplicate key property {}.{}",
                            entityType->Name(),
                            keyPropertyName));
                }

                auto keyProperty = keyPropertyIterator->get();
                keyProperty->m_isPrimaryKey = true;
                keyProperties.push_back(keyProperty);
            }

            if (!keyProperties.empty())
            {
                entityType->m_primaryKey.emplace(std::move(keyProperties));
            }
        }

        propertyCount += entityType->m_properties.size();
        model->m_entityTypesByName.emplace(entityType->Name(), entityType.get());
        model->m_entityTypes.push_back(std::move(entityType));
    }

    if (options.ValidateKeyComparers)
    {
        for (const auto& entityType : model->m_entityTypes)
        {
            if (auto primaryKey = entityType->FindPrimaryKey())
            {
                for (auto keyProperty : primaryKey->Properties())
                {
                    model->GetCurrentValueComparer(*keyProperty);
                }
            }
        }
    }

    Logging::Logger()->info(
        "Finalized model with {} entity types and {} properties",
        model->m_entityTypes.size(),
        propertyCount);

    return model;
}

}

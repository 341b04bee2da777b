#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Model.h"
#include "ValueConverter.h"
#include "ValueType.h"

namespace Keystone::StateManager
{

// Fluent construction of a Model.
//
//     ModelBuilder builder;
//     builder.Entity("Order").Property<int32_t>("Id");
//     builder.Entity("Order").HasKey({ "Id" });
//     auto model = builder.FinalizeModel();
//
// Names are validated when the model is finalized.
class ModelBuilder
{
public:
    class PropertyBuilder
    {
        friend class ModelBuilder;

        std::string m_name;
        const ValueType* m_type;
        std::shared_ptr<const ValueConverter> m_valueConverter;
        bool m_isRequired = false;

    public:
        PropertyBuilder(
            std::string name,
            const ValueType* type);

        // Compare and store the property's values through a converter.
        // The converter's model type must be the property's type
        // or, for a nullable property, its unwrapped type.
        PropertyBuilder& HasConversion(
            std::shared_ptr<const ValueConverter> valueConverter);

        // A required property of nullable type does not accept null values.
        PropertyBuilder& IsRequired(
            bool isRequired = true);
    };

    class EntityTypeBuilder
    {
        friend class ModelBuilder;

        std::string m_name;
        std::vector<std::unique_ptr<PropertyBuilder>> m_properties;
        std::optional<std::vector<std::string>> m_keyPropertyNames;

    public:
        explicit EntityTypeBuilder(
            std::string name);

        PropertyBuilder& Property(
            std::string name,
            const ValueType* type);

        template<
            typename T
        > PropertyBuilder& Property(
            std::string name)
        {
            return Property(
                std::move(name),
                ValueType::Of<T>());
        }

        // Declare the primary key, its properties in comparison order.
        EntityTypeBuilder& HasKey(
            std::vector<std::string> propertyNames);
    };

private:
    std::vector<std::unique_ptr<EntityTypeBuilder>> m_entityTypes;

public:
    // Get the builder of the named entity type, adding it on first use.
    EntityTypeBuilder& Entity(
        std::string_view name);

    // Add a new entity type builder, even if the name is already in use.
    // Finalizing then fails with DuplicateName.
    EntityTypeBuilder& AddEntity(
        std::string name);

    // Build the model. Throws StateManagerException with
    // DuplicateName, PropertyNotFound or ConverterTypeMismatch for an
    // invalid model, and with TypeNotComparable when
    // options.ValidateKeyComparers is set and a key property cannot be compared.
    std::shared_ptr<const Model> FinalizeModel(
        ModelOptions options = {}
    ) const;
};

}

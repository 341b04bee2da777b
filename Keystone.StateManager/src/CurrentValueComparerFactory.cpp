#include "Keystone.StateManager/CurrentValueComparerFactory.h"
#include "Keystone.StateManager/Logging.h"
#include "Keystone.StateManager/Model.h"
#include "Keystone.StateManager/ValueConverter.h"
#include <fmt/format.h>

namespace Keystone::StateManager
{

namespace
{
enum class ComparisonStrategy
{
    None,
    Generic,
    Structural,
    Loose,
};

ComparisonStrategy SelectStrategy(
    const ValueType* valueType)
{
    if (valueType->IsGenericComparable()
        || valueType->UnwrapNullable()->IsGenericComparable()
        || valueType->IsEnum())
    {
        return ComparisonStrategy::Generic;
    }

    if (valueType->IsStructuralComparable())
    {
        return ComparisonStrategy::Structural;
    }

    if (valueType->IsLooselyComparable())
    {
        return ComparisonStrategy::Loose;
    }

    return ComparisonStrategy::None;
}

std::shared_ptr<const ICurrentValueComparer> CreateForModelType(
    const Property& property)
{
    switch (SelectStrategy(property.Type()))
    {
    case ComparisonStrategy::Generic:
        return property.Type()->CreateCurrentValueComparer(property);
    case ComparisonStrategy::Structural:
        return std::make_shared<StructuralCurrentValueComparer>(property);
    case ComparisonStrategy::Loose:
        return std::make_shared<CurrentValueComparer>(property);
    case ComparisonStrategy::None:
        break;
    }
    return nullptr;
}

std::shared_ptr<const ICurrentValueComparer> CreateForProviderType(
    const Property& property,
    const ValueConverter& converter)
{
    switch (SelectStrategy(converter.ProviderType()))
    {
    case ComparisonStrategy::Generic:
        return converter.CreateCurrentValueComparer(property);
    case ComparisonStrategy::Structural:
        return std::make_shared<ConvertedStructuralCurrentValueComparer>(property, converter);
    case ComparisonStrategy::Loose:
        return std::make_shared<ConvertedCurrentValueComparer>(property, converter);
    case ComparisonStrategy::None:
        break;
    }
    return nullptr;
}
}

OperationResult<std::shared_ptr<const ICurrentValueComparer>> CurrentValueComparerFactory::TryCreate(
    const Property& property)
{
    auto comparer = CreateForModelType(property);

    auto converter = property.GetValueConverter();
    if (!comparer && converter)
    {
        comparer = CreateForProviderType(
            property,
            *converter);
    }

    const auto& entityTypeName = property.DeclaringEntityType().Name();

    if (!comparer)
    {
        Logging::Logger()->warn(
            "No comparison capability for {}.{}: type {}{}",
            entityTypeName,
            property.Name(),
            property.Type()->Name(),
            converter
                ? fmt::format(", provider type {}", converter->ProviderType()->Name())
                : std::string());

        return std::unexpected
        {
            MakeFailedResult(
                StateManagerErrorCode::TypeNotComparable,
                fmt::format(
                    "Type not comparable: {}.{} ({})",
                    entityTypeName,
                    property.Name(),
                    property.Type()->Name())),
        };
    }

    Logging::Logger()->debug(
        "Comparer for {}.{} ({}): {}",
        entityTypeName,
        property.Name(),
        property.Type()->Name(),
        ToString(comparer->Kind()));

    return comparer;
}

std::shared_ptr<const ICurrentValueComparer> CurrentValueComparerFactory::Create(
    const Property& property)
{
    return throw_if_failed(TryCreate(property));
}

}

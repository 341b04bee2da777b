#pragma once

#include <functional>
#include <memory>
#include <string>
#include "CurrentValueComparer.h"
#include "ValueType.h"

namespace Keystone::StateManager
{

// Converts values between a property's model type and the type
// the provider stores and compares.
class ValueConverter
{
public:
    virtual ~ValueConverter() = default;

    virtual const ValueType* ModelType() const noexcept = 0;

    virtual const ValueType* ProviderType() const noexcept = 0;

    // Null converts to null without invoking the conversion.
    virtual Value ConvertToProvider(
        const Value& modelValue
    ) const = 0;

    // Null converts to null without invoking the conversion.
    virtual Value ConvertFromProvider(
        const Value& providerValue
    ) const = 0;

    // Construct a comparer that converts current values of the property
    // and compares them with the provider type's native ordering.
    // Returns nullptr if the provider type has no native ordering.
    virtual std::shared_ptr<const ICurrentValueComparer> CreateCurrentValueComparer(
        const Property& property
    ) const = 0;
};

template<
    typename TModel,
    typename TProvider
> class TypedValueConverter : public ValueConverter
{
    std::function<TProvider(const TModel&)> m_convertToProvider;
    std::function<TModel(const TProvider&)> m_convertFromProvider;

public:
    TypedValueConverter(
        std::function<TProvider(const TModel&)> convertToProvider,
        std::function<TModel(const TProvider&)> convertFromProvider
    ) :
        m_convertToProvider(std::move(convertToProvider)),
        m_convertFromProvider(std::move(convertFromProvider))
    {}

    const ValueType* ModelType() const noexcept override
    {
        return ValueType::Of<TModel>();
    }

    const ValueType* ProviderType() const noexcept override
    {
        return ValueType::Of<TProvider>();
    }

    TProvider ConvertToProviderTyped(
        const TModel& modelValue
    ) const
    {
        return m_convertToProvider(modelValue);
    }

    TModel ConvertFromProviderTyped(
        const TProvider& providerValue
    ) const
    {
        return m_convertFromProvider(providerValue);
    }

    Value ConvertToProvider(
        const Value& modelValue
    ) const override
    {
        if (modelValue.IsNull())
        {
            return Value();
        }
        return Value(ConvertToProviderTyped(modelValue.Get<TModel>()));
    }

    Value ConvertFromProvider(
        const Value& providerValue
    ) const override
    {
        if (providerValue.IsNull())
        {
            return Value();
        }
        return Value(ConvertFromProviderTyped(providerValue.Get<TProvider>()));
    }

    std::shared_ptr<const ICurrentValueComparer> CreateCurrentValueComparer(
        const Property& property
    ) const override
    {
        if constexpr (GenericComparable<TProvider>)
        {
            return std::make_shared<ConvertedTypedCurrentValueComparer<TModel, TProvider>>(
                property,
                *this);
        }
        else
        {
            return nullptr;
        }
    }
};

template<
    typename TModel,
    typename TProvider
> std::shared_ptr<const ValueConverter> MakeValueConverter(
    std::function<TProvider(const TModel&)> convertToProvider,
    std::function<TModel(const TProvider&)> convertFromProvider)
{
    return std::make_shared<TypedValueConverter<TModel, TProvider>>(
        std::move(convertToProvider),
        std::move(convertFromProvider));
}

}

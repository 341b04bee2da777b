#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include "Errors.h"
#include "ValueConverter.h"
#include "ValueType.h"

namespace Keystone::StateManager
{

// Maps type names used in model description files to value types,
// and parses literals of those types.
//
// The built-in names are int32, int64, uint32, uint64, float, double,
// bool, string and bytes. A name followed by '?' refers to the
// nullable form of the type.
class ValueTypeRegistry
{
public:
    using LiteralParser = std::function<OperationResult<Value>(std::string_view literal)>;

private:
    struct Registration
    {
        const ValueType* Type;
        const ValueType* NullableType;
        LiteralParser Parser;
    };

    std::unordered_map<std::string, Registration> m_registrationsByName;
    std::unordered_map<const ValueType*, const Registration*> m_registrationsByType;

    void Register(
        std::string name,
        const ValueType* type,
        const ValueType* nullableType,
        LiteralParser parser);

public:
    ValueTypeRegistry();

    ValueTypeRegistry(const ValueTypeRegistry&) = delete;
    ValueTypeRegistry& operator=(const ValueTypeRegistry&) = delete;

    // Register T, and std::optional<T> as name?, replacing any
    // previous registration of the name. Without a parser,
    // literals of the type cannot be parsed.
    template<
        typename T
    > void Register(
        std::string name,
        LiteralParser parser = nullptr)
    {
        Register(
            std::move(name),
            ValueType::Of<T>(),
            ValueType::Of<std::optional<T>>(),
            std::move(parser));
    }

    const ValueType* FindType(
        std::string_view name
    ) const;

    // Parse a literal of the type or of its unwrapped type.
    // The result holds the unwrapped type.
    OperationResult<Value> ParseLiteral(
        const ValueType* type,
        std::string_view literal
    ) const;

    static const ValueTypeRegistry& Default();
};

// Maps converter names used in model description files to converters.
//
// The built-in converters are bool_to_int32, mapping false and true to 0 and 1,
// and string_to_bytes, mapping a string to its characters' bytes.
class ValueConverterRegistry
{
    std::unordered_map<std::string, std::shared_ptr<const ValueConverter>> m_converters;

public:
    ValueConverterRegistry();

    ValueConverterRegistry(const ValueConverterRegistry&) = delete;
    ValueConverterRegistry& operator=(const ValueConverterRegistry&) = delete;

    void Register(
        std::string name,
        std::shared_ptr<const ValueConverter> converter);

    std::shared_ptr<const ValueConverter> Find(
        std::string_view name
    ) const;

    static const ValueConverterRegistry& Default();
};

}

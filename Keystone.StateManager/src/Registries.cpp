#include "Keystone.StateManager/Registries.h"
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fmt/format.h>

namespace Keystone::StateManager
{

namespace
{
std::unexpected<FailedResult> MakeInvalidLiteral(
    std::string_view typeName,
    std::string_view literal)
{
    return std::unexpected
    {
        MakeFailedResult(
            StateManagerErrorCode::InvalidLiteral,
            fmt::format("'{}' is not a valid {} literal", literal, typeName)),
    };
}

template<
    typename T
> ValueTypeRegistry::LiteralParser MakeNumberParser()
{
    return [](std::string_view literal) -> OperationResult<Value>
    {
        T value{};
        auto end = literal.data() + literal.size();
        auto [pointer, error] = std::from_chars(
            literal.data(),
            end,
            value);

        if (error != std::errc() || pointer != end)
        {
            return MakeInvalidLiteral(ValueTypeName<T>::Get(), literal);
        }
        return Value(value);
    };
}

OperationResult<Value> ParseBool(
    std::string_view literal)
{
    if (literal == "true")
    {
        return Value(true);
    }
    if (literal == "false")
    {
        return Value(false);
    }
    return MakeInvalidLiteral("bool", literal);
}

OperationResult<Value> ParseString(
    std::string_view literal)
{
    return Value(std::string(literal));
}

// Hex digit pairs, optionally prefixed with 0x and separated by whitespace.
OperationResult<Value> ParseBytes(
    std::string_view literal)
{
    std::string digits;
    for (auto character : literal)
    {
        if (!std::isspace(static_cast<unsigned char>(character)))
        {
            digits += character;
        }
    }

    std::string_view hex = digits;
    if (hex.starts_with("0x") || hex.starts_with("0X"))
    {
        hex.remove_prefix(2);
    }

    if (hex.size() % 2 != 0)
    {
        return MakeInvalidLiteral("bytes", literal);
    }

    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t index = 0; index < hex.size(); index += 2)
    {
        std::uint8_t byte = 0;
        auto end = hex.data() + index + 2;
        auto [pointer, error] = std::from_chars(
            hex.data() + index,
            end,
            byte,
            16);

        if (error != std::errc() || pointer != end)
        {
            return MakeInvalidLiteral("bytes", literal);
        }
        bytes.push_back(byte);
    }

    return Value(std::move(bytes));
}
}

ValueTypeRegistry::ValueTypeRegistry()
{
    Register<std::int32_t>("int32", MakeNumberParser<std::int32_t>());
    Register<std::int64_t>("int64", MakeNumberParser<std::int64_t>());
    Register<std::uint32_t>("uint32", MakeNumberParser<std::uint32_t>());
    Register<std::uint64_t>("uint64", MakeNumberParser<std::uint64_t>());
    Register<float>("float", MakeNumberParser<float>());
    Register<double>("double", MakeNumberParser<double>());
    Register<bool>("bool", &ParseBool);
    Register<std::string>("string", &ParseString);
    Register<Bytes>("bytes", &ParseBytes);
}

void ValueTypeRegistry::Register(
    std::string name,
    const ValueType* type,
    const ValueType* nullableType,
    LiteralParser parser)
{
    if (auto existing = m_registrationsByName.find(name);
        existing != m_registrationsByName.end())
    {
        m_registrationsByType.erase(existing->second.Type);
        m_registrationsByType.erase(existing->second.NullableType);
    }

    auto& registration = m_registrationsByName[std::move(name)];
    registration = Registration
    {
        .Type = type,
        .NullableType = nullableType,
        .Parser = std::move(parser),
    };

    m_registrationsByType[type] = &registration;
    m_registrationsByType[nullableType] = &registration;
}

const ValueType* ValueTypeRegistry::FindType(
    std::string_view name
) const
{
    bool isNullable = name.ends_with('?');
    if (isNullable)
    {
        name.remove_suffix(1);
    }

    auto registration = m_registrationsByName.find(std::string(name));
    if (registration == m_registrationsByName.end())
    {
        return nullptr;
    }

    return isNullable
        ? registration->second.NullableType
        : registration->second.Type;
}

OperationResult<Value> ValueTypeRegistry::ParseLiteral(
    const ValueType* type,
    std::string_view literal
) const
{
    auto registration = m_registrationsByType.find(type);
    if (registration == m_registrationsByType.end()
        || !registration->second->Parser)
    {
        return std::unexpected
        {
            MakeFailedResult(
                StateManagerErrorCode::InvalidLiteral,
                fmt::format("Literals of type {} cannot be parsed", type->Name())),
        };
    }

    return registration->second->Parser(literal);
}

const ValueTypeRegistry& ValueTypeRegistry::Default()
{
    static const ValueTypeRegistry registry;
    return registry;
}

ValueConverterRegistry::ValueConverterRegistry()
{
    Register(
        "bool_to_int32",
        MakeValueConverter<bool, std::int32_t>(
            [](const bool& value) { return value ? 1 : 0; },
            [](const std::int32_t& value) { return value != 0; }));

    Register(
        "string_to_bytes",
        MakeValueConverter<std::string, Bytes>(
            [](const std::string& value) { return Bytes(value.begin(), value.end()); },
            [](const Bytes& value) { return std::string(value.begin(), value.end()); }));
}

void ValueConverterRegistry::Register(
    std::string name,
    std::shared_ptr<const ValueConverter> converter)
{
    m_converters[std::move(name)] = std::move(converter);
}

std::shared_ptr<const ValueConverter> ValueConverterRegistry::Find(
    std::string_view name
) const
{
    auto converter = m_converters.find(std::string(name));
    return converter == m_converters.end()
        ? nullptr
        : converter->second;
}

const ValueConverterRegistry& ValueConverterRegistry::Default()
{
    static const ValueConverterRegistry registry;
    return registry;
}

}

#pragma once

#include <compare>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "Keystone.StateManager/Keystone.StateManager.h"

namespace Keystone::StateManager
{

enum class Color
{
    Red = 1,
    Green = 2,
    Blue = 3,
};

// Ordered by its native operator<=>.
struct GenericComparableKey
{
    static constexpr std::string_view TypeName = "GenericComparableKey";

    std::int32_t Id;

    auto operator<=>(const GenericComparableKey&) const = default;
};

// Ordered only against loosely-typed values.
struct LooselyComparableKey
{
    static constexpr std::string_view TypeName = "LooselyComparableKey";

    std::int32_t Id;

    std::weak_ordering CompareTo(
        const Value& other
    ) const
    {
        return Id <=> other.As<LooselyComparableKey>().Id;
    }

    std::string ToString() const
    {
        return "#" + std::to_string(Id);
    }
};

// Ordered element by element with the comparer it is given.
struct StructuralComparableKey
{
    static constexpr std::string_view TypeName = "StructuralComparableKey";

    std::vector<std::int32_t> Parts;

    std::weak_ordering CompareTo(
        const Value& other,
        const IValueComparer& comparer
    ) const
    {
        const auto& otherParts = other.As<StructuralComparableKey>().Parts;
        for (size_t index = 0; index < Parts.size() && index < otherParts.size(); ++index)
        {
            auto result = comparer.Compare(Value(Parts[index]), Value(otherParts[index]));
            if (result != 0)
            {
                return result;
            }
        }
        return Parts.size() <=> otherParts.size();
    }
};

// No comparison capability.
struct NonComparableKey
{
    std::int32_t Id;
};

// No comparison capability.
struct OtherNonComparableKey
{
    static constexpr std::string_view TypeName = "OtherNonComparableKey";

    std::int32_t Id;
};

inline std::shared_ptr<const ValueConverter> MakeNonComparableToInt32Converter()
{
    return MakeValueConverter<NonComparableKey, std::int32_t>(
        [](const NonComparableKey& key) { return key.Id; },
        [](const std::int32_t& id) { return NonComparableKey{ id }; });
}

// Reverses the order of ids.
inline std::shared_ptr<const ValueConverter> MakeNonComparableToNegatedInt64Converter()
{
    return MakeValueConverter<NonComparableKey, std::int64_t>(
        [](const NonComparableKey& key) { return -static_cast<std::int64_t>(key.Id); },
        [](const std::int64_t& id) { return NonComparableKey{ static_cast<std::int32_t>(-id) }; });
}

// Big-endian bytes of the id, so that byte order matches id order for non-negative ids.
inline std::shared_ptr<const ValueConverter> MakeNonComparableToBytesConverter()
{
    return MakeValueConverter<NonComparableKey, Bytes>(
        [](const NonComparableKey& key)
        {
            auto id = static_cast<std::uint32_t>(key.Id);
            return Bytes
            {
                static_cast<std::uint8_t>(id >> 24),
                static_cast<std::uint8_t>(id >> 16),
                static_cast<std::uint8_t>(id >> 8),
                static_cast<std::uint8_t>(id),
            };
        },
        [](const Bytes& bytes)
        {
            std::uint32_t id = 0;
            for (auto byte : bytes)
            {
                id = (id << 8) | byte;
            }
            return NonComparableKey{ static_cast<std::int32_t>(id) };
        });
}

inline std::shared_ptr<const ValueConverter> MakeNonComparableToLooselyComparableConverter()
{
    return MakeValueConverter<NonComparableKey, LooselyComparableKey>(
        [](const NonComparableKey& key) { return LooselyComparableKey{ key.Id }; },
        [](const LooselyComparableKey& key) { return NonComparableKey{ key.Id }; });
}

inline std::shared_ptr<const ValueConverter> MakeNonComparableToOtherNonComparableConverter()
{
    return MakeValueConverter<NonComparableKey, OtherNonComparableKey>(
        [](const NonComparableKey& key) { return OtherNonComparableKey{ key.Id }; },
        [](const OtherNonComparableKey& key) { return NonComparableKey{ key.Id }; });
}

inline std::shared_ptr<const ValueConverter> MakeThrowingConverter()
{
    return MakeValueConverter<NonComparableKey, std::int32_t>(
        [](const NonComparableKey&) -> std::int32_t { throw std::runtime_error("conversion failed"); },
        [](const std::int32_t& id) { return NonComparableKey{ id }; });
}

}

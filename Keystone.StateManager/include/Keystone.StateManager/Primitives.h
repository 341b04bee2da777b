#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Keystone::StateManager
{

typedef std::vector<std::uint8_t> Bytes;

enum class EntityState
{
    Detached = 0,
    Unchanged = 1,
    Deleted = 2,
    Modified = 3,
    Added = 4,
};

std::string_view ToString(
    EntityState entityState);

enum class StateManagerDebugStringOptions
{
    IncludeProperties = 0x1,

    ShortDefault = 0,
    LongDefault = IncludeProperties,
};

constexpr StateManagerDebugStringOptions operator|(
    StateManagerDebugStringOptions left,
    StateManagerDebugStringOptions right)
{
    using underlying_type = std::underlying_type_t<StateManagerDebugStringOptions>;
    return static_cast<StateManagerDebugStringOptions>(
        static_cast<underlying_type>(left) | static_cast<underlying_type>(right));
}

constexpr bool HasFlag(
    StateManagerDebugStringOptions options,
    StateManagerDebugStringOptions flag)
{
    using underlying_type = std::underlying_type_t<StateManagerDebugStringOptions>;
    return (static_cast<underlying_type>(options) & static_cast<underlying_type>(flag)) != 0;
}

class Value;
class ValueType;
class IValueComparer;
class ValueConverter;
class Property;
class Key;
class EntityType;
class Model;
class IUpdateEntry;
class InternalEntityEntry;
class ICurrentValueComparer;
class StateManager;

}

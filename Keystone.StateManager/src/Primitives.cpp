#include "Keystone.StateManager/Primitives.h"

namespace Keystone::StateManager
{

std::string_view ToString(
    EntityState entityState)
{
    switch (entityState)
    {
    case EntityState::Detached:
        return "Detached";
    case EntityState::Unchanged:
        return "Unchanged";
    case EntityState::Deleted:
        return "Deleted";
    case EntityState::Modified:
        return "Modified";
    case EntityState::Added:
        return "Added";
    }
    return "Unknown";
}

}

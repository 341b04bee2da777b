#pragma once

#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace Keystone::StateManager::Logging
{

constexpr std::string_view LoggerName = "keystone.statemanager";

// The logger of the state manager. A host can route the output by
// registering its own spdlog logger under LoggerName before first use;
// otherwise a color console logger is created.
const std::shared_ptr<spdlog::logger>& Logger();

void SetLevel(
    spdlog::level::level_enum level);

}

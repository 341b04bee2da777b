#include "Keystone.StateManager/Logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Keystone::StateManager::Logging
{

static std::shared_ptr<spdlog::logger> MakeLogger()
{
    std::string name(LoggerName);
    if (auto registered = spdlog::get(name))
    {
        return registered;
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_color_mode(spdlog::color_mode::automatic);

    auto logger = std::make_shared<spdlog::logger>(
        name,
        std::move(sink));
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

const std::shared_ptr<spdlog::logger>& Logger()
{
    static const std::shared_ptr<spdlog::logger> logger = MakeLogger();
    return logger;
}

void SetLevel(
    spdlog::level::level_enum level)
{
    Logger()->set_level(level);
}

}

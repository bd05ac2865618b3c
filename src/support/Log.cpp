// =============================================================================
// AutoFrame — Logging
// =============================================================================

#include "autoframe/support/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace AutoFrame
{

static constexpr const char* kLoggerName = "autoframe";

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance;
    static std::once_flag once;
    std::call_once(once, [] {
        try
        {
            instance = spdlog::get(kLoggerName);
            if (!instance)
                instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex&)
        {
            instance = spdlog::default_logger();
        }
    });
    return instance;
}

void setLogLevel(const char* levelName)
{
    auto level = spdlog::level::from_str(levelName ? levelName : "info");
    // from_str maps unknown names to off; treat those as info instead
    if (level == spdlog::level::off && std::string(levelName ? levelName : "") != "off")
        level = spdlog::level::info;
    logger()->set_level(level);
}

} // namespace AutoFrame

#include "cdplan/common/logging.hpp"
#include "cdplan/common/pipeline_errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cdplan
{

void configure_logging(const std::string& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off")
    {
        throw ConfigurationError("Unknown log level '" + level + "'");
    }

    // Standard output carries the plan.
    auto logger = spdlog::get("cdplan");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("cdplan");
    }
    spdlog::set_default_logger(logger);

    spdlog::set_level(parsed);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace cdplan

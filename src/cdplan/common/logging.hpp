/**
 * @file logging.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"

namespace cdplan
{

/**
 * @brief Set the level and pattern of the default spdlog logger.
 * @param level One of trace, debug, info, warn, error, critical, off.
 * @throw ConfigurationError for an unknown level name.
 */
void configure_logging(const std::string& level);

} // namespace cdplan

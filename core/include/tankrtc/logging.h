#pragma once

/**
 * @file logging.h
 * @brief Shared spdlog logger for the SDK
 */

#include <memory>

#include <spdlog/spdlog.h>

namespace tankrtc
{

/**
 * @brief Get the "tankrtc" logger, creating it on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Apply the debug flag from the session configuration
 * @param debug True for debug level, false for info
 */
void configure_logging(bool debug);

}  // namespace tankrtc

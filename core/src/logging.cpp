/**
 * @file logging.cpp
 * @brief Logger setup
 */

#include "tankrtc/logging.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tankrtc
{

namespace
{
constexpr const char* kLoggerName = "tankrtc";
}

std::shared_ptr<spdlog::logger> logger()
{
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;

  std::call_once(once,
                 []()
                 {
                   instance = spdlog::get(kLoggerName);
                   if (!instance)
                   {
                     instance = spdlog::stdout_color_mt(kLoggerName);
                   }
                   instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                 });
  return instance;
}

void configure_logging(bool debug)
{
  logger()->set_level(debug ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace tankrtc

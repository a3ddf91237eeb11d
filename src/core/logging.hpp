#pragma once

#include "configuration.hpp"

namespace recycling::core {

// Pattern applied to every sink
inline constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

/**
 * @brief Install the default spdlog logger from system configuration
 *
 * Logs to the console, and to `log_file` as well when it is set.
 *
 * @throws std::runtime_error if the level is invalid or the file cannot be opened
 */
void configure_logging(const SystemConfig& config);

}  // namespace recycling::core

#pragma once

#include <optional>
#include <string>
#include <spdlog/common.h>

namespace image_mcp {

/**
 * @brief Map a level name (trace, debug, info, warn, error, critical)
 * @return std::nullopt for an unknown name
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * @brief Install the process-wide default logger
 *
 * Logs go to stderr so they never mix with protocol output on stdout.
 * When log_file is non-empty the same records are also appended there.
 */
void init_logging(spdlog::level::level_enum level, const std::string& log_file = "");

} // namespace image_mcp

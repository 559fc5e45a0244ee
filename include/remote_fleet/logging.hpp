// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. Components fetch the
// handle once at construction and emit structured JSON payloads through it.
// Free text that ends up inside those payloads (remote error messages, command
// lines, paths) goes through json_escape first.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace remote_fleet {

/** @brief Where and how much the rotating file sink writes. */
struct LogSettings final {
    std::string directory{"logs"};
    std::string file_name{"remote_fleet.log"};
    std::size_t max_file_bytes{10 * 1024 * 1024};   /**< Size at which the file rotates. */
    std::size_t max_files{5};                       /**< Rotated files kept besides the live one. */
};

/**
 * @brief Create the shared logger on first call; later calls return it unchanged.
 *
 * Throws std::runtime_error when the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings);

/** @brief Same as above with default rotation settings under @p log_directory. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Throws std::runtime_error before initialize_logger() has run. */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Apply an spdlog level name such as "debug" or "warn".
 *
 * Unknown names leave the level at info and return false.
 */
bool set_log_level(const std::string& str_level);

/** @brief Escape @p text for embedding inside a JSON string literal. */
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace remote_fleet

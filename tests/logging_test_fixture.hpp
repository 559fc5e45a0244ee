#pragma once

#include "remote_fleet/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>

namespace remote_fleet::test {

/**
 * @brief Initialize the shared logger once for the whole test binary.
 *
 * Logs go to a small rotating file under the temp directory. The level
 * defaults to warn; REMOTE_FLEET_TEST_LOG_LEVEL overrides it.
 */
inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        LogSettings settings{};
        settings.directory = (std::filesystem::temp_directory_path() / "remote_fleet_tests_logs").string();
        settings.file_name = "remote_fleet_tests.log";
        settings.max_files = 1;
        auto logger = remote_fleet::initialize_logger(settings);
        const char* raw_level = std::getenv("REMOTE_FLEET_TEST_LOG_LEVEL");
        remote_fleet::set_log_level(raw_level != nullptr ? raw_level : "warn");
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace remote_fleet::test

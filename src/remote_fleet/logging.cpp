#include "remote_fleet/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace remote_fleet {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr char k_logger_name[] = "remote_fleet";
constexpr char k_file_pattern[] = R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})";
constexpr char k_console_pattern[] = "[%H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger> build_logger(const LogSettings& settings) {
    if (settings.file_name.empty() || settings.max_file_bytes == 0) {
        throw std::runtime_error("Log file name and rotation size must be set");
    }
    const std::filesystem::path path_log_dir{settings.directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error(
            fmt::format("Unable to create log directory at {}: {}", path_log_dir.string(), error_directory.message())
        );
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(k_console_pattern);
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / settings.file_name).string(),
        settings.max_file_bytes,
        settings.max_files
    );
    file_sink->set_pattern(k_file_pattern);

    spdlog::sinks_init_list sinks{console_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings) {
    std::call_once(logger_once_flag, [&settings]() { shared_logger = build_logger(settings); });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    LogSettings settings{};
    settings.directory = log_directory;
    return initialize_logger(settings);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

bool set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return false;
    }
    // from_str maps unknown names to off
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", json_escape(str_level));
        shared_logger->set_level(spdlog::level::info);
        return false;
    }
    shared_logger->set_level(level);
    return true;
}

std::string json_escape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char character : text) {
        switch (character) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(character)));
                } else {
                    escaped += character;
                }
        }
    }
    return escaped;
}

}  // namespace remote_fleet

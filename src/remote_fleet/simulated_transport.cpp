#include "remote_fleet/simulated_transport.hpp"

#include <fstream>
#include <thread>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
constexpr int k_simulated_failure_exit_code{1};
constexpr char k_simulated_failure_message[] = "Command failed (simulated)";

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

/**
 * @brief Text following the first `echo` token, with one layer of quotes removed.
 */
std::string echo_argument(const std::string& command) {
    const std::size_t position = command.find("echo");
    std::string argument = command.substr(position + 4);
    const std::size_t first = argument.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    argument = argument.substr(first);
    const std::size_t last = argument.find_last_not_of(' ');
    argument = argument.substr(0, last + 1);
    if (argument.size() >= 2) {
        const char front = argument.front();
        if ((front == '\'' || front == '"') && argument.back() == front) {
            argument = argument.substr(1, argument.size() - 2);
        }
    }
    return argument;
}
}  // namespace

SimulatedTransport::SimulatedTransport(TargetConfig target, SimulatedTransportOptions options)
    : target_(std::move(target)),
      options_(options),
      logger_(get_logger()) {}

void SimulatedTransport::connect(Duration timeout) {
    if (options_.connect_latency > timeout) {
        std::this_thread::sleep_for(to_steady_duration(timeout));
        throw ConnectionError(fmt::format("connection to {} timed out after {}s",
                                          connection_string(target_),
                                          timeout.count()));
    }
    std::this_thread::sleep_for(to_steady_duration(options_.connect_latency));

    std::scoped_lock lock(mutex_);
    if (target_.host.empty() || target_.username.empty()) {
        throw ConnectionError("invalid connection parameters");
    }
    flag_connected_ = true;
    last_activity_ = SteadyClock::now();
    logger_->debug("Simulated session opened to {}", connection_string(target_));
}

ExecutionResult SimulatedTransport::execute(const std::string& command) {
    const TimePoint started_at = SteadyClock::now();
    {
        std::scoped_lock lock(mutex_);
        require_connected("execute");
        last_activity_ = started_at;
    }

    std::this_thread::sleep_for(to_steady_duration(options_.command_latency));

    std::string output = simulated_output(command);
    std::string error{};
    int exit_code = 0;
    if (contains(command, "fail") || contains(command, "error")) {
        exit_code = k_simulated_failure_exit_code;
        error = k_simulated_failure_message;
    }

    {
        std::scoped_lock lock(mutex_);
        last_activity_ = SteadyClock::now();
    }
    const Duration elapsed = SteadyClock::now() - started_at;
    return make_completed_result(target_.name, command, std::move(output), std::move(error), exit_code, elapsed);
}

void SimulatedTransport::upload_file(const std::filesystem::path& local_path, const std::string& remote_path) {
    std::scoped_lock lock(mutex_);
    require_connected("upload");
    if (!std::filesystem::exists(local_path)) {
        throw ValidationError(fmt::format("local file does not exist: {}", local_path.string()));
    }
    last_activity_ = SteadyClock::now();
    logger_->debug("Simulated upload {} -> {}:{}", local_path.string(), target_.host, remote_path);
}

void SimulatedTransport::download_file(const std::string& remote_path, const std::filesystem::path& local_path) {
    std::scoped_lock lock(mutex_);
    require_connected("download");
    std::ofstream stream_out(local_path, std::ios::trunc);
    if (!stream_out) {
        throw FleetError(fmt::format("failed to write local file {}", local_path.string()));
    }
    stream_out << fmt::format("Simulated file content from {}:{}\nDownloaded at: {:%Y-%m-%dT%H:%M:%S}\n",
                              target_.host,
                              remote_path,
                              fmt::localtime(SystemClock::to_time_t(SystemClock::now())));
    last_activity_ = SteadyClock::now();
}

void SimulatedTransport::create_tunnel(int local_port, const std::string& remote_host, int remote_port) {
    std::scoped_lock lock(mutex_);
    require_connected("tunnel");
    last_activity_ = SteadyClock::now();
    logger_->info("Simulated tunnel localhost:{} -> {} -> {}:{}", local_port, target_.host, remote_host, remote_port);
}

bool SimulatedTransport::is_connected() const {
    std::scoped_lock lock(mutex_);
    return flag_connected_;
}

TimePoint SimulatedTransport::last_activity() const {
    std::scoped_lock lock(mutex_);
    return last_activity_;
}

void SimulatedTransport::close() {
    std::scoped_lock lock(mutex_);
    flag_connected_ = false;
}

void SimulatedTransport::require_connected(const char* operation) const {
    if (!flag_connected_) {
        throw ConnectionError(fmt::format("{}: not connected to {}", operation, connection_string(target_)));
    }
}

std::string SimulatedTransport::simulated_output(const std::string& command) const {
    if (contains(command, "echo")) {
        return echo_argument(command);
    }
    if (contains(command, "health_check")) {
        return "OK";
    }
    if (contains(command, "uname -s")) {
        return "Linux";
    }
    if (contains(command, "uname -r")) {
        return "5.4.0-simulated";
    }
    if (contains(command, "cat /proc/loadavg")) {
        return "0.5 0.7 0.9 1/123 12345";
    }
    if (contains(command, "whoami")) {
        return target_.username;
    }
    if (contains(command, "hostname")) {
        return target_.host;
    }
    if (contains(command, "pwd")) {
        return "/home/" + target_.username;
    }
    return fmt::format("Simulated execution of: {}", command);
}

TransportFactory make_simulated_transport_factory(SimulatedTransportOptions options) {
    return [options](const TargetConfig& target) -> TransportPtr {
        return std::make_unique<SimulatedTransport>(target, options);
    };
}

}  // namespace remote_fleet

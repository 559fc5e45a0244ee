// === Simulated Transport =====================================================
//
// In-process stand-in for an SSH session. Produces canned output for common
// administration commands so the rest of the stack can be exercised without a
// remote host. Used by the demo executable and by integration tests.

#pragma once

#include <mutex>
#include <string>

#include "remote_fleet/logging.hpp"
#include "remote_fleet/transport.hpp"

namespace remote_fleet {

/** @brief Latency knobs for the simulated session. */
struct SimulatedTransportOptions final {
    Duration connect_latency{Duration{0.1}};   /**< Delay before connect() returns. */
    Duration command_latency{Duration{0.05}};  /**< Delay added to every command. */
};

/** @brief Transport that fakes command execution locally. */
class SimulatedTransport final : public Transport {
  public:
    SimulatedTransport(TargetConfig target, SimulatedTransportOptions options);

    void connect(Duration timeout) override;
    [[nodiscard]] ExecutionResult execute(const std::string& command) override;
    void upload_file(const std::filesystem::path& local_path, const std::string& remote_path) override;
    void download_file(const std::string& remote_path, const std::filesystem::path& local_path) override;
    void create_tunnel(int local_port, const std::string& remote_host, int remote_port) override;
    [[nodiscard]] bool is_connected() const override;
    [[nodiscard]] TimePoint last_activity() const override;
    void close() override;

  private:
    /** @brief Throw ConnectionError unless connected; caller holds the mutex. */
    void require_connected(const char* operation) const;
    /** @brief Canned stdout for @p command. */
    [[nodiscard]] std::string simulated_output(const std::string& command) const;

    TargetConfig target_;
    SimulatedTransportOptions options_;
    mutable std::mutex mutex_;
    bool flag_connected_{false};
    TimePoint last_activity_{SteadyClock::now()};
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Factory producing SimulatedTransport sessions with @p options. */
[[nodiscard]] TransportFactory make_simulated_transport_factory(SimulatedTransportOptions options = {});

}  // namespace remote_fleet

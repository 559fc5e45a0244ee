// === Transport ===============================================================
//
// Boundary between the execution core and whatever actually talks to a remote
// host (SSH, WinRM, a simulator, a test double). The pool, executor and
// cluster code only ever see this interface; concrete transports are produced
// by a TransportFactory chosen when the FleetManager is constructed.

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "remote_fleet/execution_result.hpp"
#include "remote_fleet/target_config.hpp"
#include "remote_fleet/types.hpp"

namespace remote_fleet {

/**
 * @brief One session to one remote target.
 *
 * Implementations report connection-level problems by throwing
 * ConnectionError. A command that runs and exits non-zero is not an error; it
 * is returned as a result. `is_connected()` and `last_activity()` must not
 * block: the pool calls them while holding its bookkeeping lock.
 */
class Transport {
  public:
    virtual ~Transport() = default;

    /** @brief Establish the session, giving up after @p timeout. */
    virtual void connect(Duration timeout) = 0;
    /** @brief Run @p command and wait for its exit status. */
    [[nodiscard]] virtual ExecutionResult execute(const std::string& command) = 0;
    /** @brief Copy @p local_path to @p remote_path on the target. */
    virtual void upload_file(const std::filesystem::path& local_path, const std::string& remote_path) = 0;
    /** @brief Copy @p remote_path from the target to @p local_path. */
    virtual void download_file(const std::string& remote_path, const std::filesystem::path& local_path) = 0;
    /** @brief Forward @p local_port to @p remote_host:@p remote_port through the target. */
    virtual void create_tunnel(int local_port, const std::string& remote_host, int remote_port) = 0;
    /** @brief Whether the session is still usable. */
    [[nodiscard]] virtual bool is_connected() const = 0;
    /** @brief Time of the last successful interaction. */
    [[nodiscard]] virtual TimePoint last_activity() const = 0;
    /** @brief Tear the session down. Safe to call more than once. */
    virtual void close() = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

/** @brief Produces an unconnected transport for a target. */
using TransportFactory = std::function<TransportPtr(const TargetConfig&)>;

}  // namespace remote_fleet

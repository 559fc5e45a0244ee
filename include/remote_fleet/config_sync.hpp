// === Configuration Sync ======================================================
//
// Pushes a local file or directory to a set of targets described by a named
// sync profile. Each target is handled on its own worker behind an
// AdmissionGate: optional pre-commands, an optional backup of the current
// remote copy, the upload itself, ownership and mode fixes, an optional MD5
// comparison against the remote copy, then optional post-commands. The source
// checksum last delivered to each target is remembered so unchanged targets are
// skipped on the next run unless the caller forces a full sync. Dry runs report
// what a sync would do without contacting any target.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "remote_fleet/fleet_manager.hpp"
#include "remote_fleet/logging.hpp"

namespace remote_fleet {

/** @brief What to push, where, and how to finish the job on each target. */
struct SyncProfile final {
    std::string name{};
    std::string description{};
    std::filesystem::path source_path{};          /**< Local file or directory. */
    std::string target_path{};                    /**< Destination path on every target. */
    std::vector<std::string> targets{};           /**< Target names. */
    std::optional<std::string> cluster{};         /**< Cluster whose members are added at sync time. */
    std::vector<std::string> pre_commands{};      /**< Run in order before the upload; any failure aborts the target. */
    std::vector<std::string> post_commands{};     /**< Run in order after the upload. */
    bool backup_before{false};                    /**< Copy the current remote path aside first. */
    bool validate_checksum{false};                /**< Compare the remote MD5 after upload (single files). */
    std::string permissions{};                    /**< chmod mode such as "0644"; empty leaves it alone. */
    std::string owner{};
    std::string group{};
    WallTime created_at{};
    WallTime updated_at{};
};

/** @brief Checksum and size of a sync source. */
struct SourceDigest final {
    std::string checksum{};                            /**< MD5 hex; for directories, MD5 over each file's path and MD5. */
    std::uintmax_t total_bytes{};
    std::size_t file_count{};
    bool is_directory{false};
    std::vector<std::filesystem::path> list_files{};   /**< Paths relative to the source, sorted. Empty for a file. */
};

enum class SyncMode {
    Sync,
    DryRun
};

/** @brief Outcome of one profile on one target. */
struct SyncTargetResult final {
    std::string target{};
    bool success{false};
    bool changed{false};               /**< The target received (or, in a dry run, would receive) new content. */
    std::size_t files_updated{};
    std::size_t files_skipped{};
    std::uintmax_t bytes_transferred{};
    Duration duration{};
    std::string error{};
    std::string backup_path{};
    std::string remote_checksum{};
};

/** @brief One sync or dry run of a profile across its targets. */
struct SyncRun final {
    std::string profile_name{};
    SyncMode mode{SyncMode::Sync};
    WallTime timestamp{};
    std::vector<std::string> targets{};
    std::map<std::string, SyncTargetResult> results{};
    std::size_t success_count{};
    std::size_t failure_count{};
    std::size_t total_files{};
    std::uintmax_t total_bytes{};
    std::string source_checksum{};
    Duration duration{};
    std::string error{};               /**< Set when the run failed before reaching any target. */

    [[nodiscard]] bool succeeded() const noexcept {
        return error.empty() && failure_count == 0;
    }
};

struct SyncStatistics final {
    std::size_t total_profiles{};
    std::size_t total_runs{};
    std::size_t successful_runs{};
    std::size_t failed_runs{};
    std::size_t total_targets{};       /**< Distinct target names across all profiles. */
};

/**
 * @brief Checksum, size and file list of @p source_path.
 *
 * Throws ValidationError when the path does not exist or is neither a regular
 * file nor a directory, and FleetError when a file cannot be read.
 */
[[nodiscard]] SourceDigest compute_source_digest(const std::filesystem::path& source_path);

/** @brief Remote command printing the MD5 hex digest of @p remote_path. */
[[nodiscard]] std::string remote_checksum_command(const std::string& remote_path);

/** @brief Wrap @p text in single quotes for a POSIX shell. */
[[nodiscard]] std::string shell_quote(std::string_view text);

[[nodiscard]] std::string_view to_string(SyncMode mode) noexcept;

/** @brief Profile store and file fan-out built on a FleetManager. */
class ConfigSyncManager final {
  public:
    /** @brief At most @p concurrency targets are synced at once; @p history_capacity runs are kept. */
    explicit ConfigSyncManager(FleetManager& fleet, std::size_t concurrency = 10, std::size_t history_capacity = 1000);

    ConfigSyncManager(const ConfigSyncManager&) = delete;
    ConfigSyncManager& operator=(const ConfigSyncManager&) = delete;

    /**
     * @brief Register a profile.
     *
     * Throws ValidationError for an empty name, source or destination, or a
     * profile with neither targets nor a cluster, and DuplicateNameError when
     * the name is taken.
     */
    SyncProfile create_profile(SyncProfile profile);
    /** @brief Replace an existing profile, keeping its creation time. Throws NotFoundError. */
    SyncProfile update_profile(SyncProfile profile);
    /** @brief Throws NotFoundError. Forgets every checksum delivered for the profile. */
    void delete_profile(const std::string& name);
    /** @brief All profiles sorted by name. */
    [[nodiscard]] std::vector<SyncProfile> list_profiles() const;
    /** @brief Throws NotFoundError. */
    [[nodiscard]] SyncProfile get_profile(const std::string& name) const;
    /**
     * @brief Check that the source exists and every target and the cluster are registered.
     *
     * Throws ValidationError or NotFoundError.
     */
    void validate_profile(const std::string& name) const;

    /**
     * @brief Push the profile's source to its targets.
     *
     * Targets that already hold the current source checksum are skipped unless
     * @p force is set. Per-target failures are reported in the run; a missing
     * source or cluster is recorded in the history and rethrown.
     */
    SyncRun sync(const std::string& profile_name, bool force = false);
    /** @brief Report what sync() would change, without contacting any target. Not recorded. */
    [[nodiscard]] SyncRun dry_run(const std::string& profile_name);

    /** @brief Oldest-first copy of the recorded runs. */
    [[nodiscard]] std::vector<SyncRun> history() const;
    [[nodiscard]] SyncStatistics statistics() const;

  private:
    /** @brief Profile targets plus cluster members, de-duplicated in order. */
    [[nodiscard]] std::vector<std::string> resolve_targets(const SyncProfile& profile) const;
    /** @brief Every step for one target; never throws. */
    [[nodiscard]] SyncTargetResult sync_target(const SyncProfile& profile, const std::string& target_name, const SourceDigest& digest);
    void upload_source(const SyncProfile& profile, const std::string& target_name, const SourceDigest& digest, SyncTargetResult& result);
    /** @brief Run @p command on @p target_name; throws FleetError labelled @p step on failure. */
    ExecutionResult run_step(const std::string& target_name, const std::string& command, std::string_view step);
    [[nodiscard]] std::optional<std::string> delivered_checksum(const std::string& profile_name, const std::string& target_name) const;
    void record_run(const SyncRun& run);

    FleetManager& fleet_;
    const std::size_t concurrency_;
    const std::size_t history_capacity_;
    mutable std::shared_mutex profiles_mutex_;
    std::map<std::string, SyncProfile> map_profiles_;
    std::map<std::string, std::map<std::string, std::string>> map_delivered_checksums_;   /**< profile -> target -> checksum */
    mutable std::mutex history_mutex_;
    std::deque<SyncRun> deque_history_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace remote_fleet

#include "remote_fleet/config_sync.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <openssl/evp.h>

#include "remote_fleet/admission_gate.hpp"
#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
constexpr std::size_t k_read_chunk_bytes{64 * 1024};
constexpr char k_upload_staging_dir[] = "/tmp";

/** @brief Incremental MD5 over OpenSSL's EVP interface. */
class Md5Hasher final {
  public:
    Md5Hasher()
        : context_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!context_ || EVP_DigestInit_ex(context_.get(), EVP_md5(), nullptr) != 1) {
            throw FleetError("failed to initialise MD5 digest");
        }
    }

    void update(const char* data, std::size_t size) {
        if (EVP_DigestUpdate(context_.get(), data, size) != 1) {
            throw FleetError("failed to update MD5 digest");
        }
    }

    std::string finish() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1) {
            throw FleetError("failed to finalise MD5 digest");
        }
        std::string str_hex;
        str_hex.reserve(length * 2);
        for (unsigned int index = 0; index < length; ++index) {
            str_hex += fmt::format("{:02x}", digest[index]);
        }
        return str_hex;
    }

  private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

std::string md5_file(const std::filesystem::path& path_file) {
    std::ifstream stream_in(path_file, std::ios::binary);
    if (!stream_in) {
        throw FleetError(fmt::format("cannot read {}", path_file.string()));
    }
    Md5Hasher hasher{};
    std::array<char, k_read_chunk_bytes> buffer{};
    while (stream_in) {
        stream_in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize read_count = stream_in.gcount();
        if (read_count > 0) {
            hasher.update(buffer.data(), static_cast<std::size_t>(read_count));
        }
    }
    if (stream_in.bad()) {
        throw FleetError(fmt::format("read error on {}", path_file.string()));
    }
    return hasher.finish();
}

std::string trim(const std::string& text) {
    const std::size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool is_octal_mode(const std::string& mode) {
    return (mode.size() == 3 || mode.size() == 4) &&
           std::all_of(mode.begin(), mode.end(), [](char digit) { return digit >= '0' && digit <= '7'; });
}

void validate_profile_fields(const SyncProfile& profile) {
    if (profile.name.empty()) {
        throw ValidationError("sync profile name must not be empty");
    }
    if (profile.source_path.empty()) {
        throw ValidationError(fmt::format("sync profile '{}' needs a source path", profile.name));
    }
    if (profile.target_path.empty()) {
        throw ValidationError(fmt::format("sync profile '{}' needs a target path", profile.name));
    }
    if (profile.targets.empty() && !profile.cluster.has_value()) {
        throw ValidationError(fmt::format("sync profile '{}' needs at least one target or a cluster", profile.name));
    }
    if (!profile.permissions.empty() && !is_octal_mode(profile.permissions)) {
        throw ValidationError(fmt::format("sync profile '{}' has invalid permissions '{}'", profile.name, profile.permissions));
    }
}
}  // namespace

SourceDigest compute_source_digest(const std::filesystem::path& source_path) {
    std::error_code error_status;
    const std::filesystem::file_status status = std::filesystem::status(source_path, error_status);
    if (error_status || !std::filesystem::exists(status)) {
        throw ValidationError(fmt::format("sync source does not exist: {}", source_path.string()));
    }

    SourceDigest digest{};
    if (std::filesystem::is_regular_file(status)) {
        digest.checksum = md5_file(source_path);
        std::error_code error_size;
        digest.total_bytes = std::filesystem::file_size(source_path, error_size);
        if (error_size) {
            throw FleetError(fmt::format("cannot stat {}: {}", source_path.string(), error_size.message()));
        }
        digest.file_count = 1;
        return digest;
    }
    if (!std::filesystem::is_directory(status)) {
        throw ValidationError(fmt::format("sync source is neither a file nor a directory: {}", source_path.string()));
    }

    digest.is_directory = true;
    try {
        for (const std::filesystem::directory_entry& entry : std::filesystem::recursive_directory_iterator(source_path)) {
            if (entry.is_regular_file()) {
                digest.list_files.push_back(entry.path().lexically_relative(source_path));
            }
        }
        std::sort(digest.list_files.begin(), digest.list_files.end());

        Md5Hasher combined{};
        for (const std::filesystem::path& path_relative : digest.list_files) {
            const std::filesystem::path path_file = source_path / path_relative;
            const std::string line = fmt::format("{}:{}\n", path_relative.generic_string(), md5_file(path_file));
            combined.update(line.data(), line.size());
            digest.total_bytes += std::filesystem::file_size(path_file);
        }
        digest.checksum = combined.finish();
    } catch (const std::filesystem::filesystem_error& exc) {
        throw FleetError(fmt::format("cannot scan {}: {}", source_path.string(), exc.what()));
    }
    digest.file_count = digest.list_files.size();
    return digest;
}

std::string remote_checksum_command(const std::string& remote_path) {
    return fmt::format("md5sum {} | cut -d' ' -f1", shell_quote(remote_path));
}

std::string shell_quote(std::string_view text) {
    std::string quoted{"'"};
    for (const char character : text) {
        if (character == '\'') {
            quoted += R"('\'')";
        } else {
            quoted += character;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string_view to_string(SyncMode mode) noexcept {
    switch (mode) {
        case SyncMode::Sync:
            return "sync";
        case SyncMode::DryRun:
            return "dry_run";
    }
    return "unknown";
}

ConfigSyncManager::ConfigSyncManager(FleetManager& fleet, std::size_t concurrency, std::size_t history_capacity)
    : fleet_(fleet),
      concurrency_(std::max<std::size_t>(1, concurrency)),
      history_capacity_(std::max<std::size_t>(1, history_capacity)),
      logger_(get_logger()) {}

SyncProfile ConfigSyncManager::create_profile(SyncProfile profile) {
    validate_profile_fields(profile);
    profile.target_path = strip_trailing_slash(profile.target_path);
    profile.created_at = SystemClock::now();
    profile.updated_at = profile.created_at;

    std::unique_lock lock(profiles_mutex_);
    if (map_profiles_.count(profile.name) != 0) {
        throw DuplicateNameError(fmt::format("sync profile '{}' already exists", profile.name));
    }
    map_profiles_.emplace(profile.name, profile);
    logger_->info(R"({{"component":"config_sync","action":"create_profile","profile":"{}","targets":{}}})",
                  json_escape(profile.name),
                  profile.targets.size());
    return profile;
}

SyncProfile ConfigSyncManager::update_profile(SyncProfile profile) {
    validate_profile_fields(profile);
    profile.target_path = strip_trailing_slash(profile.target_path);

    std::unique_lock lock(profiles_mutex_);
    auto iterator_profile = map_profiles_.find(profile.name);
    if (iterator_profile == map_profiles_.end()) {
        throw NotFoundError(fmt::format("sync profile '{}' not found", profile.name));
    }
    profile.created_at = iterator_profile->second.created_at;
    profile.updated_at = SystemClock::now();
    iterator_profile->second = profile;
    map_delivered_checksums_.erase(profile.name);
    return profile;
}

void ConfigSyncManager::delete_profile(const std::string& name) {
    std::unique_lock lock(profiles_mutex_);
    if (map_profiles_.erase(name) == 0) {
        throw NotFoundError(fmt::format("sync profile '{}' not found", name));
    }
    map_delivered_checksums_.erase(name);
}

std::vector<SyncProfile> ConfigSyncManager::list_profiles() const {
    std::shared_lock lock(profiles_mutex_);
    std::vector<SyncProfile> list_profiles;
    list_profiles.reserve(map_profiles_.size());
    for (const auto& [name, profile] : map_profiles_) {
        list_profiles.push_back(profile);
    }
    return list_profiles;
}

SyncProfile ConfigSyncManager::get_profile(const std::string& name) const {
    std::shared_lock lock(profiles_mutex_);
    const auto iterator_profile = map_profiles_.find(name);
    if (iterator_profile == map_profiles_.end()) {
        throw NotFoundError(fmt::format("sync profile '{}' not found", name));
    }
    return iterator_profile->second;
}

void ConfigSyncManager::validate_profile(const std::string& name) const {
    const SyncProfile profile = get_profile(name);
    std::error_code error_exists;
    if (!std::filesystem::exists(profile.source_path, error_exists)) {
        throw ValidationError(fmt::format("sync source does not exist: {}", profile.source_path.string()));
    }
    for (const std::string& target_name : profile.targets) {
        (void)fleet_.get_target(target_name);
    }
    if (profile.cluster.has_value()) {
        (void)fleet_.get_cluster(profile.cluster.value());
    }
}

SyncRun ConfigSyncManager::sync(const std::string& profile_name, bool force) {
    const SyncProfile profile = get_profile(profile_name);
    const TimePoint started_at = SteadyClock::now();

    SyncRun run{};
    run.profile_name = profile.name;
    run.mode = SyncMode::Sync;
    run.timestamp = SystemClock::now();

    SourceDigest digest{};
    try {
        digest = compute_source_digest(profile.source_path);
        run.targets = resolve_targets(profile);
    } catch (const FleetError& exc) {
        run.error = exc.what();
        run.duration = SteadyClock::now() - started_at;
        record_run(run);
        logger_->error(R"({{"component":"config_sync","action":"sync","profile":"{}","error":"{}"}})",
                       json_escape(profile.name),
                       json_escape(run.error));
        throw;
    }
    run.total_files = digest.file_count;
    run.total_bytes = digest.total_bytes;
    run.source_checksum = digest.checksum;

    std::vector<std::string> list_pending;
    for (const std::string& target_name : run.targets) {
        if (!force && delivered_checksum(profile.name, target_name) == digest.checksum) {
            SyncTargetResult skipped{};
            skipped.target = target_name;
            skipped.success = true;
            skipped.files_skipped = digest.file_count;
            run.results.emplace(target_name, std::move(skipped));
        } else {
            list_pending.push_back(target_name);
        }
    }

    AdmissionGate gate{concurrency_};
    std::mutex results_mutex;
    std::vector<std::thread> list_threads;
    list_threads.reserve(list_pending.size());
    for (const std::string& target_name : list_pending) {
        try {
            list_threads.emplace_back([this, &gate, &results_mutex, &run, &profile, &digest, target_name]() {
                gate.acquire();
                SyncTargetResult result = sync_target(profile, target_name, digest);
                gate.release();
                std::scoped_lock lock(results_mutex);
                run.results.insert_or_assign(target_name, std::move(result));
            });
        } catch (const std::system_error& exc) {
            SyncTargetResult failed{};
            failed.target = target_name;
            failed.error = fmt::format("failed to start worker: {}", exc.what());
            std::scoped_lock lock(results_mutex);
            run.results.insert_or_assign(target_name, std::move(failed));
        }
    }
    for (std::thread& worker : list_threads) {
        worker.join();
    }

    {
        std::unique_lock lock(profiles_mutex_);
        if (map_profiles_.count(profile.name) != 0) {
            std::map<std::string, std::string>& map_targets = map_delivered_checksums_[profile.name];
            for (const auto& [target_name, result] : run.results) {
                if (result.success && result.changed) {
                    map_targets[target_name] = digest.checksum;
                }
            }
        }
    }

    for (const auto& [target_name, result] : run.results) {
        if (result.success) {
            ++run.success_count;
        } else {
            ++run.failure_count;
        }
    }
    run.duration = SteadyClock::now() - started_at;
    record_run(run);

    logger_->info(R"({{"component":"config_sync","action":"sync","profile":"{}","targets":{},"succeeded":{},"failed":{},"files":{},"bytes":{},"elapsed_s":{:.3f}}})",
                  json_escape(profile.name),
                  run.targets.size(),
                  run.success_count,
                  run.failure_count,
                  run.total_files,
                  run.total_bytes,
                  run.duration.count());
    return run;
}

SyncRun ConfigSyncManager::dry_run(const std::string& profile_name) {
    const SyncProfile profile = get_profile(profile_name);
    const TimePoint started_at = SteadyClock::now();
    const SourceDigest digest = compute_source_digest(profile.source_path);

    SyncRun run{};
    run.profile_name = profile.name;
    run.mode = SyncMode::DryRun;
    run.timestamp = SystemClock::now();
    run.targets = resolve_targets(profile);
    run.total_files = digest.file_count;
    run.total_bytes = digest.total_bytes;
    run.source_checksum = digest.checksum;

    for (const std::string& target_name : run.targets) {
        SyncTargetResult result{};
        result.target = target_name;
        try {
            const TargetInfo info = fleet_.get_target(target_name);
            if (!info.config.enabled) {
                result.error = "target is disabled";
            } else {
                result.success = true;
                result.changed = delivered_checksum(profile.name, target_name) != digest.checksum;
                if (result.changed) {
                    result.files_updated = digest.file_count;
                    result.bytes_transferred = digest.total_bytes;
                } else {
                    result.files_skipped = digest.file_count;
                }
            }
        } catch (const NotFoundError& exc) {
            result.error = exc.what();
        }
        if (result.success) {
            ++run.success_count;
        } else {
            ++run.failure_count;
        }
        run.results.emplace(target_name, std::move(result));
    }
    run.duration = SteadyClock::now() - started_at;
    return run;
}

std::vector<SyncRun> ConfigSyncManager::history() const {
    std::scoped_lock lock(history_mutex_);
    return {deque_history_.begin(), deque_history_.end()};
}

SyncStatistics ConfigSyncManager::statistics() const {
    SyncStatistics stats{};
    {
        std::shared_lock lock(profiles_mutex_);
        std::set<std::string> set_targets;
        for (const auto& [name, profile] : map_profiles_) {
            set_targets.insert(profile.targets.begin(), profile.targets.end());
        }
        stats.total_profiles = map_profiles_.size();
        stats.total_targets = set_targets.size();
    }
    std::scoped_lock lock(history_mutex_);
    stats.total_runs = deque_history_.size();
    for (const SyncRun& run : deque_history_) {
        if (run.succeeded()) {
            ++stats.successful_runs;
        } else {
            ++stats.failed_runs;
        }
    }
    return stats;
}

std::vector<std::string> ConfigSyncManager::resolve_targets(const SyncProfile& profile) const {
    std::vector<std::string> list_names = profile.targets;
    if (profile.cluster.has_value()) {
        const Cluster cluster = fleet_.get_cluster(profile.cluster.value());
        list_names.insert(list_names.end(), cluster.members.begin(), cluster.members.end());
    }
    std::vector<std::string> list_unique;
    std::set<std::string> set_seen;
    for (std::string& name : list_names) {
        if (set_seen.insert(name).second) {
            list_unique.push_back(std::move(name));
        }
    }
    return list_unique;
}

SyncTargetResult ConfigSyncManager::sync_target(const SyncProfile& profile, const std::string& target_name, const SourceDigest& digest) {
    const TimePoint started_at = SteadyClock::now();
    SyncTargetResult result{};
    result.target = target_name;
    result.changed = true;

    try {
        for (const std::string& command : profile.pre_commands) {
            (void)run_step(target_name, command, "pre-command");
        }

        if (profile.backup_before) {
            const std::string backup_path = fmt::format("{}.backup.{:%Y%m%d_%H%M%S}",
                                                        profile.target_path,
                                                        fmt::localtime(SystemClock::to_time_t(SystemClock::now())));
            const ExecutionResult backup = fleet_.execute_command(
                target_name,
                fmt::format("cp -r {} {} 2>/dev/null || true", shell_quote(profile.target_path), shell_quote(backup_path))
            );
            if (backup.success) {
                result.backup_path = backup_path;
            } else {
                logger_->warn("Backup of {} on {} failed: {}", profile.target_path, target_name, backup.error);
            }
        }

        upload_source(profile, target_name, digest, result);

        const char* recursive_flag = digest.is_directory ? "-R " : "";
        if (!profile.permissions.empty()) {
            (void)run_step(target_name,
                           fmt::format("chmod {}{} {}", recursive_flag, profile.permissions, shell_quote(profile.target_path)),
                           "chmod");
        }
        if (!profile.owner.empty() || !profile.group.empty()) {
            const std::string owner_spec = profile.group.empty() ? profile.owner : profile.owner + ":" + profile.group;
            (void)run_step(target_name,
                           fmt::format("chown {}{} {}", recursive_flag, shell_quote(owner_spec), shell_quote(profile.target_path)),
                           "chown");
        }

        if (profile.validate_checksum) {
            if (digest.is_directory) {
                logger_->debug("Checksum validation skipped for directory profile {}", profile.name);
            } else {
                const ExecutionResult checksum = run_step(target_name, remote_checksum_command(profile.target_path), "checksum");
                result.remote_checksum = trim(checksum.output);
                if (result.remote_checksum != digest.checksum) {
                    throw FleetError(fmt::format("checksum mismatch: expected {} got {}", digest.checksum, result.remote_checksum));
                }
            }
        }

        for (const std::string& command : profile.post_commands) {
            (void)run_step(target_name, command, "post-command");
        }
        result.success = true;
    } catch (const std::exception& exc) {
        result.error = exc.what();
        logger_->warn(R"({{"component":"config_sync","profile":"{}","target":"{}","error":"{}"}})",
                      json_escape(profile.name),
                      json_escape(target_name),
                      json_escape(result.error));
    }
    result.duration = SteadyClock::now() - started_at;
    return result;
}

void ConfigSyncManager::upload_source(const SyncProfile& profile,
                                      const std::string& target_name,
                                      const SourceDigest& digest,
                                      SyncTargetResult& result) {
    if (!digest.is_directory) {
        const std::string staging_path = fmt::format("{}/{}.{}.sync",
                                                     k_upload_staging_dir,
                                                     profile.source_path.filename().string(),
                                                     digest.checksum.substr(0, 8));
        fleet_.upload_file(target_name, profile.source_path, staging_path);
        (void)run_step(target_name, fmt::format("mv {} {}", shell_quote(staging_path), shell_quote(profile.target_path)), "move");
        result.files_updated = 1;
        result.bytes_transferred = digest.total_bytes;
        return;
    }

    std::set<std::string> set_directories{profile.target_path};
    for (const std::filesystem::path& path_relative : digest.list_files) {
        const std::filesystem::path path_parent = path_relative.parent_path();
        if (!path_parent.empty()) {
            set_directories.insert(profile.target_path + "/" + path_parent.generic_string());
        }
    }
    std::string str_mkdir{"mkdir -p"};
    for (const std::string& directory : set_directories) {
        str_mkdir += ' ';
        str_mkdir += shell_quote(directory);
    }
    (void)run_step(target_name, str_mkdir, "mkdir");

    for (const std::filesystem::path& path_relative : digest.list_files) {
        const std::filesystem::path path_local = profile.source_path / path_relative;
        fleet_.upload_file(target_name, path_local, profile.target_path + "/" + path_relative.generic_string());
        ++result.files_updated;
        result.bytes_transferred += std::filesystem::file_size(path_local);
    }
}

ExecutionResult ConfigSyncManager::run_step(const std::string& target_name, const std::string& command, std::string_view step) {
    ExecutionResult result = fleet_.execute_command(target_name, command);
    if (!result.success) {
        const std::string detail = result.error.empty() ? fmt::format("exit code {}", result.exit_code) : result.error;
        throw FleetError(fmt::format("{} '{}' failed: {}", step, command, detail));
    }
    return result;
}

std::optional<std::string> ConfigSyncManager::delivered_checksum(const std::string& profile_name, const std::string& target_name) const {
    std::shared_lock lock(profiles_mutex_);
    const auto iterator_profile = map_delivered_checksums_.find(profile_name);
    if (iterator_profile == map_delivered_checksums_.end()) {
        return std::nullopt;
    }
    const auto iterator_target = iterator_profile->second.find(target_name);
    if (iterator_target == iterator_profile->second.end()) {
        return std::nullopt;
    }
    return iterator_target->second;
}

void ConfigSyncManager::record_run(const SyncRun& run) {
    std::scoped_lock lock(history_mutex_);
    deque_history_.push_back(run);
    while (deque_history_.size() > history_capacity_) {
        deque_history_.pop_front();
    }
}

}  // namespace remote_fleet

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "fake_transport.hpp"
#include "logging_test_fixture.hpp"
#include "remote_fleet/config_sync.hpp"
#include "remote_fleet/errors.hpp"

using namespace remote_fleet;
using remote_fleet::test::FakeFleetState;
using remote_fleet::test::make_fake_factory;
using remote_fleet::test::make_target;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    remote_fleet::test::ensure_logger_initialized();
    return true;
}();

constexpr char k_hello_md5[] = "b1946ac92492d2347c6235b4d2611184";

/** @brief Temp directory removed on scope exit. */
class ScratchDirectory final {
  public:
    explicit ScratchDirectory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("remote_fleet_sync_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDirectory() {
        std::error_code error_remove;
        std::filesystem::remove_all(path_, error_remove);
    }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        const std::filesystem::path path_file = path_ / relative;
        std::filesystem::create_directories(path_file.parent_path());
        std::ofstream stream_out(path_file, std::ios::binary | std::ios::trunc);
        stream_out << content;
        return path_file;
    }

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

FleetManagerConfig sync_config() {
    FleetManagerConfig config{};
    config.executor.timeout = Duration{5.0};
    config.executor.retry_attempts = 0;
    config.executor.retry_delay = Duration{0.01};
    return config;
}

SyncProfile file_profile(const std::string& name, const std::filesystem::path& source, std::vector<std::string> targets) {
    SyncProfile profile{};
    profile.name = name;
    profile.source_path = source;
    profile.target_path = "/etc/app.conf";
    profile.targets = std::move(targets);
    return profile;
}

bool contains(const std::vector<std::string>& list_items, const std::string& item) {
    return std::find(list_items.begin(), list_items.end(), item) != list_items.end();
}
}  // namespace

TEST_CASE("Source digests are MD5 over file contents") {
    ScratchDirectory scratch{"digest"};
    const std::filesystem::path path_file = scratch.write("app.conf", "hello\n");

    const SourceDigest file_digest = compute_source_digest(path_file);
    REQUIRE(file_digest.checksum == k_hello_md5);
    REQUIRE(file_digest.total_bytes == 6);
    REQUIRE(file_digest.file_count == 1);
    REQUIRE_FALSE(file_digest.is_directory);

    ScratchDirectory tree{"digest_tree"};
    tree.write("z.conf", "zzz");
    tree.write("sub/a.conf", "aaaa");
    const SourceDigest tree_digest = compute_source_digest(tree.path());
    REQUIRE(tree_digest.is_directory);
    REQUIRE(tree_digest.file_count == 2);
    REQUIRE(tree_digest.total_bytes == 7);
    REQUIRE(tree_digest.list_files == std::vector<std::filesystem::path>{"sub/a.conf", "z.conf"});

    tree.write("z.conf", "zzz!");
    REQUIRE(compute_source_digest(tree.path()).checksum != tree_digest.checksum);

    REQUIRE_THROWS_AS(compute_source_digest(scratch.path() / "missing.conf"), ValidationError);
}

TEST_CASE("Shell quoting survives embedded single quotes") {
    REQUIRE(shell_quote("/etc/app.conf") == "'/etc/app.conf'");
    REQUIRE(shell_quote("it's") == R"('it'\''s')");
    REQUIRE(remote_checksum_command("/etc/app.conf") == "md5sum '/etc/app.conf' | cut -d' ' -f1");
}

TEST_CASE("Sync profiles are validated on creation") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    ConfigSyncManager sync{manager};

    REQUIRE_THROWS_AS(sync.create_profile(file_profile("", "/tmp/app.conf", {"a"})), ValidationError);
    REQUIRE_THROWS_AS(sync.create_profile(file_profile("app", "", {"a"})), ValidationError);
    REQUIRE_THROWS_AS(sync.create_profile(file_profile("app", "/tmp/app.conf", {})), ValidationError);

    SyncProfile no_destination = file_profile("app", "/tmp/app.conf", {"a"});
    no_destination.target_path.clear();
    REQUIRE_THROWS_AS(sync.create_profile(no_destination), ValidationError);

    SyncProfile bad_mode = file_profile("app", "/tmp/app.conf", {"a"});
    bad_mode.permissions = "644; rm -rf /";
    REQUIRE_THROWS_AS(sync.create_profile(bad_mode), ValidationError);

    const SyncProfile created = sync.create_profile(file_profile("app", "/tmp/app.conf", {"a"}));
    REQUIRE(created.created_at == created.updated_at);
    REQUIRE_THROWS_AS(sync.create_profile(file_profile("app", "/tmp/other.conf", {"b"})), DuplicateNameError);

    SyncProfile cluster_only = file_profile("web", "/tmp/app.conf", {});
    cluster_only.cluster = "web";
    REQUIRE_NOTHROW(sync.create_profile(cluster_only));

    REQUIRE(sync.list_profiles().size() == 2);
    REQUIRE(sync.list_profiles().front().name == "app");
    sync.delete_profile("app");
    REQUIRE_THROWS_AS(sync.get_profile("app"), NotFoundError);
    REQUIRE_THROWS_AS(sync.delete_profile("app"), NotFoundError);
}

TEST_CASE("A file sync stages the upload and moves it into place") {
    ScratchDirectory scratch{"file_sync"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    ConfigSyncManager sync{manager};
    sync.create_profile(file_profile("app", path_source, {"a", "b"}));

    const SyncRun run = sync.sync("app");

    REQUIRE(run.succeeded());
    REQUIRE(run.success_count == 2);
    REQUIRE(run.source_checksum == k_hello_md5);
    REQUIRE(run.total_bytes == 6);
    REQUIRE(run.targets == std::vector<std::string>{"a", "b"});

    const std::string staging_path = "/tmp/app.conf.b1946ac9.sync";
    REQUIRE(state->uploads_to("a.example.net") == std::vector<std::string>{staging_path});
    REQUIRE(contains(state->commands_on("a.example.net"), "mv '/tmp/app.conf.b1946ac9.sync' '/etc/app.conf'"));

    const SyncTargetResult& result_a = run.results.at("a");
    REQUIRE(result_a.changed);
    REQUIRE(result_a.files_updated == 1);
    REQUIRE(result_a.bytes_transferred == 6);

    REQUIRE(sync.history().size() == 1);
    const SyncStatistics stats = sync.statistics();
    REQUIRE(stats.total_profiles == 1);
    REQUIRE(stats.total_runs == 1);
    REQUIRE(stats.successful_runs == 1);
    REQUIRE(stats.total_targets == 2);
}

TEST_CASE("Unchanged targets are skipped unless the sync is forced") {
    ScratchDirectory scratch{"skip_sync"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};
    sync.create_profile(file_profile("app", path_source, {"a"}));

    REQUIRE(sync.sync("app").succeeded());
    REQUIRE(state->uploads.load() == 1);

    const int executes_before = state->executes.load();
    const SyncRun repeat = sync.sync("app");
    REQUIRE(repeat.succeeded());
    REQUIRE_FALSE(repeat.results.at("a").changed);
    REQUIRE(repeat.results.at("a").files_skipped == 1);
    REQUIRE(state->uploads.load() == 1);
    REQUIRE(state->executes.load() == executes_before);

    REQUIRE(sync.sync("app", true).results.at("a").changed);
    REQUIRE(state->uploads.load() == 2);

    scratch.write("app.conf", "hello again\n");
    REQUIRE(sync.sync("app").results.at("a").changed);
    REQUIRE(state->uploads.load() == 3);
}

TEST_CASE("One failing target does not affect the others") {
    ScratchDirectory scratch{"partial_sync"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    state->set_upload_failure("b.example.net");
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    ConfigSyncManager sync{manager};
    sync.create_profile(file_profile("app", path_source, {"a", "b"}));

    const SyncRun run = sync.sync("app");

    REQUIRE_FALSE(run.succeeded());
    REQUIRE(run.success_count == 1);
    REQUIRE(run.failure_count == 1);
    REQUIRE(run.results.at("a").success);
    REQUIRE_FALSE(run.results.at("b").success);
    REQUIRE(run.results.at("b").error.find("remote disk full") != std::string::npos);
    REQUIRE(sync.statistics().failed_runs == 1);

    // Only the failed target is retried on the next run.
    const SyncRun retry = sync.sync("app");
    REQUIRE_FALSE(retry.results.at("a").changed);
    REQUIRE(retry.results.at("b").changed);
    REQUIRE_FALSE(retry.results.at("b").success);
}

TEST_CASE("A failing pre-command aborts the target before the upload") {
    ScratchDirectory scratch{"pre_command"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    state->set_command_exit_code("systemctl stop app", 1);
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};

    SyncProfile profile = file_profile("app", path_source, {"a"});
    profile.pre_commands = {"systemctl stop app"};
    profile.post_commands = {"systemctl start app"};
    sync.create_profile(profile);

    const SyncRun run = sync.sync("app");

    REQUIRE_FALSE(run.succeeded());
    REQUIRE(run.results.at("a").error.find("pre-command") != std::string::npos);
    REQUIRE(state->uploads.load() == 0);
    REQUIRE_FALSE(contains(state->commands_on("a.example.net"), "systemctl start app"));
}

TEST_CASE("Checksum validation compares the remote MD5") {
    ScratchDirectory scratch{"checksum"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};

    SyncProfile matching = file_profile("app", path_source, {"a"});
    matching.validate_checksum = true;
    sync.create_profile(matching);

    SECTION("matching digest") {
        state->set_command_output(remote_checksum_command("/etc/app.conf"), std::string{k_hello_md5} + "\n");
        const SyncRun run = sync.sync("app");
        REQUIRE(run.succeeded());
        REQUIRE(run.results.at("a").remote_checksum == k_hello_md5);
    }

    SECTION("mismatching digest") {
        state->set_command_output(remote_checksum_command("/etc/app.conf"), "d41d8cd98f00b204e9800998ecf8427e");
        const SyncRun run = sync.sync("app");
        REQUIRE_FALSE(run.succeeded());
        REQUIRE(run.results.at("a").error.find("checksum mismatch") != std::string::npos);
    }
}

TEST_CASE("A directory sync creates parents then fixes mode and ownership") {
    ScratchDirectory scratch{"directory_sync"};
    scratch.write("a.conf", "aaaa");
    scratch.write("sub/b.conf", "bb");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};

    SyncProfile profile{};
    profile.name = "tree";
    profile.source_path = scratch.path();
    profile.target_path = "/etc/app/";
    profile.targets = {"a"};
    profile.permissions = "0644";
    profile.owner = "app";
    profile.group = "ops";
    sync.create_profile(profile);

    const SyncRun run = sync.sync("tree");

    REQUIRE(run.succeeded());
    REQUIRE(run.results.at("a").files_updated == 2);
    REQUIRE(run.results.at("a").bytes_transferred == 6);
    REQUIRE(state->uploads_to("a.example.net") == std::vector<std::string>{"/etc/app/a.conf", "/etc/app/sub/b.conf"});

    const std::vector<std::string> list_commands = state->commands_on("a.example.net");
    REQUIRE(list_commands == std::vector<std::string>{
        "mkdir -p '/etc/app' '/etc/app/sub'",
        "chmod -R 0644 '/etc/app'",
        "chown -R 'app:ops' '/etc/app'",
    });
}

TEST_CASE("A backup is taken before the upload when requested") {
    ScratchDirectory scratch{"backup"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};

    SyncProfile profile = file_profile("app", path_source, {"a"});
    profile.backup_before = true;
    sync.create_profile(profile);

    const SyncRun run = sync.sync("app");

    REQUIRE(run.succeeded());
    const std::string& backup_path = run.results.at("a").backup_path;
    REQUIRE(backup_path.rfind("/etc/app.conf.backup.", 0) == 0);
    const std::vector<std::string> list_commands = state->commands_on("a.example.net");
    REQUIRE_FALSE(list_commands.empty());
    REQUIRE(list_commands.front() == "cp -r '/etc/app.conf' '" + backup_path + "' 2>/dev/null || true");
}

TEST_CASE("Cluster members join the profile targets without duplicates") {
    ScratchDirectory scratch{"cluster_sync"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    manager.create_cluster("web", "", {"a", "b"});
    ConfigSyncManager sync{manager};

    SyncProfile profile = file_profile("app", path_source, {"a"});
    profile.cluster = "web";
    sync.create_profile(profile);

    const SyncRun run = sync.sync("app");

    REQUIRE(run.targets == std::vector<std::string>{"a", "b"});
    REQUIRE(run.succeeded());
    REQUIRE(state->uploads.load() == 2);

    SyncProfile missing_cluster = file_profile("ghost", path_source, {});
    missing_cluster.cluster = "ghost";
    sync.create_profile(missing_cluster);
    REQUIRE_THROWS_AS(sync.sync("ghost"), NotFoundError);
    REQUIRE_THROWS_AS(sync.validate_profile("ghost"), NotFoundError);
}

TEST_CASE("A dry run reports changes without contacting any target") {
    ScratchDirectory scratch{"dry_run"};
    const std::filesystem::path path_source = scratch.write("app.conf", "hello\n");

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    TargetConfig disabled = make_target("b");
    disabled.enabled = false;
    manager.add_target(disabled);
    ConfigSyncManager sync{manager};
    sync.create_profile(file_profile("app", path_source, {"a", "b", "ghost"}));

    const SyncRun run = sync.dry_run("app");

    REQUIRE(run.mode == SyncMode::DryRun);
    REQUIRE(run.results.at("a").success);
    REQUIRE(run.results.at("a").changed);
    REQUIRE(run.results.at("a").files_updated == 1);
    REQUIRE(run.results.at("b").error == "target is disabled");
    REQUIRE_FALSE(run.results.at("ghost").error.empty());
    REQUIRE(run.failure_count == 2);

    REQUIRE(state->connects.load() == 0);
    REQUIRE(state->executes.load() == 0);
    REQUIRE(state->uploads.load() == 0);
    REQUIRE(sync.history().empty());
}

TEST_CASE("A missing source fails the run and is recorded") {
    ScratchDirectory scratch{"missing_source"};

    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{sync_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ConfigSyncManager sync{manager};
    sync.create_profile(file_profile("app", scratch.path() / "absent.conf", {"a"}));

    REQUIRE_THROWS_AS(sync.sync("app"), ValidationError);
    REQUIRE_THROWS_AS(sync.validate_profile("app"), ValidationError);

    const std::vector<SyncRun> list_history = sync.history();
    REQUIRE(list_history.size() == 1);
    REQUIRE_FALSE(list_history.front().error.empty());
    REQUIRE(sync.statistics().failed_runs == 1);
    REQUIRE(state->connects.load() == 0);
}

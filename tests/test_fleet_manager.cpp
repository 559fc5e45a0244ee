#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <catch2/catch.hpp>

#include "fake_transport.hpp"
#include "logging_test_fixture.hpp"
#include "remote_fleet/errors.hpp"
#include "remote_fleet/fleet_manager.hpp"
#include "remote_fleet/simulated_transport.hpp"

using namespace remote_fleet;
using remote_fleet::test::FakeFleetState;
using remote_fleet::test::make_fake_factory;
using remote_fleet::test::make_target;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    remote_fleet::test::ensure_logger_initialized();
    return true;
}();

FleetManagerConfig quick_config() {
    FleetManagerConfig config{};
    config.executor.timeout = Duration{5.0};
    config.executor.retry_attempts = 0;
    config.executor.retry_delay = Duration{0.01};
    config.health_check_interval = Duration{0.05};
    return config;
}

SimulatedTransportOptions quick_simulation() {
    SimulatedTransportOptions options{};
    options.connect_latency = Duration{0.005};
    options.command_latency = Duration{0.005};
    return options;
}

std::vector<FleetEventType> drain_event_types(FleetEventBus& events) {
    std::vector<FleetEventType> list_types;
    while (const std::optional<FleetEvent> optional_event = events.try_consume()) {
        list_types.push_back(optional_event->type);
    }
    return list_types;
}
}  // namespace

TEST_CASE("Simulated fleet answers canned commands") {
    FleetManager manager{quick_config(), make_simulated_transport_factory(quick_simulation())};
    manager.add_target(make_target("app"));

    REQUIRE(manager.execute_command("app", "whoami").output == "ops");
    REQUIRE(manager.execute_command("app", "hostname").output == "app.example.net");
    REQUIRE(manager.execute_command("app", "echo 'health_check'").output == "health_check");
    REQUIRE(manager.execute_command("app", "uname -s").output == "Linux");

    const ExecutionResult failed = manager.execute_command("app", "run-failing-job");
    REQUIRE(failed.exit_code == 1);
    REQUIRE(failed.error == "Command failed (simulated)");
    REQUIRE_FALSE(failed.success);

    REQUIRE_THROWS_AS(manager.execute_command("ghost", "whoami"), NotFoundError);
}

TEST_CASE("Target info reflects pooled sessions and the enabled flag") {
    FleetManager manager{quick_config(), make_simulated_transport_factory(quick_simulation())};
    manager.add_target(make_target("app"));
    TargetConfig parked = make_target("parked");
    parked.enabled = false;
    manager.add_target(parked);

    REQUIRE(manager.get_target("app").status == TargetStatus::Unknown);
    REQUIRE(manager.test_connection("app"));
    const TargetInfo info = manager.get_target("app");
    REQUIRE(info.status == TargetStatus::Online);
    REQUIRE(info.last_activity.has_value());

    REQUIRE(manager.get_target("parked").status == TargetStatus::Disabled);
    REQUIRE_FALSE(manager.test_connection("parked"));
    REQUIRE(manager.execute_command("parked", "uptime").outcome == ExecutionOutcome::Disabled);
    REQUIRE(manager.list_targets().size() == 2);
}

TEST_CASE("Removing a target drops it from clusters and closes its sessions") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    manager.add_target(make_target("c"));
    manager.create_cluster("pair", "", {"a", "b"});
    manager.create_cluster("solo", "", {"c"});
    (void)manager.execute_on_targets({"a", "b", "c"}, "uptime");
    REQUIRE(manager.connection_stats().pool_size == 3);

    manager.remove_target("a");
    REQUIRE(manager.get_cluster("pair").members == std::vector<std::string>{"b"});
    REQUIRE(manager.connection_stats().total_targets == 2);
    REQUIRE(manager.connection_stats().pool_size == 2);
    REQUIRE(state->closes.load() == 1);

    REQUIRE_THROWS_AS(manager.remove_target("c"), EmptyMembersError);
    REQUIRE(manager.get_target("c").config.name == "c");
    REQUIRE_THROWS_AS(manager.remove_target("a"), NotFoundError);
}

TEST_CASE("Updating a target retires sessions of the old endpoint") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("db"));
    (void)manager.execute_command("db", "uptime");

    const TargetConfig previous = manager.update_target("db", make_target("db", "db-replacement.example.net"));
    REQUIRE(previous.host == "db.example.net");
    REQUIRE(manager.connection_stats().pool_size == 0);

    const ExecutionResult result = manager.execute_command("db", "uptime");
    REQUIRE(result.output == "db-replacement.example.net");
    REQUIRE(state->connects.load() == 2);
}

TEST_CASE("Lifecycle operations publish fleet events") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    manager.create_cluster("web", "", {"a"});
    manager.add_cluster_member("web", "b");
    manager.remove_cluster_member("web", "a");
    manager.update_target("a", make_target("a"));
    manager.remove_target("a");
    manager.delete_cluster("web");

    REQUIRE(drain_event_types(manager.events()) == std::vector<FleetEventType>{
        FleetEventType::TargetAdded,
        FleetEventType::TargetAdded,
        FleetEventType::ClusterCreated,
        FleetEventType::MemberAdded,
        FleetEventType::MemberRemoved,
        FleetEventType::TargetUpdated,
        FleetEventType::TargetRemoved,
        FleetEventType::ClusterDeleted,
    });
}

TEST_CASE("Batches and cluster runs go through the manager") {
    auto state = std::make_shared<FakeFleetState>();
    state->set_exit_code("b.example.net", 1);
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    manager.create_cluster("web", "", {"a", "b"});

    const BatchReport report = manager.execute_batch("rollout",
                                                     {"a", "b"},
                                                     {BatchCommand{"", "uptime", "", std::nullopt}, BatchCommand{"", "df -h", "", std::nullopt}},
                                                     false);
    REQUIRE(report.batch_name == "rollout");
    REQUIRE(report.command_order == std::vector<std::string>{"command_1", "command_2"});
    REQUIRE(report.failed_targets() == std::vector<std::string>{"b"});

    const ClusterExecutionReport cluster_report = manager.execute_on_cluster("web", "uptime");
    REQUIRE(cluster_report.failed_count == 1);

    const BatchReport cluster_batch = manager.execute_batch_on_cluster("web", {BatchCommand{"check", "uptime", "", std::nullopt}}, true);
    REQUIRE_FALSE(cluster_batch.completed);

    const ExecutionStatistics stats = manager.execution_stats();
    REQUIRE(stats.total_executions == 8);
    REQUIRE(stats.failed == 4);
    REQUIRE_THROWS_AS(manager.execute_on_targets({}, "uptime"), ValidationError);
}

TEST_CASE("File transfer and tunnels use a pooled session") {
    FleetManager manager{quick_config(), make_simulated_transport_factory(quick_simulation())};
    manager.add_target(make_target("files"));

    const std::filesystem::path path_dir = std::filesystem::temp_directory_path() / "remote_fleet_transfer_test";
    std::filesystem::create_directories(path_dir);
    const std::filesystem::path path_local = path_dir / "payload.txt";
    {
        std::ofstream stream_out(path_local);
        stream_out << "payload";
    }

    manager.upload_file("files", path_local, "/tmp/payload.txt");
    REQUIRE_THROWS_AS(manager.upload_file("files", path_dir / "missing.txt", "/tmp/x"), ValidationError);

    const std::filesystem::path path_download = path_dir / "download.txt";
    manager.download_file("files", "/etc/hostname", path_download);
    REQUIRE(std::filesystem::exists(path_download));

    manager.create_tunnel("files", 15432, "db.internal", 5432);
    REQUIRE_THROWS_AS(manager.create_tunnel("files", 0, "db.internal", 5432), ValidationError);
    REQUIRE(manager.connection_stats().idle_sessions == 1);
    REQUIRE(manager.connection_stats().active_sessions == 0);

    std::filesystem::remove_all(path_dir);
}

TEST_CASE("Health monitor publishes status changes") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    ClusterConfig config{};
    config.health_check_interval = Duration{0.01};
    manager.create_cluster("web", "", {"a", "b"}, {}, config);
    (void)drain_event_types(manager.events());

    ClusterHealthMonitor& monitor = manager.health_monitor();
    REQUIRE(monitor.run_once(SteadyClock::now()) == 1);
    REQUIRE(drain_event_types(manager.events()) == std::vector<FleetEventType>{FleetEventType::HealthChanged});

    REQUIRE(monitor.run_once(SteadyClock::now() + std::chrono::seconds(1)) == 1);
    REQUIRE(manager.events().size() == 0);

    state->set_exit_code("b.example.net", 1);
    REQUIRE(monitor.run_once(SteadyClock::now() + std::chrono::seconds(2)) == 1);
    const std::optional<FleetEvent> optional_event = manager.events().try_consume();
    REQUIRE(optional_event.has_value());
    REQUIRE(optional_event->subject == "web");
    REQUIRE(manager.cluster_stats().degraded == 1);
    REQUIRE(monitor.error_count() == 0);
}

TEST_CASE("Health monitor skips clusters that are not yet due") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.create_cluster("web", "", {"a"});

    const TimePoint now = SteadyClock::now();
    REQUIRE(manager.health_monitor().run_once(now) == 1);
    REQUIRE(manager.health_monitor().run_once(now + std::chrono::seconds(1)) == 0);
    REQUIRE(manager.health_monitor().run_once(now + std::chrono::seconds(31)) == 1);
}

TEST_CASE("Health monitor treats a re-created cluster as new") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    manager.add_target(make_target("b"));
    manager.create_cluster("web", "", {"a"});
    manager.create_cluster("db", "", {"b"});
    ClusterHealthMonitor& monitor = manager.health_monitor();

    const TimePoint now = SteadyClock::now();
    REQUIRE(monitor.run_once(now) == 2);
    REQUIRE(monitor.tracked_cluster_count() == 2);

    manager.delete_cluster("web");
    manager.create_cluster("web", "", {"a"});
    (void)drain_event_types(manager.events());

    REQUIRE(monitor.run_once(now) == 1);
    const std::optional<FleetEvent> optional_event = manager.events().try_consume();
    REQUIRE(optional_event.has_value());
    REQUIRE(optional_event->type == FleetEventType::HealthChanged);
    REQUIRE(optional_event->subject == "web");
}

TEST_CASE("Health monitor drops state for clusters deleted behind its back") {
    auto state = std::make_shared<FakeFleetState>();
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    TargetRegistry targets{};
    ParallelExecutor executor{pool, ExecutorConfig{}};
    ClusterRegistry clusters{targets, executor};
    FleetEventBus events{};
    ClusterHealthMonitor monitor{clusters, events, Duration{1.0}};

    targets.add_target(make_target("a"));
    clusters.create_cluster("web", "", {"a"}, {}, ClusterConfig{});
    REQUIRE(monitor.run_once(SteadyClock::now()) == 1);
    REQUIRE(monitor.tracked_cluster_count() == 1);

    clusters.delete_cluster("web");
    REQUIRE(monitor.run_once(SteadyClock::now()) == 0);
    REQUIRE(monitor.tracked_cluster_count() == 0);
}

TEST_CASE("Fleet events stay bounded when nobody drains them") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManagerConfig config = quick_config();
    config.event_capacity = 4;
    FleetManager manager{config, make_fake_factory(state)};

    for (int index = 0; index < 10; ++index) {
        manager.add_target(make_target("node-" + std::to_string(index)));
    }

    REQUIRE(manager.events().size() == 4);
    REQUIRE(manager.events().dropped_count() == 6);
    REQUIRE(manager.events().try_consume()->subject == "node-6");
}

TEST_CASE("Concurrent member additions never leave a removed target in a cluster") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("anchor"));
    manager.create_cluster("web", "", {"anchor"});

    for (int round = 0; round < 200; ++round) {
        manager.add_target(make_target("churn"));
        std::thread adder([&manager]() {
            try {
                manager.add_cluster_member("web", "churn");
            } catch (const NotFoundError&) {
            }
        });
        manager.remove_target("churn");
        adder.join();

        const Cluster cluster = manager.get_cluster("web");
        for (const std::string& member : cluster.members) {
            REQUIRE_NOTHROW(manager.get_target(member));
        }
        if (cluster.members.size() > 1) {
            manager.remove_cluster_member("web", "churn");
        }
    }
    REQUIRE(manager.get_cluster("web").members == std::vector<std::string>{"anchor"});
}

TEST_CASE("Background work starts and stops cleanly") {
    auto state = std::make_shared<FakeFleetState>();
    FleetManager manager{quick_config(), make_fake_factory(state)};
    manager.add_target(make_target("a"));
    ClusterConfig config{};
    config.health_check_interval = Duration{0.01};
    manager.create_cluster("web", "", {"a"}, {}, config);

    manager.start();
    REQUIRE(manager.health_monitor().running());
    const TimePoint give_up = SteadyClock::now() + std::chrono::seconds(2);
    while (!manager.get_cluster("web").last_health.has_value() && SteadyClock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    manager.shutdown();

    REQUIRE(manager.get_cluster("web").last_health.has_value());
    REQUIRE_FALSE(manager.health_monitor().running());
    REQUIRE(manager.connection_stats().pool_size == 0);
}

#include <catch2/catch.hpp>

#include "fake_transport.hpp"
#include "logging_test_fixture.hpp"
#include "remote_fleet/errors.hpp"
#include "remote_fleet/parallel_executor.hpp"

using namespace remote_fleet;
using remote_fleet::test::FakeFleetState;
using remote_fleet::test::make_fake_factory;
using remote_fleet::test::make_target;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    remote_fleet::test::ensure_logger_initialized();
    return true;
}();

ExecutorConfig batch_executor_config() {
    ExecutorConfig config{};
    config.max_concurrency = 4;
    config.timeout = Duration{5.0};
    config.retry_attempts = 0;
    return config;
}

BatchSpec make_spec(bool stop_on_failure) {
    BatchSpec spec{};
    spec.name = "deploy";
    spec.targets = {make_target("a"), make_target("b"), make_target("c")};
    spec.commands = {
        BatchCommand{"fetch", "git fetch", "", std::nullopt},
        BatchCommand{"migrate", "migrate --apply", "", std::nullopt},
        BatchCommand{"", "systemctl restart app", "", std::nullopt},
    };
    spec.stop_on_failure = stop_on_failure;
    return spec;
}
}  // namespace

TEST_CASE("A clean batch runs every command in order") {
    auto state = std::make_shared<FakeFleetState>();
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    const BatchReport report = executor.execute_batch(make_spec(true));

    REQUIRE(report.completed);
    REQUIRE_FALSE(report.failed_at.has_value());
    REQUIRE(report.command_order == std::vector<std::string>{"fetch", "migrate", "command_3"});
    REQUIRE(report.total_targets == 3);

    const BatchStatistics stats = report.overall_stats();
    REQUIRE(stats.total_commands == 3);
    REQUIRE(stats.total_executions == 9);
    REQUIRE(stats.successful_executions == 9);
    REQUIRE(stats.success_rate == Approx(100.0));
    REQUIRE(report.failed_targets().empty());
}

TEST_CASE("stop_on_failure halts after the first failing command") {
    auto state = std::make_shared<FakeFleetState>();
    state->set_command_exit_code("migrate --apply", 3);
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    const BatchReport report = executor.execute_batch(make_spec(true));

    REQUIRE_FALSE(report.completed);
    REQUIRE(report.failed_at == std::optional<std::string>{"migrate"});
    REQUIRE(report.results.size() == 2);
    REQUIRE(report.results.count("command_3") == 0);
    REQUIRE(state->executes.load() == 6);
}

TEST_CASE("A single failing target is enough to stop the batch") {
    auto state = std::make_shared<FakeFleetState>();
    state->set_exit_code("b.example.net", 1);
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    const BatchReport report = executor.execute_batch(make_spec(true));

    REQUIRE(report.failed_at == std::optional<std::string>{"fetch"});
    REQUIRE(report.failed_targets() == std::vector<std::string>{"b"});
}

TEST_CASE("Without stop_on_failure every command runs and failures are reported") {
    auto state = std::make_shared<FakeFleetState>();
    state->set_exit_code("c.example.net", 1);
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    const BatchReport report = executor.execute_batch(make_spec(false));

    REQUIRE(report.completed);
    REQUIRE(report.results.size() == 3);
    REQUIRE(report.failed_targets() == std::vector<std::string>{"c"});

    const BatchStatistics stats = report.overall_stats();
    REQUIRE(stats.failed_executions == 3);
    REQUIRE(stats.successful_executions == 6);

    const std::map<std::string, CommandStatistics> map_stats = report.command_stats();
    REQUIRE(map_stats.at("fetch").successful_count == 2);
    REQUIRE(map_stats.at("fetch").failed_count == 1);
    REQUIRE(map_stats.at("fetch").success_rate == Approx(200.0 / 3.0));
}

TEST_CASE("Malformed batches are rejected before anything runs") {
    auto state = std::make_shared<FakeFleetState>();
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    BatchSpec no_commands = make_spec(false);
    no_commands.commands.clear();
    REQUIRE_THROWS_AS(executor.execute_batch(no_commands), ValidationError);

    BatchSpec no_targets = make_spec(false);
    no_targets.targets.clear();
    REQUIRE_THROWS_AS(executor.execute_batch(no_targets), ValidationError);

    BatchSpec duplicate_names = make_spec(false);
    duplicate_names.commands[1].name = "fetch";
    REQUIRE_THROWS_AS(executor.execute_batch(duplicate_names), ValidationError);

    REQUIRE(state->executes.load() == 0);
}

TEST_CASE("A per-command timeout overrides the executor deadline") {
    auto state = std::make_shared<FakeFleetState>();
    state->command_latency = Duration{0.4};
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    BatchSpec spec = make_spec(false);
    spec.targets = {make_target("a")};
    spec.commands = {BatchCommand{"quick", "sleep", "", Duration{0.1}}};

    const BatchReport report = executor.execute_batch(spec);

    REQUIRE(report.results.at("quick").at("a").outcome == ExecutionOutcome::Cancelled);
}

TEST_CASE("A disabled target does not halt a stop-on-failure batch") {
    auto state = std::make_shared<FakeFleetState>();
    ConnectionPool pool{PoolConfig{}, make_fake_factory(state)};
    ParallelExecutor executor{pool, batch_executor_config()};

    BatchSpec spec = make_spec(true);
    spec.targets[1].enabled = false;
    const BatchReport report = executor.execute_batch(spec);

    REQUIRE(report.completed);
    REQUIRE_FALSE(report.failed_at.has_value());
    REQUIRE(report.command_order.size() == 3);
    REQUIRE(report.results.at("migrate").at("b").outcome == ExecutionOutcome::Disabled);
    REQUIRE(state->executes.load() == 6);
}

#include <catch2/catch.hpp>

#include "fake_transport.hpp"
#include "logging_test_fixture.hpp"
#include "remote_fleet/errors.hpp"
#include "remote_fleet/target_registry.hpp"

using namespace remote_fleet;
using remote_fleet::test::make_target;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    remote_fleet::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("TargetRegistry stores targets and lists them by name") {
    TargetRegistry registry{};
    TargetConfig beta = make_target("beta");
    beta.port = 0;
    const TargetConfig stored = registry.add_target(beta);
    registry.add_target(make_target("alpha"));

    REQUIRE(stored.port == k_default_ssh_port);
    REQUIRE(stored.created_at != WallTime{});
    REQUIRE(registry.size() == 2);

    const std::vector<TargetConfig> list_targets = registry.list_targets();
    REQUIRE(list_targets.size() == 2);
    REQUIRE(list_targets[0].name == "alpha");
    REQUIRE(list_targets[1].name == "beta");
}

TEST_CASE("TargetRegistry rejects malformed and duplicate targets") {
    TargetRegistry registry{};
    registry.add_target(make_target("web-1"));

    REQUIRE_THROWS_AS(registry.add_target(make_target("web-1")), DuplicateNameError);

    TargetConfig no_host = make_target("web-2");
    no_host.host.clear();
    REQUIRE_THROWS_AS(registry.add_target(no_host), ValidationError);

    TargetConfig bad_port = make_target("web-3");
    bad_port.port = 70000;
    REQUIRE_THROWS_AS(registry.add_target(bad_port), ValidationError);

    TargetConfig both_credentials = make_target("web-4");
    both_credentials.password = "hunter2";
    REQUIRE_THROWS_AS(registry.add_target(both_credentials), ValidationError);

    TargetConfig missing_password = make_target("web-5");
    missing_password.auth_method = AuthMethod::Password;
    missing_password.key_path.clear();
    REQUIRE_THROWS_AS(registry.add_target(missing_password), ValidationError);

    REQUIRE(registry.size() == 1);
}

TEST_CASE("TargetRegistry update keeps creation time and refuses renames") {
    TargetRegistry registry{};
    const TargetConfig original = registry.add_target(make_target("db"));

    TargetConfig moved = make_target("db", "db-new.example.net");
    moved.port = 2222;
    const TargetConfig previous = registry.update_target("db", moved);

    REQUIRE(previous.host == "db.example.net");
    const TargetConfig current = registry.get_target("db");
    REQUIRE(current.host == "db-new.example.net");
    REQUIRE(current.created_at == original.created_at);
    REQUIRE(connection_string(current) == "ops@db-new.example.net:2222");

    REQUIRE_THROWS_AS(registry.update_target("db", make_target("other")), ValidationError);
    REQUIRE_THROWS_AS(registry.update_target("missing", make_target("missing")), NotFoundError);
}

TEST_CASE("TargetRegistry resolves names and filters by tag") {
    TargetRegistry registry{};
    TargetConfig tagged = make_target("cache");
    tagged.tags = {"redis", "prod"};
    registry.add_target(tagged);
    registry.add_target(make_target("queue"));

    REQUIRE(registry.targets_with_tag("prod").size() == 1);
    REQUIRE(registry.resolve({"queue", "cache"}).front().name == "queue");
    REQUIRE_THROWS_AS(registry.resolve({"cache", "ghost"}), NotFoundError);

    const TargetConfig removed = registry.remove_target("cache");
    REQUIRE(removed.name == "cache");
    REQUIRE_FALSE(registry.contains("cache"));
    REQUIRE_FALSE(registry.find_target("cache").has_value());
    REQUIRE_THROWS_AS(registry.remove_target("cache"), NotFoundError);
}

TEST_CASE("connection_string omits the default port") {
    TargetConfig target = make_target("edge", "edge.example.net");
    REQUIRE(connection_string(target) == "ops@edge.example.net");
    REQUIRE(endpoint_key(target) == "ops@edge.example.net:22");
}

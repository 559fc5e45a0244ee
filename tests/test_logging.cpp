#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "remote_fleet/logging.hpp"

using namespace remote_fleet;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    remote_fleet::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Error text is escaped before it lands in a JSON payload") {
    REQUIRE(json_escape("plain") == "plain");
    REQUIRE(json_escape(R"(bash: "x": not found)") == R"(bash: \"x\": not found)");
    REQUIRE(json_escape("C:\\keys") == "C:\\\\keys");
    REQUIRE(json_escape("line one\nline two\t!") == "line one\\nline two\\t!");
    REQUIRE(json_escape(std::string{"\x01"}) == "\\u0001");
}

TEST_CASE("Log levels are applied by name and unknown names fall back to info") {
    auto logger = get_logger();
    const spdlog::level::level_enum previous = logger->level();

    REQUIRE(set_log_level("debug"));
    REQUIRE(logger->level() == spdlog::level::debug);

    REQUIRE_FALSE(set_log_level("chatty"));
    REQUIRE(logger->level() == spdlog::level::info);

    logger->set_level(previous);
}

TEST_CASE("The shared logger is created only once") {
    LogSettings settings{};
    settings.directory = "/nonexistent/should-not-be-created";
    REQUIRE(initialize_logger(settings) == get_logger());
}

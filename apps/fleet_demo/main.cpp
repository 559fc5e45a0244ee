#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "remote_fleet/config_sync.hpp"
#include "remote_fleet/configuration.hpp"
#include "remote_fleet/fleet_manager.hpp"
#include "remote_fleet/logging.hpp"
#include "remote_fleet/simulated_transport.hpp"
#include "remote_fleet/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr int k_demo_target_count{4};
constexpr char k_demo_cluster_name[] = "web";

void handle_signal(int) {
    should_terminate.store(true);
}

remote_fleet::TargetConfig make_demo_target(int index) {
    remote_fleet::TargetConfig target{};
    target.name = fmt::format("web-{:02}", index);
    target.host = fmt::format("10.0.0.{}", 10 + index);
    target.port = 0;
    target.username = "deploy";
    target.auth_method = remote_fleet::AuthMethod::Key;
    target.key_path = "~/.ssh/id_ed25519";
    target.tags = {"web", "demo"};
    return target;
}

void log_batch_report(const remote_fleet::BatchReport& report) {
    auto logger = remote_fleet::get_logger();
    const remote_fleet::BatchStatistics stats = report.overall_stats();
    logger->info("Batch {}: {}/{} executions succeeded ({:.1f}%) in {:.2f}s, completed={}",
                 report.batch_name,
                 stats.successful_executions,
                 stats.total_executions,
                 stats.success_rate,
                 stats.duration.count(),
                 stats.completed);
    for (const std::string& command_name : report.command_order) {
        for (const auto& [target, result] : report.results.at(command_name)) {
            logger->info("  [{}] {} -> {} exit {} {}",
                         command_name,
                         target,
                         remote_fleet::to_string(result.outcome),
                         result.exit_code,
                         result.success ? result.output : result.error);
        }
    }
    if (report.failed_at.has_value()) {
        logger->warn("Batch {} stopped at {}", report.batch_name, report.failed_at.value());
    }
}

void log_sync_run(const remote_fleet::SyncRun& run) {
    auto logger = remote_fleet::get_logger();
    logger->info("Sync {} ({}): {} ok, {} failed, {} files, checksum {}",
                 run.profile_name,
                 remote_fleet::to_string(run.mode),
                 run.success_count,
                 run.failure_count,
                 run.total_files,
                 run.source_checksum);
    for (const auto& [target, result] : run.results) {
        logger->info("  {} changed={} {}", target, result.changed, result.success ? "ok" : result.error);
    }
}

void run_sync_demo(remote_fleet::FleetManager& manager) {
    const std::filesystem::path path_source = std::filesystem::temp_directory_path() / "remote_fleet_demo_app.conf";
    {
        std::ofstream stream_out(path_source, std::ios::trunc);
        stream_out << "listen_port = 8080\nworkers = 4\n";
    }

    remote_fleet::ConfigSyncManager sync{manager};
    remote_fleet::SyncProfile profile{};
    profile.name = "app-config";
    profile.source_path = path_source;
    profile.target_path = "/etc/app/app.conf";
    profile.cluster = k_demo_cluster_name;
    profile.permissions = "0644";
    sync.create_profile(profile);

    log_sync_run(sync.dry_run(profile.name));
    log_sync_run(sync.sync(profile.name));
    log_sync_run(sync.sync(profile.name));

    std::error_code error_remove;
    std::filesystem::remove(path_source, error_remove);
}
}  // namespace

int main() {
    using namespace remote_fleet;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        if (configuration.log_level.has_value()) {
            set_log_level(configuration.log_level.value());
        }
        auto logger = get_logger();
        logger->info("remote_fleet demo {}", k_version);

        FleetManager manager{configuration.fleet, make_simulated_transport_factory()};

        std::vector<std::string> list_members;
        for (int index = 1; index <= k_demo_target_count; ++index) {
            list_members.push_back(manager.add_target(make_demo_target(index)).name);
        }
        for (const TargetInfo& info : manager.list_targets()) {
            logger->info("Target {} {} auth={} status={}",
                         info.config.name,
                         connection_string(info.config),
                         to_string(info.config.auth_method),
                         to_string(info.status));
        }
        manager.create_cluster(k_demo_cluster_name, "Demo web tier", list_members, {"demo"});

        const ClusterHealth health = manager.check_cluster_health(k_demo_cluster_name);
        logger->info("Cluster {}: {}", k_demo_cluster_name, health.summary());

        const std::vector<BatchCommand> list_commands{
            BatchCommand{"identity", "whoami", "Remote account", std::nullopt},
            BatchCommand{"kernel", "uname -s", "Kernel name", std::nullopt},
            BatchCommand{"broken", "systemctl restart fail-service", "Simulated failure", std::nullopt},
            BatchCommand{"never", "echo unreachable", "Skipped after the failure", std::nullopt},
        };
        log_batch_report(manager.execute_batch_on_cluster(k_demo_cluster_name, list_commands, true));
        run_sync_demo(manager);

        const ConnectionStats connections = manager.connection_stats();
        logger->info("Connections: targets={} active={} idle={} pool={}",
                     connections.total_targets,
                     connections.active_sessions,
                     connections.idle_sessions,
                     connections.pool_size);

        manager.start();
        while (!should_terminate.load()) {
            while (const std::optional<FleetEvent> optional_event = manager.events().try_consume()) {
                logger->info("Event {} {}: {}", to_string(optional_event->type), optional_event->subject, optional_event->message);
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        manager.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

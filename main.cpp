#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "job/Manager.hpp"
#include "runtime/Deps.hpp"
#include "runtime/SignalWatcher.hpp"
#include "runtime/paths.hpp"
#include "services/CloudSyncService.hpp"

#include <iostream>
#include <fmt/core.h>

using namespace cs;

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        std::cerr << "usage: cloudsyncctl <providers|credentials|tasks|run|ls|buckets|crontab> [args...]\n";
        return 2;
    }

    try {
        config::ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init(paths::getLogPath());
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to initialize cloudsync: {}\n", e.what());
        return 1;
    }

    try {
        const auto deps = runtime::Deps::fromConfig(config::ConfigRegistry::get());

        // Before any job thread starts; a signalled run aborts its rclone
        // child and removes the ephemeral config on the way out
        runtime::SignalWatcher signals([&deps](int) { deps.jobs->abortAll(); });

        services::CloudSyncService tasks(deps);
        services::CredentialService credentials(deps);

        cli::Router router;
        cli::registerCommands(router, tasks, credentials);

        cli::CommandCall call;
        call.name = argv[1];
        for (int i = 2; i < argc; ++i) call.positionals.emplace_back(argv[i]);
        call.progress = [](const std::string& line) { fmt::print(stderr, "{}\n", line); };

        const auto result = router.execute(std::move(call));
        if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
        if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
        return result.exit_code;
    } catch (const std::exception& e) {
        log::Registry::cloudsync()->error("[main] {}", e.what());
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
}

#include "rclone/Executor.hpp"
#include "rclone/Config.hpp"
#include "rclone/Process.hpp"
#include "rclone/Progress.hpp"
#include "job/Job.hpp"
#include "log/Registry.hpp"
#include "model/Task.hpp"

#include <mutex>
#include <thread>

using namespace cs::rclone;
using json = nlohmann::json;

namespace {

EphemeralConfig prepare(const ConfigBuilder& builder, const cs::model::CloudSyncTask& task) {
    try {
        return builder.build(task, *task.credential);
    } catch (const std::runtime_error& e) {
        throw ExecutionError(e.what());
    }
}

}

Executor::Executor(const ConfigBuilder& builder, config::RcloneConfig config)
    : builder_(builder), config_(std::move(config)) {}

std::vector<std::string> Executor::transferArgs(const model::CloudSyncTask& task, const EphemeralConfig& config) const {
    std::vector<std::string> args = {config_.binary.string(), "--config", config.configPath().string()};
    if (config_.verbose) args.emplace_back("-v");
    args.insert(args.end(), {"--stats", config_.stats_interval, model::rcloneCommand(task.transfer_mode)});

    if (task.direction == model::Direction::Push) args.insert(args.end(), {task.path, config.remotePath()});
    else args.insert(args.end(), {config.remotePath(), task.path});

    return args;
}

bool Executor::run(job::Job& job, const model::CloudSyncTask& task) const {
    if (!task.credential) throw std::invalid_argument("Cloud sync task " + std::to_string(task.id) + " has no credential loaded");
    // An empty password here means the stored one could not be decrypted;
    // rclone would otherwise encrypt with an empty key.
    if (task.encryption && task.encryption_password.empty())
        throw ExecutionError("Encryption is enabled but the encryption password is missing or cannot be decrypted");

    const auto cfg = prepare(builder_, task);
    const auto args = transferArgs(task, cfg);

    log::Registry::rclone()->info("[Executor] Task {}: {} {} {} -> {}", task.id, model::rcloneCommand(task.transfer_mode),
                                  model::to_string(task.direction), args[args.size() - 2], args.back());

    std::unique_ptr<Process> proc;
    try {
        proc = std::make_unique<Process>(args);
    } catch (const std::runtime_error& e) {
        throw ExecutionError(e.what());
    }

    std::mutex diagnosticsMutex;
    Diagnostics diag;

    std::thread reader([&] {
        try {
            while (const auto line = proc->readLine()) {
                job.appendLog(*line);
                if (const auto transferred = parseTransferred(*line)) job.setProgress(std::nullopt, *transferred);
                std::scoped_lock lock(diagnosticsMutex);
                diag.add(*line);
            }
        } catch (const std::runtime_error& e) {
            log::Registry::rclone()->error("[Executor] Task {}: output reader stopped: {}", task.id, e.what());
        }
    });

    int code = 0;
    bool aborted = false;
    try {
        for (;;) {
            if (const auto c = proc->tryWait()) {
                code = *c;
                break;
            }
            if (job.abortRequested()) {
                log::Registry::rclone()->info("[Executor] Task {}: aborting rclone (pid {})", task.id, proc->pid());
                code = proc->terminate(std::chrono::duration_cast<std::chrono::milliseconds>(config_.kill_grace));
                aborted = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    } catch (const std::exception&) {
        proc->terminate(std::chrono::milliseconds(0));
        reader.join();
        throw;
    }

    // Drain before deciding, so the log holds everything rclone said
    reader.join();

    if (aborted) {
        log::Registry::rclone()->warn("[Executor] Task {}: aborted", task.id);
        throw ExecutionError("Aborted");
    }

    if (code != 0) {
        log::Registry::rclone()->error("[Executor] Task {}: rclone exited with status {}", task.id, code);
        throw ExecutionError(diag.text());
    }

    log::Registry::rclone()->info("[Executor] Task {}: finished", task.id);
    return true;
}

std::vector<json> Executor::list(const model::CloudSyncTask& spec, const std::string& path) const {
    if (!spec.credential) throw std::invalid_argument("Listing requires loaded credentials");

    const auto cfg = prepare(builder_, spec);
    const std::vector<std::string> args = {
        config_.binary.string(), "--config", cfg.configPath().string(), "lsjson", "remote:" + path
    };

    log::Registry::rclone()->debug("[Executor] lsjson remote:{} (credential {})", path, spec.credential->id);

    Process::CaptureResult res;
    try {
        res = Process::capture(args);
    } catch (const std::runtime_error& e) {
        throw ExecutionError(e.what());
    }

    if (res.exitCode != 0) {
        auto err = res.err;
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
        throw ExecutionError(err.empty() ? "rclone lsjson exited with status " + std::to_string(res.exitCode) : err);
    }

    try {
        const auto parsed = json::parse(res.out);
        if (!parsed.is_array()) throw ExecutionError("Unexpected rclone lsjson output");
        return {parsed.begin(), parsed.end()};
    } catch (const json::parse_error& e) {
        throw ExecutionError(std::string("Unable to parse rclone lsjson output: ") + e.what());
    }
}

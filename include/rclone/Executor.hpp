#pragma once

#include "config/Config.hpp"

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::model { struct CloudSyncTask; }
namespace cs::job { class Job; }

namespace cs::rclone {

class ConfigBuilder;
class EphemeralConfig;

// rclone exited non-zero, could not be spawned, or was aborted. what() is
// rclone's own diagnostic text.
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Executor {
public:
    Executor(const ConfigBuilder& builder, config::RcloneConfig config);

    // Runs the transfer, streaming output into the job log and progress.
    // task.credential must be loaded.
    bool run(job::Job& job, const model::CloudSyncTask& task) const;

    // `rclone lsjson remote:<path>` with the task's config
    [[nodiscard]] std::vector<nlohmann::json> list(const model::CloudSyncTask& spec, const std::string& path) const;

    [[nodiscard]] std::vector<std::string> transferArgs(const model::CloudSyncTask& task, const EphemeralConfig& config) const;

private:
    const ConfigBuilder& builder_;
    config::RcloneConfig config_;
};

}

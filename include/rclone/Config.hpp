#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace cs::model {
struct Credential;
struct CloudSyncTask;
}

namespace cs::provider { class Registry; }

namespace cs::rclone {

// An rclone config file owned by exactly one execution. The file is
// unlinked when the owner goes out of scope.
class EphemeralConfig {
public:
    EphemeralConfig(std::filesystem::path configPath, std::string remotePath);
    ~EphemeralConfig();

    EphemeralConfig(const EphemeralConfig&) = delete;
    EphemeralConfig& operator=(const EphemeralConfig&) = delete;
    EphemeralConfig(EphemeralConfig&& other) noexcept;
    EphemeralConfig& operator=(EphemeralConfig&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    // "remote:<bucket>/<folder>", "encrypted:/" or "remote:" when no task
    // attributes were given
    [[nodiscard]] const std::string& remotePath() const { return remotePath_; }

private:
    std::filesystem::path configPath_;
    std::string remotePath_;

    void release() noexcept;
};

struct RenderedConfig {
    std::string contents;
    std::string remotePath;
};

class ConfigBuilder {
public:
    ConfigBuilder(const provider::Registry& registry, std::filesystem::path tmpDir);

    // INI text plus effective remote path. Task attributes are optional
    // (credential-only configs are used to list buckets).
    [[nodiscard]] RenderedConfig render(const model::CloudSyncTask& task,
                                        const model::Credential& credential) const;

    // render() written to a fresh 0600 file under tmpDir
    [[nodiscard]] EphemeralConfig build(const model::CloudSyncTask& task,
                                        const model::Credential& credential) const;

    // Single rclone config value
    static std::string renderValue(const nlohmann::json& value);

private:
    const provider::Registry& registry_;
    std::filesystem::path tmpDir_;
};

}

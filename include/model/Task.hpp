#pragma once

#include "model/Credential.hpp"
#include "model/Schedule.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cs::model {

enum class Direction { Push, Pull };
enum class TransferMode { Sync, Copy, Move };

struct CloudSyncTask {
    uint32_t id{};
    std::string description;
    Direction direction{Direction::Push};
    TransferMode transfer_mode{TransferMode::Sync};
    std::string path;

    uint32_t credential_id{};
    std::optional<Credential> credential;   // populated by extend

    bool encryption{false};
    bool filename_encryption{false};
    std::string encryption_password;        // plaintext in memory only
    std::string encryption_salt;

    Schedule schedule;
    std::optional<nlohmann::json> attributes;
    bool enabled{true};

    // Request payload -> task. Missing required keys, bad types and bad enum
    // values are reported as "<schemaName>.<field>" errors in one throw.
    static CloudSyncTask fromRequest(const nlohmann::json& data, const std::string& schemaName);

    [[nodiscard]] std::string attribute(const std::string& key) const;
};

std::string to_string(Direction d);
std::string to_string(TransferMode m);
Direction directionFromString(const std::string& str);
TransferMode transferModeFromString(const std::string& str);

// lower-case rclone subcommand
std::string rcloneCommand(TransferMode m);

// Public representation; "credentials" is the credential object when loaded,
// the bare id otherwise.
void to_json(nlohmann::json& j, const CloudSyncTask& t);

// Persisted record layout (credential id, flat cron columns). Secrets are
// copied as-is; the caller is responsible for encrypting/decrypting them.
nlohmann::json toRecord(const CloudSyncTask& t);
CloudSyncTask fromRecord(const nlohmann::json& record);

}

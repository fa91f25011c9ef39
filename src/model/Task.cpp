#include "model/Task.hpp"
#include "validation/Errors.hpp"

#include <limits>
#include <optional>
#include <stdexcept>

namespace cs::model {

std::string to_string(const Direction d) {
    switch (d) {
        case Direction::Push: return "PUSH";
        case Direction::Pull: return "PULL";
    }
    return "UNKNOWN";
}

std::string to_string(const TransferMode m) {
    switch (m) {
        case TransferMode::Sync: return "SYNC";
        case TransferMode::Copy: return "COPY";
        case TransferMode::Move: return "MOVE";
    }
    return "UNKNOWN";
}

Direction directionFromString(const std::string& str) {
    if (str == "PUSH") return Direction::Push;
    if (str == "PULL") return Direction::Pull;
    throw std::invalid_argument("Invalid direction: " + str);
}

TransferMode transferModeFromString(const std::string& str) {
    if (str == "SYNC") return TransferMode::Sync;
    if (str == "COPY") return TransferMode::Copy;
    if (str == "MOVE") return TransferMode::Move;
    throw std::invalid_argument("Invalid transfer mode: " + str);
}

std::string rcloneCommand(const TransferMode m) {
    switch (m) {
        case TransferMode::Sync: return "sync";
        case TransferMode::Copy: return "copy";
        case TransferMode::Move: return "move";
    }
    return "sync";
}

std::string CloudSyncTask::attribute(const std::string& key) const {
    if (!attributes || !attributes->is_object() || !attributes->contains(key)) return {};
    const auto& v = (*attributes)[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return {};
    return v.dump();
}

namespace {

template <typename T>
void readField(const nlohmann::json& data, const std::string& key, const std::string& schemaName,
               validation::ValidationErrors& verrors, T& out, const char* typeError) {
    if (!data.contains(key) || data[key].is_null()) return;
    try {
        out = data[key].get<T>();
    } catch (const nlohmann::json::type_error&) {
        verrors.add(schemaName + "." + key, typeError);
    }
}

// Ids are positive and fit the credentials table's key
std::optional<uint32_t> credentialId(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto id = v.get<uint64_t>();
        if (id > 0 && id <= std::numeric_limits<uint32_t>::max()) return static_cast<uint32_t>(id);
    } else if (v.is_number_integer()) {
        const auto id = v.get<int64_t>();
        if (id > 0 && id <= std::numeric_limits<uint32_t>::max()) return static_cast<uint32_t>(id);
    }
    return std::nullopt;
}

}

CloudSyncTask CloudSyncTask::fromRequest(const nlohmann::json& data, const std::string& schemaName) {
    validation::ValidationErrors verrors;
    CloudSyncTask t;

    if (!data.is_object()) {
        verrors.add(schemaName, "Not a dictionary");
        verrors.raiseIfAny();
    }

    t.id = data.value("id", 0u);
    readField(data, "description", schemaName, verrors, t.description, "Not a string");
    readField(data, "path", schemaName, verrors, t.path, "Not a string");
    readField(data, "encryption", schemaName, verrors, t.encryption, "Not a boolean");
    readField(data, "filename_encryption", schemaName, verrors, t.filename_encryption, "Not a boolean");
    readField(data, "encryption_password", schemaName, verrors, t.encryption_password, "Not a string");
    readField(data, "encryption_salt", schemaName, verrors, t.encryption_salt, "Not a string");
    readField(data, "enabled", schemaName, verrors, t.enabled, "Not a boolean");

    for (const auto* key : {"direction", "transfer_mode", "path"}) {
        if (!data.contains(key) || data[key].is_null())
            verrors.add(schemaName + "." + key, "attribute required");
    }

    if (data.contains("direction") && data["direction"].is_string()) {
        try { t.direction = directionFromString(data["direction"].get<std::string>()); }
        catch (const std::invalid_argument&) {
            verrors.add(schemaName + ".direction", "Invalid choice: " + data["direction"].get<std::string>());
        }
    } else if (data.contains("direction") && !data["direction"].is_null()) {
        verrors.add(schemaName + ".direction", "Not a string");
    }

    if (data.contains("transfer_mode") && data["transfer_mode"].is_string()) {
        try { t.transfer_mode = transferModeFromString(data["transfer_mode"].get<std::string>()); }
        catch (const std::invalid_argument&) {
            verrors.add(schemaName + ".transfer_mode", "Invalid choice: " + data["transfer_mode"].get<std::string>());
        }
    } else if (data.contains("transfer_mode") && !data["transfer_mode"].is_null()) {
        verrors.add(schemaName + ".transfer_mode", "Not a string");
    }

    if (!data.contains("credentials") || data["credentials"].is_null()) {
        verrors.add(schemaName + ".credentials", "attribute required");
    } else if (const auto& c = data["credentials"];
               const auto id = credentialId(c.is_object() && c.contains("id") ? c["id"] : c)) {
        t.credential_id = *id;
    } else {
        verrors.add(schemaName + ".credentials", "Not an integer");
    }

    if (data.contains("schedule") && !data["schedule"].is_null()) {
        const auto& s = data["schedule"];
        if (!s.is_object()) verrors.add(schemaName + ".schedule", "Not a dictionary");
        else {
            bool allStrings = true;
            for (const auto& [k, v] : s.items()) {
                if (v.is_string()) continue;
                verrors.add(schemaName + ".schedule." + k, "Not a string");
                allStrings = false;
            }
            if (allStrings) t.schedule = s.get<Schedule>();
        }
    }

    if (data.contains("attributes") && !data["attributes"].is_null()) {
        if (!data["attributes"].is_object()) verrors.add(schemaName + ".attributes", "Not a dictionary");
        else t.attributes = data["attributes"];
    } else {
        t.attributes = nlohmann::json::object();
    }

    verrors.raiseIfAny();
    return t;
}

void to_json(nlohmann::json& j, const CloudSyncTask& t) {
    j = {
        {"id", t.id},
        {"description", t.description},
        {"direction", to_string(t.direction)},
        {"transfer_mode", to_string(t.transfer_mode)},
        {"path", t.path},
        {"encryption", t.encryption},
        {"filename_encryption", t.filename_encryption},
        {"encryption_password", t.encryption_password},
        {"encryption_salt", t.encryption_salt},
        {"schedule", t.schedule},
        {"attributes", t.attributes ? *t.attributes : nlohmann::json::object()},
        {"enabled", t.enabled}
    };

    if (t.credential) j["credentials"] = *t.credential;
    else j["credentials"] = t.credential_id;
}

nlohmann::json toRecord(const CloudSyncTask& t) {
    nlohmann::json r = {
        {"description", t.description},
        {"direction", to_string(t.direction)},
        {"transfer_mode", to_string(t.transfer_mode)},
        {"path", t.path},
        {"credential", t.credential_id},
        {"encryption", t.encryption},
        {"filename_encryption", t.filename_encryption},
        {"encryption_password", t.encryption_password},
        {"encryption_salt", t.encryption_salt},
        {"attributes", t.attributes ? *t.attributes : nlohmann::json::object()},
        {"enabled", t.enabled}
    };
    t.schedule.toDbFormat(r);
    return r;
}

CloudSyncTask fromRecord(const nlohmann::json& record) {
    CloudSyncTask t;
    t.id = record.value("id", 0u);
    t.description = record.value("description", "");
    t.direction = directionFromString(record.value("direction", "PUSH"));
    t.transfer_mode = transferModeFromString(record.value("transfer_mode", "SYNC"));
    t.path = record.value("path", "");
    t.credential_id = record.value("credential", 0u);
    t.encryption = record.value("encryption", false);
    t.filename_encryption = record.value("filename_encryption", false);
    t.encryption_password = record.value("encryption_password", "");
    t.encryption_salt = record.value("encryption_salt", "");
    t.schedule = Schedule::fromDbFormat(record);
    t.attributes = record.contains("attributes") && record["attributes"].is_object()
        ? record["attributes"] : nlohmann::json::object();
    t.enabled = record.value("enabled", true);
    return t;
}

}

#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["rclone"]) YAML::convert<RcloneConfig>::decode(node, cfg.rclone);
    if (auto node = root["runtime"]) YAML::convert<RuntimeConfig>::decode(node, cfg.runtime);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["secrets"]) YAML::convert<SecretsConfig>::decode(node, cfg.secrets);
    if (auto node = root["cron"]) YAML::convert<CronConfig>::decode(node, cfg.cron);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string to_string(const DatabaseConfig::Backend b) {
    switch (b) {
        case DatabaseConfig::Backend::Memory: return "memory";
        case DatabaseConfig::Backend::Postgres: return "postgres";
    }
    return "unknown";
}

DatabaseConfig::Backend backendFromString(const std::string& str) {
    if (str == "memory") return DatabaseConfig::Backend::Memory;
    if (str == "postgres" || str == "postgresql") return DatabaseConfig::Backend::Postgres;
    throw std::invalid_argument("Invalid database backend: " + str);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"rclone", c.rclone},
        {"runtime", c.runtime},
        {"database", c.database},
        {"secrets", c.secrets},
        {"cron", c.cron},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const RcloneConfig& c) {
    j = {
        {"binary", c.binary.string()},
        {"stats_interval", c.stats_interval},
        {"verbose", c.verbose},
        {"kill_grace_seconds", c.kill_grace.count()}
    };
}

void to_json(nlohmann::json& j, const RuntimeConfig& c) {
    j = {{"tmp_dir", c.tmp_dir.string()}};
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"backend", to_string(c.backend)},
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user}
        // Do not serialize password
    };
}

void to_json(nlohmann::json& j, const SecretsConfig& c) {
    j = {{"key_file", c.key_file.string()}};
}

void to_json(nlohmann::json& j, const CronConfig& c) {
    j = {
        {"crontab_path", c.crontab_path.string()},
        {"user", c.user},
        {"ctl_binary", c.ctl_binary.string()}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    const auto lvl = [](const spdlog::level::level_enum l) {
        return YAML::to_std_string(spdlog::level::to_string_view(l));
    };

    j = {
        {"cloudsync", lvl(c.cloudsync)},
        {"provider", lvl(c.provider)},
        {"rclone", lvl(c.rclone)},
        {"crypto", lvl(c.crypto)},
        {"db", lvl(c.db)},
        {"cron", lvl(c.cron)},
        {"jobs", lvl(c.jobs)}
    };
}

} // namespace cs::config

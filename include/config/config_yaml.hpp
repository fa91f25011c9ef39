#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<RcloneConfig> {
    static Node encode(const RcloneConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary.string();
        node["stats_interval"] = rhs.stats_interval;
        node["verbose"] = rhs.verbose;
        node["kill_grace_seconds"] = rhs.kill_grace.count();
        return node;
    }

    static bool decode(const Node& node, RcloneConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>("/usr/bin/rclone");
        rhs.stats_interval = node["stats_interval"].as<std::string>("1s");
        rhs.verbose = node["verbose"].as<bool>(true);
        rhs.kill_grace = std::chrono::seconds(node["kill_grace_seconds"].as<unsigned int>(5));
        return true;
    }
};

template<>
struct convert<RuntimeConfig> {
    static Node encode(const RuntimeConfig& rhs) {
        Node node;
        node["tmp_dir"] = rhs.tmp_dir.string();
        return node;
    }

    static bool decode(const Node& node, RuntimeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tmp_dir = node["tmp_dir"].as<std::string>("/run/cloudsync");
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["backend"] = to_string(rhs.backend);
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password"] = rhs.password;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = backendFromString(node["backend"].as<std::string>("postgres"));
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("cloudsync");
        rhs.user = node["user"].as<std::string>("cloudsync");
        rhs.password = node["password"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SecretsConfig> {
    static Node encode(const SecretsConfig& rhs) {
        Node node;
        node["key_file"] = rhs.key_file.string();
        return node;
    }

    static bool decode(const Node& node, SecretsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.key_file = node["key_file"].as<std::string>("/var/lib/cloudsync/pwenc_secret");
        return true;
    }
};

template<>
struct convert<CronConfig> {
    static Node encode(const CronConfig& rhs) {
        Node node;
        node["crontab_path"] = rhs.crontab_path.string();
        node["user"] = rhs.user;
        node["ctl_binary"] = rhs.ctl_binary.string();
        return node;
    }

    static bool decode(const Node& node, CronConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.crontab_path = node["crontab_path"].as<std::string>("/etc/cron.d/cloudsync");
        rhs.user = node["user"].as<std::string>("root");
        rhs.ctl_binary = node["ctl_binary"].as<std::string>("/usr/bin/cloudsyncctl");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cloudsync"] = to_std_string(spdlog::level::to_string_view(rhs.cloudsync));
        node["provider"]  = to_std_string(spdlog::level::to_string_view(rhs.provider));
        node["rclone"]    = to_std_string(spdlog::level::to_string_view(rhs.rclone));
        node["crypto"]    = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["cron"]      = to_std_string(spdlog::level::to_string_view(rhs.cron));
        node["jobs"]      = to_std_string(spdlog::level::to_string_view(rhs.jobs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cloudsync = spdlog::level::from_str(node["cloudsync"].as<std::string>("info"));
        rhs.provider = spdlog::level::from_str(node["provider"].as<std::string>("warn"));
        rhs.rclone = spdlog::level::from_str(node["rclone"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.cron = spdlog::level::from_str(node["cron"].as<std::string>("info"));
        rhs.jobs = spdlog::level::from_str(node["jobs"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/cloudsync");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cs::config {

struct RcloneConfig {
    std::filesystem::path binary = "/usr/bin/rclone";
    std::string stats_interval = "1s";
    bool verbose = true;
    std::chrono::seconds kill_grace{5};
};

struct RuntimeConfig {
    std::filesystem::path tmp_dir = "/run/cloudsync";
};

struct DatabaseConfig {
    enum class Backend { Memory, Postgres };

    Backend backend = Backend::Postgres;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "cloudsync";
    std::string user = "cloudsync";
    std::string password;
};

struct SecretsConfig {
    std::filesystem::path key_file = "/var/lib/cloudsync/pwenc_secret";
};

struct CronConfig {
    std::filesystem::path crontab_path = "/etc/cron.d/cloudsync";
    std::string user = "root";
    std::filesystem::path ctl_binary = "/usr/bin/cloudsyncctl";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cloudsync = spdlog::level::info;  // Startup, CRUD, run lifecycle
    spdlog::level::level_enum provider  = spdlog::level::warn;  // Registration and pre-save hooks
    spdlog::level::level_enum rclone    = spdlog::level::info;  // Process spawn/exit, listings
    spdlog::level::level_enum crypto    = spdlog::level::warn;
    spdlog::level::level_enum db        = spdlog::level::err;
    spdlog::level::level_enum cron      = spdlog::level::info;
    spdlog::level::level_enum jobs      = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/cloudsync";
    LogLevelsConfig levels;
};

struct Config {
    RcloneConfig rclone;
    RuntimeConfig runtime;
    DatabaseConfig database;
    SecretsConfig secrets;
    CronConfig cron;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::string to_string(DatabaseConfig::Backend b);
DatabaseConfig::Backend backendFromString(const std::string& str);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const RcloneConfig& c);
void to_json(nlohmann::json& j, const RuntimeConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const SecretsConfig& c);
void to_json(nlohmann::json& j, const CronConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace cs::config

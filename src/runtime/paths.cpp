#include "runtime/paths.hpp"
#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <optional>

namespace cs::paths {

static constexpr auto DEFAULT_CONFIG_PATH = "/etc/cloudsync/config.yaml";

static std::optional<std::filesystem::path> configOverride;
static std::optional<std::filesystem::path> logOverride;

std::filesystem::path getConfigPath() {
    if (configOverride) return *configOverride;
    if (const char* env = std::getenv("CS_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getLogPath() {
    if (logOverride) return *logOverride;
    return config::ConfigRegistry::get().logging.log_dir;
}

std::filesystem::path getJobLogPath() { return getLogPath() / "jobs"; }

void setConfigPath(const std::filesystem::path& path) { configOverride = path; }

void setLogPathForTesting() {
    logOverride = std::filesystem::temp_directory_path() / "cloudsync_test_logs";
    // tests run without a config file unless one is provided explicitly
    if (!configOverride) configOverride = std::filesystem::temp_directory_path() / "cloudsync_test_config.yaml";
}

}

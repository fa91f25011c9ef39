#include "rclone/Config.hpp"
#include "crypto/Obscure.hpp"
#include "log/Registry.hpp"
#include "model/Task.hpp"
#include "provider/Registry.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace cs::rclone;
using namespace cs::crypto;
using json = nlohmann::json;

EphemeralConfig::EphemeralConfig(std::filesystem::path configPath, std::string remotePath)
    : configPath_(std::move(configPath)), remotePath_(std::move(remotePath)) {}

EphemeralConfig::~EphemeralConfig() { release(); }

EphemeralConfig::EphemeralConfig(EphemeralConfig&& other) noexcept
    : configPath_(std::move(other.configPath_)), remotePath_(std::move(other.remotePath_)) {
    other.configPath_.clear();
}

EphemeralConfig& EphemeralConfig::operator=(EphemeralConfig&& other) noexcept {
    if (this != &other) {
        release();
        configPath_ = std::move(other.configPath_);
        remotePath_ = std::move(other.remotePath_);
        other.configPath_.clear();
    }
    return *this;
}

void EphemeralConfig::release() noexcept {
    if (configPath_.empty()) return;
    if (::unlink(configPath_.c_str()) != 0 && errno != ENOENT && log::Registry::isInitialized())
        log::Registry::rclone()->warn("[EphemeralConfig] Failed to remove {}: {}", configPath_.string(), std::strerror(errno));
    configPath_.clear();
}

ConfigBuilder::ConfigBuilder(const provider::Registry& registry, std::filesystem::path tmpDir)
    : registry_(registry), tmpDir_(std::move(tmpDir)) {}

std::string ConfigBuilder::renderValue(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_null()) return "";
    return value.dump();
}

namespace {

void merge(json& into, const json& from) {
    if (!from.is_object()) return;
    for (const auto& [k, v] : from.items()) into[k] = v;
}

std::string trimSlashes(const std::string& s) {
    const auto first = s.find_first_not_of('/');
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of('/');
    return s.substr(first, last - first + 1);
}

}

RenderedConfig ConfigBuilder::render(const model::CloudSyncTask& task, const model::Credential& credential) const {
    const auto& provider = registry_.get(credential.provider);

    json config = json::object();
    merge(config, credential.attributes);
    config["type"] = provider.rcloneType();
    merge(config, provider.getCredentialsExtra(credential));

    RenderedConfig out;
    out.remotePath = "remote:";

    if (task.attributes) {
        merge(config, *task.attributes);
        merge(config, provider.getTaskExtra(task));

        out.remotePath = "remote:" + trimSlashes(task.attribute("bucket") + "/" + task.attribute("folder"));

        if (task.encryption) {
            out.contents += "[encrypted]\n";
            out.contents += "type = crypt\n";
            out.contents += fmt::format("remote = {}\n", out.remotePath);
            out.contents += fmt::format("filename_encryption = {}\n", task.filename_encryption ? "standard" : "off");
            out.contents += fmt::format("password = {}\n", Obscure::obscure(task.encryption_password));
            if (!task.encryption_salt.empty())
                out.contents += fmt::format("password2 = {}\n", Obscure::obscure(task.encryption_salt));

            out.remotePath = "encrypted:/";
        }
    }

    if (config.contains("pass")) config["pass"] = Obscure::obscure(renderValue(config["pass"]));

    out.contents += "[remote]\n";
    out.contents += fmt::format("type = {}\n", renderValue(config["type"]));
    for (const auto& [k, v] : config.items()) {
        if (k == "type") continue;
        out.contents += fmt::format("{} = {}\n", k, renderValue(v));
    }

    return out;
}

EphemeralConfig ConfigBuilder::build(const model::CloudSyncTask& task, const model::Credential& credential) const {
    const auto rendered = render(task, credential);

    std::filesystem::create_directories(tmpDir_);

    std::string tmpl = (tmpDir_ / "rclone-XXXXXX.conf").string();
    const int fd = ::mkostemps(tmpl.data(), 5, O_CLOEXEC);
    if (fd < 0) throw std::runtime_error(fmt::format("Failed to create rclone config in {}: {}", tmpDir_.string(), std::strerror(errno)));

    // Owns the path from here on, including on the error paths below
    EphemeralConfig cfg(tmpl, rendered.remotePath);

    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error(fmt::format("Failed to chmod rclone config {}: {}", tmpl, std::strerror(err)));
    }

    const char* data = rendered.contents.data();
    const size_t total = rendered.contents.size();
    size_t written = 0;
    while (written < total) {
        const ssize_t n = ::write(fd, data + written, total - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            const int err = errno;
            ::close(fd);
            throw std::runtime_error(fmt::format("Failed to write rclone config {}: {}", tmpl, std::strerror(err)));
        }
        written += static_cast<size_t>(n);
    }

    int err = ::fsync(fd) != 0 ? errno : 0;
    if (::close(fd) != 0 && err == 0) err = errno;
    if (err != 0) throw std::runtime_error(fmt::format("Failed to flush rclone config {}: {}", tmpl, std::strerror(err)));

    log::Registry::rclone()->debug("[ConfigBuilder] Wrote config {} for credential {}", tmpl, credential.id);
    return cfg;
}

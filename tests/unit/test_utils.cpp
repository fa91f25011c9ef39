#include "test_utils.hpp"

#include "crypto/KeyFileSecretStore.hpp"
#include "db/MemoryStore.hpp"
#include "job/Manager.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cs::test {

TempDir::TempDir(const std::string& prefix) {
    std::random_device rd;
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = fs::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
        if (fs::create_directories(candidate)) {
            path_ = std::move(candidate);
            return;
        }
    }
    throw std::runtime_error("Unable to create temp directory for " + prefix);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path writeFakeRclone(const fs::path& dir, const std::string& body) {
    const auto path = dir / "rclone";
    writeFile(path, "#!/bin/sh\n" + body + "\n");
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    return path;
}

void RecordingScheduler::refresh(const std::vector<model::CloudSyncTask>& tasks) {
    std::scoped_lock lock(mutex_);
    ++refreshes_;
    lastIds_.clear();
    for (const auto& t : tasks) lastIds_.push_back(t.id);
}

size_t RecordingScheduler::refreshCount() const {
    std::scoped_lock lock(mutex_);
    return refreshes_;
}

std::vector<uint32_t> RecordingScheduler::lastTaskIds() const {
    std::scoped_lock lock(mutex_);
    return lastIds_;
}

config::Config makeConfig(const fs::path& dir, const fs::path& rcloneBinary) {
    config::Config cfg;
    cfg.rclone.binary = rcloneBinary;
    cfg.rclone.kill_grace = std::chrono::seconds(1);
    cfg.runtime.tmp_dir = dir / "run";
    cfg.database.backend = config::DatabaseConfig::Backend::Memory;
    cfg.secrets.key_file = dir / "pwenc_secret";
    cfg.cron.crontab_path = dir / "cron.d" / "cloudsync";
    cfg.logging.log_dir = dir / "log";
    return cfg;
}

runtime::Deps makeDeps(const fs::path& dir, const fs::path& rcloneBinary, std::shared_ptr<RecordingScheduler> scheduler) {
    const auto cfg = makeConfig(dir, rcloneBinary);
    return runtime::Deps::assemble(cfg,
                                   std::make_shared<db::MemoryStore>(),
                                   std::make_shared<crypto::KeyFileSecretStore>(cfg.secrets.key_file),
                                   std::move(scheduler),
                                   std::make_shared<job::Manager>(cfg.logging.log_dir / "jobs", cfg.runtime.tmp_dir / "locks"));
}

}

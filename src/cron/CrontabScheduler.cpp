#include "cron/CrontabScheduler.hpp"
#include "log/Registry.hpp"
#include "model/Task.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <fmt/core.h>

using namespace cs::cron;

CrontabScheduler::CrontabScheduler(config::CronConfig config) : config_(std::move(config)) {}

std::string CrontabScheduler::render(const std::vector<model::CloudSyncTask>& tasks) const {
    std::string out = "# Managed by cloudsync, do not edit\n"
                      "SHELL=/bin/sh\n"
                      "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin\n\n";

    for (const auto& t : tasks) {
        if (!t.enabled) continue;
        out += fmt::format("{} {} {} run {}\n", t.schedule.toCronLine(), config_.user, config_.ctl_binary.string(), t.id);
    }
    return out;
}

void CrontabScheduler::refresh(const std::vector<model::CloudSyncTask>& tasks) {
    namespace fs = std::filesystem;

    const auto& target = config_.crontab_path;
    if (target.has_parent_path()) fs::create_directories(target.parent_path());

    const auto tmp = fs::path(target.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Unable to write " + tmp.string());
        out << render(tasks);
        out.flush();
        if (!out) throw std::runtime_error("Unable to write " + tmp.string());
    }

    if (::chmod(tmp.c_str(), S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0)
        throw std::runtime_error(fmt::format("Unable to chmod {}: {}", tmp.string(), std::strerror(errno)));

    fs::rename(tmp, target);

    const auto enabled = std::ranges::count_if(tasks, [](const model::CloudSyncTask& t) { return t.enabled; });
    log::Registry::cron()->info("[CrontabScheduler] Wrote {} entries to {}", enabled, target.string());
}

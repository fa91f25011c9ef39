#pragma once

#include "cron/Scheduler.hpp"
#include "config/Config.hpp"

#include <string>

namespace cs::cron {

// Owns one cron.d file with a line per enabled task that invokes
// `<ctl_binary> run <id>`.
class CrontabScheduler final : public Scheduler {
public:
    explicit CrontabScheduler(config::CronConfig config);

    void refresh(const std::vector<model::CloudSyncTask>& tasks) override;

    [[nodiscard]] std::string render(const std::vector<model::CloudSyncTask>& tasks) const;

private:
    config::CronConfig config_;
};

}

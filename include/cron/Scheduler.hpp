#pragma once

#include <vector>

namespace cs::model { struct CloudSyncTask; }

namespace cs::cron {

// Re-arms periodic triggers after the task set changed
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual void refresh(const std::vector<model::CloudSyncTask>& tasks) = 0;
};

}

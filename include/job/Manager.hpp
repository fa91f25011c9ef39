#pragma once

#include "job/Job.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cs::job {

class FileLock;

// Runs jobs on their own threads. Jobs sharing a lock key run one at a time
// with at most one waiting behind the running one; further submissions
// return the waiting job.
//
// The same rule holds across processes through lock files in `lockDir`: a
// job holds <key>.lock while it runs, one job may wait on it while holding
// <key>.queue.lock, and a job that finds both taken finishes at once with
// ALREADY_QUEUED as its result.
class Manager {
public:
    static constexpr const char* ALREADY_QUEUED = "Already queued";

    Manager(std::filesystem::path logDir, std::filesystem::path lockDir);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    std::shared_ptr<Job> submit(const std::string& method, const std::string& lockKey, Job::Fn fn);

    [[nodiscard]] std::shared_ptr<Job> find(uint64_t id) const;
    [[nodiscard]] std::vector<std::shared_ptr<Job>> jobs() const;

    void abortAll();

    // Joins every job thread started so far
    void shutdown();

private:
    struct Pending {
        std::shared_ptr<Job> job;
        Job::Fn fn;
    };

    struct LockSlot {
        std::shared_ptr<Job> running;
        std::optional<Pending> queued;
    };

    std::filesystem::path logDir_;
    std::filesystem::path lockDir_;

    mutable std::mutex mutex_;
    uint64_t nextId_{1};
    std::unordered_map<std::string, LockSlot> locks_;
    std::vector<std::shared_ptr<Job>> jobs_;
    std::vector<std::thread> threads_;

    std::filesystem::path logPathFor(uint64_t id, const std::string& lockKey) const;

    // Holds the cross-process run lock for `job`, or finishes the job and
    // returns nullptr when it is coalesced or aborted while waiting
    std::unique_ptr<FileLock> acquire(Job& job) const;

    void launch(std::shared_ptr<Job> job, Job::Fn fn);
    void execute(const std::shared_ptr<Job>& job, const Job::Fn& fn);
    void release(const std::shared_ptr<Job>& job);
};

}

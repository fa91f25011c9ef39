#include "job/Manager.hpp"
#include "job/FileLock.hpp"
#include "log/Registry.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <memory>
#include <thread>
#include <fmt/core.h>

using namespace cs::job;

namespace {

constexpr auto LOCK_POLL_INTERVAL = std::chrono::milliseconds(100);

// "cloud_sync:5" -> "cloud_sync_5"
std::string fileStem(std::string key) {
    std::ranges::replace_if(key, [](const unsigned char c) { return !std::isalnum(c) && c != '_' && c != '-'; }, '_');
    return key;
}

}

Manager::Manager(std::filesystem::path logDir, std::filesystem::path lockDir)
    : logDir_(std::move(logDir)), lockDir_(std::move(lockDir)) {}

Manager::~Manager() {
    abortAll();
    shutdown();
}

std::shared_ptr<Job> Manager::submit(const std::string& method, const std::string& lockKey, Job::Fn fn) {
    std::scoped_lock lock(mutex_);

    auto& slot = locks_[lockKey];
    if (slot.queued) {
        log::Registry::jobs()->debug("[Manager] {} already queued behind job {}, returning job {}",
                                     lockKey, slot.running ? slot.running->id() : 0, slot.queued->job->id());
        return slot.queued->job;
    }

    const auto id = nextId_++;
    auto job = std::make_shared<Job>(id, method, lockKey, logPathFor(id, lockKey));
    jobs_.push_back(job);

    if (!slot.running) {
        slot.running = job;
        launch(job, std::move(fn));
    } else {
        slot.queued = Pending{job, std::move(fn)};
        log::Registry::jobs()->info("[Manager] Job {} ({}) waiting on lock {}", id, method, lockKey);
    }

    return job;
}

// Job ids restart in every process, so the file name also carries the pid
// and the submission time
std::filesystem::path Manager::logPathFor(const uint64_t id, const std::string& lockKey) const {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return logDir_ / fmt::format("{}-{}-{}-{}.log", fileStem(lockKey), now, ::getpid(), id);
}

std::unique_ptr<FileLock> Manager::acquire(Job& job) const {
    const auto stem = fileStem(job.lockKey());

    auto run = std::make_unique<FileLock>(lockDir_ / (stem + ".lock"));
    if (run->tryLock()) return run;

    FileLock queue(lockDir_ / (stem + ".queue.lock"));
    if (!queue.tryLock()) {
        log::Registry::jobs()->info("[Manager] Job {} ({}): {} is running and already queued elsewhere",
                                    job.id(), job.method(), job.lockKey());
        job.finish(State::Success, ALREADY_QUEUED, {});
        return nullptr;
    }

    log::Registry::jobs()->info("[Manager] Job {} ({}) waiting on {} held by another process",
                                job.id(), job.method(), run->path().string());

    while (!run->tryLock()) {
        if (job.abortRequested()) {
            job.finish(State::Aborted, nullptr, "Aborted");
            return nullptr;
        }
        std::this_thread::sleep_for(LOCK_POLL_INTERVAL);
    }
    return run;
}

void Manager::launch(std::shared_ptr<Job> job, Job::Fn fn) {
    threads_.emplace_back([this, job = std::move(job), fn = std::move(fn)] {
        execute(job, fn);
        release(job);
    });
}

void Manager::execute(const std::shared_ptr<Job>& job, const Job::Fn& fn) {
    if (job->abortRequested()) {
        job->finish(State::Aborted, nullptr, "Aborted");
        return;
    }

    std::unique_ptr<FileLock> runLock;
    try {
        runLock = acquire(*job);
    } catch (const std::exception& e) {
        log::Registry::jobs()->error("[Manager] Job {} ({}) could not take its lock: {}", job->id(), job->method(), e.what());
        job->finish(State::Failed, nullptr, e.what());
        return;
    }
    if (!runLock) return;

    job->setRunning();
    log::Registry::jobs()->info("[Manager] Job {} ({}) started", job->id(), job->method());

    try {
        auto result = fn(*job);
        if (job->abortRequested()) job->finish(State::Aborted, nullptr, "Aborted");
        else job->finish(State::Success, std::move(result), {});
    } catch (const std::exception& e) {
        if (job->abortRequested()) {
            job->finish(State::Aborted, nullptr, e.what());
        } else {
            log::Registry::jobs()->error("[Manager] Job {} ({}) failed: {}", job->id(), job->method(), e.what());
            job->finish(State::Failed, nullptr, e.what());
        }
    }

    log::Registry::jobs()->info("[Manager] Job {} ({}) finished: {}", job->id(), job->method(), to_string(job->state()));
}

void Manager::release(const std::shared_ptr<Job>& job) {
    std::scoped_lock lock(mutex_);

    const auto it = locks_.find(job->lockKey());
    if (it == locks_.end() || it->second.running != job) return;

    auto& slot = it->second;
    if (!slot.queued) {
        locks_.erase(it);
        return;
    }

    auto next = std::move(*slot.queued);
    slot.queued.reset();
    slot.running = next.job;
    launch(std::move(next.job), std::move(next.fn));
}

std::shared_ptr<Job> Manager::find(const uint64_t id) const {
    std::scoped_lock lock(mutex_);
    for (const auto& j : jobs_) if (j->id() == id) return j;
    return nullptr;
}

std::vector<std::shared_ptr<Job>> Manager::jobs() const {
    std::scoped_lock lock(mutex_);
    return jobs_;
}

void Manager::abortAll() {
    std::scoped_lock lock(mutex_);
    for (const auto& j : jobs_) if (!j->finished()) j->abort();
}

void Manager::shutdown() {
    for (;;) {
        std::vector<std::thread> threads;
        {
            std::scoped_lock lock(mutex_);
            threads.swap(threads_);
        }
        if (threads.empty()) return;
        for (auto& t : threads) if (t.joinable()) t.join();
    }
}

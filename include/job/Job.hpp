#pragma once

#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cs::job {

enum class State { Waiting, Running, Success, Failed, Aborted };

std::string to_string(State s);

struct Progress {
    std::optional<int> percent;
    std::string description;
};

class Job {
public:
    using Fn = std::function<nlohmann::json(Job&)>;
    using ProgressCallback = std::function<void(const Progress&)>;

    static constexpr size_t LOG_TAIL_LINES = 200;

    Job(uint64_t id, std::string method, std::string lockKey, std::filesystem::path logPath);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const std::string& method() const { return method_; }
    [[nodiscard]] const std::string& lockKey() const { return lockKey_; }
    [[nodiscard]] const std::filesystem::path& logPath() const { return logPath_; }

    [[nodiscard]] State state() const;
    [[nodiscard]] Progress progress() const;
    [[nodiscard]] nlohmann::json result() const;
    [[nodiscard]] std::string error() const;
    [[nodiscard]] bool finished() const;

    // percent stays unset for rclone's free-form "Transferred:" text
    void setProgress(std::optional<int> percent, const std::string& description);
    void onProgress(ProgressCallback cb);

    // Appends to the job log file and keeps the last LOG_TAIL_LINES in memory
    void appendLog(const std::string& line);
    [[nodiscard]] std::vector<std::string> logTail() const;

    void abort();
    [[nodiscard]] bool abortRequested() const { return abort_.load(); }

    // Blocks until the job reaches a terminal state
    State wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] nlohmann::json toJson() const;

private:
    friend class Manager;

    const uint64_t id_;
    const std::string method_, lockKey_;
    const std::filesystem::path logPath_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    State state_{State::Waiting};
    Progress progress_;
    nlohmann::json result_;
    std::string error_;
    ProgressCallback progressCb_;

    std::mutex logMutex_;
    std::ofstream logFile_;
    std::deque<std::string> tail_;
    mutable std::mutex tailMutex_;

    std::atomic<bool> abort_{false};

    void setRunning();
    void finish(State state, nlohmann::json result, std::string error);
};

}

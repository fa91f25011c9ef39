#include "job/Job.hpp"
#include "log/Registry.hpp"

using namespace cs::job;
using json = nlohmann::json;

std::string cs::job::to_string(const State s) {
    switch (s) {
        case State::Waiting: return "WAITING";
        case State::Running: return "RUNNING";
        case State::Success: return "SUCCESS";
        case State::Failed: return "FAILED";
        case State::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

Job::Job(const uint64_t id, std::string method, std::string lockKey, std::filesystem::path logPath)
    : id_(id), method_(std::move(method)), lockKey_(std::move(lockKey)), logPath_(std::move(logPath)) {}

State Job::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

Progress Job::progress() const {
    std::scoped_lock lock(mutex_);
    return progress_;
}

json Job::result() const {
    std::scoped_lock lock(mutex_);
    return result_;
}

std::string Job::error() const {
    std::scoped_lock lock(mutex_);
    return error_;
}

bool Job::finished() const {
    const auto s = state();
    return s != State::Waiting && s != State::Running;
}

void Job::setProgress(const std::optional<int> percent, const std::string& description) {
    ProgressCallback cb;
    Progress snapshot;
    {
        std::scoped_lock lock(mutex_);
        progress_.percent = percent;
        progress_.description = description;
        snapshot = progress_;
        cb = progressCb_;
    }
    if (cb) cb(snapshot);
}

void Job::onProgress(ProgressCallback cb) {
    std::scoped_lock lock(mutex_);
    progressCb_ = std::move(cb);
}

void Job::appendLog(const std::string& line) {
    {
        std::scoped_lock lock(logMutex_);
        if (!logFile_.is_open() && !logPath_.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(logPath_.parent_path(), ec);
            logFile_.open(logPath_, std::ios::trunc);
            if (!logFile_) log::Registry::jobs()->warn("[Job] Unable to open log file {} for job {}", logPath_.string(), id_);
        }
        if (logFile_) {
            logFile_ << line << '\n';
            logFile_.flush();
        }
    }

    std::scoped_lock lock(tailMutex_);
    tail_.push_back(line);
    if (tail_.size() > LOG_TAIL_LINES) tail_.pop_front();
}

std::vector<std::string> Job::logTail() const {
    std::scoped_lock lock(tailMutex_);
    return {tail_.begin(), tail_.end()};
}

void Job::abort() {
    if (abort_.exchange(true)) return;
    log::Registry::jobs()->info("[Job] Abort requested for job {} ({})", id_, method_);
}

State Job::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return state_ != State::Waiting && state_ != State::Running; });
    return state_;
}

bool Job::waitFor(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return state_ != State::Waiting && state_ != State::Running; });
}

void Job::setRunning() {
    std::scoped_lock lock(mutex_);
    state_ = State::Running;
}

void Job::finish(const State state, json result, std::string error) {
    {
        std::scoped_lock lock(logMutex_);
        if (logFile_.is_open()) logFile_.close();
    }
    {
        std::scoped_lock lock(mutex_);
        state_ = state;
        result_ = std::move(result);
        error_ = std::move(error);
    }
    cv_.notify_all();
}

json Job::toJson() const {
    std::scoped_lock lock(mutex_);
    json j = {
        {"id", id_},
        {"method", method_},
        {"state", to_string(state_)},
        {"progress", {
            {"percent", progress_.percent ? json(*progress_.percent) : json(nullptr)},
            {"description", progress_.description}
        }},
        {"result", result_},
        {"error", error_.empty() ? json(nullptr) : json(error_)},
        {"logs_path", logPath_.string()}
    };
    return j;
}

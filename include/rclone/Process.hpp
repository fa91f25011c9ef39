#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cs::rclone {

// A forked child with its output on a pipe. stderr is either merged into
// stdout or captured on a second pipe. The destructor kills and reaps a
// child that is still running.
class Process {
public:
    struct CaptureResult {
        int exitCode{};
        std::string out;
        std::string err;
    };

    // Throws std::runtime_error when the pipe, fork or exec fails
    explicit Process(const std::vector<std::string>& argv, bool mergeStderr = true);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int outputFd() const { return outFd_; }

    // Next line of output without the trailing newline; nullopt at EOF
    std::optional<std::string> readLine();

    // Exit code, or 128 + signal number for a signalled child
    int wait();
    std::optional<int> tryWait();

    // SIGTERM, then SIGKILL once `grace` has elapsed. Returns the exit code.
    int terminate(std::chrono::milliseconds grace);

    // Runs argv to completion with stdout and stderr kept apart
    static CaptureResult capture(const std::vector<std::string>& argv);

private:
    pid_t pid_{-1};
    int outFd_{-1};
    int errFd_{-1};
    std::optional<int> exitCode_;
    std::string buffer_;
    bool eof_{false};

    static int decodeStatus(int status);
    void closeFds() noexcept;
};

}

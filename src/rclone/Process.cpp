#include "rclone/Process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>

using namespace cs::rclone;

namespace {

void closeQuietly(int& fd) noexcept {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

}

Process::Process(const std::vector<std::string>& argv, const bool mergeStderr) {
    if (argv.empty()) throw std::invalid_argument("Process: empty argv");

    int outPipe[2], errPipe[2] = {-1, -1}, execPipe[2];
    // Close-on-exec so children forked concurrently from other threads do not
    // inherit them; dup2 clears the flag on the child's stdout and stderr.
    if (::pipe2(outPipe, O_CLOEXEC) == -1) throw std::runtime_error(fmt::format("Failed to create pipe: {}", std::strerror(errno)));
    if (!mergeStderr && ::pipe2(errPipe, O_CLOEXEC) == -1) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        throw std::runtime_error(fmt::format("Failed to create pipe: {}", std::strerror(errno)));
    }
    // Carries the exec errno back to the parent; closed by a successful exec
    if (::pipe2(execPipe, O_CLOEXEC) == -1) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        if (!mergeStderr) { ::close(errPipe[0]); ::close(errPipe[1]); }
        throw std::runtime_error(fmt::format("Failed to create pipe: {}", std::strerror(errno)));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t parent = ::getpid();
    pid_ = ::fork();
    if (pid_ < 0) {
        const int err = errno;
        ::close(outPipe[0]); ::close(outPipe[1]);
        if (!mergeStderr) { ::close(errPipe[0]); ::close(errPipe[1]); }
        ::close(execPipe[0]); ::close(execPipe[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv.front(), std::strerror(err)));
    }

    if (pid_ == 0) {
        // Do not outlive a parent that dies without terminating us
        if (::prctl(PR_SET_PDEATHSIG, SIGTERM) == -1 || ::getppid() != parent) ::_exit(127);

        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(mergeStderr ? outPipe[1] : errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        if (!mergeStderr) { ::close(errPipe[0]); ::close(errPipe[1]); }
        ::close(execPipe[0]);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }

        ::execvp(args[0], args.data());
        const int err = errno;
        (void)!::write(execPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(outPipe[1]);
    outFd_ = outPipe[0];
    if (!mergeStderr) {
        ::close(errPipe[1]);
        errFd_ = errPipe[0];
    }
    ::close(execPipe[1]);

    int childErr = 0;
    ssize_t n;
    do n = ::read(execPipe[0], &childErr, sizeof(childErr));
    while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        wait();
        closeFds();
        throw std::runtime_error(fmt::format("Failed to execute {}: {}", argv.front(), std::strerror(childErr)));
    }
}

Process::~Process() {
    if (pid_ > 0 && !exitCode_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
    closeFds();
}

void Process::closeFds() noexcept {
    closeQuietly(outFd_);
    closeQuietly(errFd_);
}

std::optional<std::string> Process::readLine() {
    for (;;) {
        if (const auto nl = buffer_.find('\n'); nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        if (eof_ || outFd_ < 0) {
            if (buffer_.empty()) return std::nullopt;
            std::string line;
            line.swap(buffer_);
            return line;
        }

        char chunk[4096];
        const ssize_t n = ::read(outFd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("Failed to read child output: {}", std::strerror(errno)));
        }
        if (n == 0) eof_ = true;
        else buffer_.append(chunk, static_cast<size_t>(n));
    }
}

int Process::decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int Process::wait() {
    if (exitCode_) return *exitCode_;

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
    }
    exitCode_ = decodeStatus(status);
    return *exitCode_;
}

std::optional<int> Process::tryWait() {
    if (exitCode_) return exitCode_;

    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r < 0) {
        if (errno == EINTR) return std::nullopt;
        throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
    }
    if (r == 0) return std::nullopt;

    exitCode_ = decodeStatus(status);
    return exitCode_;
}

int Process::terminate(const std::chrono::milliseconds grace) {
    if (const auto code = tryWait()) return *code;

    ::kill(pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (const auto code = tryWait()) return *code;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::kill(pid_, SIGKILL);
    return wait();
}

Process::CaptureResult Process::capture(const std::vector<std::string>& argv) {
    Process proc(argv, false);
    CaptureResult result;

    pollfd fds[2] = {{proc.outFd_, POLLIN, 0}, {proc.errFd_, POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int open = 2;

    while (open > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("poll failed: {}", std::strerror(errno)));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            char chunk[4096];
            const ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                fds[i].fd = -1;  // poll ignores negative fds
                --open;
                continue;
            }
            sinks[i]->append(chunk, static_cast<size_t>(n));
        }
    }

    result.exitCode = proc.wait();
    return result;
}

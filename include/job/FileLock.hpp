#pragma once

#include <filesystem>

namespace cs::job {

// Exclusive flock() on a file, shared by every process that opens the same
// path. Each instance owns its own open file description, so two instances
// in one process also exclude each other. Released on destruction.
class FileLock {
public:
    // Creates the file (and its directory) if needed; throws std::runtime_error
    explicit FileLock(std::filesystem::path path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // False when another holder has it
    bool tryLock();
    void unlock();

    [[nodiscard]] bool locked() const { return locked_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
    bool locked_{false};
};

}

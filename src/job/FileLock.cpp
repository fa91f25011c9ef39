#include "job/FileLock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

using namespace cs::job;

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) throw std::runtime_error("FileLock: unable to open " + path_.string() + ": " + std::strerror(errno));
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    if (locked_) ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

bool FileLock::tryLock() {
    if (locked_) return true;

    for (;;) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            locked_ = true;
            return true;
        }
        if (errno == EWOULDBLOCK) return false;
        if (errno != EINTR) throw std::runtime_error("FileLock: flock failed on " + path_.string() + ": " + std::strerror(errno));
    }
}

void FileLock::unlock() {
    if (!locked_) return;
    ::flock(fd_, LOCK_UN);
    locked_ = false;
}

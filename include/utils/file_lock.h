#pragma once

#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>

namespace hubcache {

// Advisory flock(2) on a file for the lifetime of the object (best-effort).
// Shared locks guard readers of config files against a concurrent writer.
// If the lock cannot be taken without blocking, locked() returns false and
// the caller proceeds unlocked.
class FileLock {
public:
    enum class Mode {
        Shared,
        Exclusive,
    };

    explicit FileLock(const std::filesystem::path& target, Mode mode = Mode::Exclusive) {
        const int flags = mode == Mode::Shared ? O_RDONLY : (O_CREAT | O_RDWR);
        fd_ = ::open(target.c_str(), flags | O_CLOEXEC, 0644);
        if (fd_ < 0) return;
        const int op = mode == Mode::Shared ? LOCK_SH : LOCK_EX;
        if (::flock(fd_, op | LOCK_NB) == 0) {
            locked_ = true;
        }
    }

    ~FileLock() {
        if (fd_ < 0) return;
        if (locked_) ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    int fd_{-1};
    bool locked_{false};
};

}  // namespace hubcache

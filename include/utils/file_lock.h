#pragma once

#include <filesystem>
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

namespace infergate {

// Advisory flock() on the target file, held for the lifetime of the object.
// Readers take a shared lock, writers an exclusive one. Acquisition blocks;
// locked() is false only when the file could not be opened.
class FileLock {
public:
    enum class Mode { Shared, Exclusive };

    explicit FileLock(const std::filesystem::path& target, Mode mode = Mode::Exclusive)
        : target_(target), mode_(mode) {
        acquire();
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    void acquire();
    void release();

    std::filesystem::path target_;
    Mode mode_;
    bool locked_{false};
    int fd_{-1};
};

inline void FileLock::acquire() {
    const int flags = mode_ == Mode::Shared ? O_RDONLY : (O_CREAT | O_RDWR);
    fd_ = ::open(target_.c_str(), flags, 0644);
    if (fd_ < 0) return;
    const int op = mode_ == Mode::Shared ? LOCK_SH : LOCK_EX;
    if (::flock(fd_, op) == 0) {
        locked_ = true;
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

inline void FileLock::release() {
    if (fd_ < 0) return;
    if (locked_) ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

}  // namespace infergate

#pragma once
#include <chrono>
#include <string>

// Advisory flock(2) on a lock file, held for the object's lifetime.
// Waits at most `timeout`; throws PersistenceError if the lock stays busy.
class FileLock {
public:
    enum class Mode {
        Shared,
        Exclusive
    };

    FileLock(const std::string& path, Mode mode, std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

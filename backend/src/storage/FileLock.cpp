#include "FileLock.hpp"
#include "../core/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL(20);

const char* modeName(FileLock::Mode mode) {
    return mode == FileLock::Mode::Exclusive ? "exclusive" : "shared";
}

} // namespace

FileLock::FileLock(const std::string& path, Mode mode, std::chrono::milliseconds timeout)
    : path_(path)
{
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        std::string reason = std::strerror(errno);
        spdlog::error("Cannot open lock file '{}': {}", path_, reason);
        throw PersistenceError("Cannot open lock file '" + path_ + "': " + reason);
    }

    const int op = (mode == Mode::Exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (::flock(fd_, op) != 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            std::string reason = std::strerror(errno);
            ::close(fd_);
            spdlog::error("flock on '{}' failed: {}", path_, reason);
            throw PersistenceError("Cannot lock '" + path_ + "': " + reason);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd_);
            spdlog::warn("Timed out after {} ms waiting for {} lock on '{}'", timeout.count(), modeName(mode), path_);
            throw PersistenceError("Store is locked by another process (timed out after "
                + std::to_string(timeout.count()) + " ms)");
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    spdlog::debug("Acquired {} lock on '{}'", modeName(mode), path_);
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    spdlog::debug("Released lock on '{}'", path_);
}

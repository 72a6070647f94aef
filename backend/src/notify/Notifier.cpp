#include "Notifier.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL(20);

// Returns true once the child has exited, false if it is still running at the deadline.
bool waitForChild(pid_t pid, int& status, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;

    for (;;) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

} // namespace

std::string dueTitle() {
    return "ForgetMeNot - Review Time";
}

std::string dueMessage(size_t dueCount) {
    if (dueCount == 1) return "You have 1 topic ready for review";
    return "You have " + std::to_string(dueCount) + " topics ready for review";
}

void LogNotifier::notify(const std::vector<Topic>& dueTopics) {
    spdlog::info("{}: {}", dueTitle(), dueMessage(dueTopics.size()));
    for (const auto& t : dueTopics)
        spdlog::info("  due: '{}'", t.name);
}

DesktopNotifier::DesktopNotifier(int durationSeconds, std::chrono::milliseconds waitLimit, std::string program)
    : durationSeconds_(durationSeconds)
    , waitLimit_(waitLimit)
    , program_(std::move(program))
{
}

void DesktopNotifier::notify(const std::vector<Topic>& dueTopics) {
    std::string title = dueTitle();
    std::string message = dueMessage(dueTopics.size());
    std::string timeout = std::to_string(durationSeconds_ * 1000);

    // argv goes straight to exec, no shell involved
    std::vector<char*> argv = {
        &program_[0],
        const_cast<char*>("-t"),
        &timeout[0],
        &title[0],
        &message[0],
        nullptr
    };

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program_.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
        throw std::runtime_error("cannot start " + program_ + ": " + std::strerror(rc));

    int status = 0;
    if (!waitForChild(pid, status, waitLimit_)) {
        ::kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw std::runtime_error(program_ + " did not finish within "
            + std::to_string(waitLimit_.count()) + " ms");
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw std::runtime_error(program_ + " exited abnormally");

    spdlog::debug("Desktop notification sent for {} topics", dueTopics.size());
}

bool dispatchDue(Notifier& notifier, const std::vector<Topic>& dueTopics) {
    if (dueTopics.empty()) return false;

    try {
        notifier.notify(dueTopics);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::warn("Notification failed: {}", e.what());
        return false;
    }
    catch (...) {
        spdlog::warn("Notification failed: unknown error");
        return false;
    }
}

#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "../core/Topic.hpp"

// Delivers a "reviews are due" message somewhere. Implementations may throw;
// dispatchDue() is the boundary that keeps those failures away from the store.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::vector<Topic>& dueTopics) = 0;
};

// Writes the reminder to the log.
class LogNotifier : public Notifier {
public:
    void notify(const std::vector<Topic>& dueTopics) override;
};

// Linux desktop notification through the notify-send binary.
// A child still running after waitLimit is killed and reported as a failure.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(int durationSeconds = 5,
                             std::chrono::milliseconds waitLimit = std::chrono::milliseconds(3000),
                             std::string program = "notify-send");
    void notify(const std::vector<Topic>& dueTopics) override;

private:
    int durationSeconds_;
    std::chrono::milliseconds waitLimit_;
    std::string program_;
};

std::string dueTitle();
std::string dueMessage(size_t dueCount);

// Returns true if a notification went out. Never throws.
bool dispatchDue(Notifier& notifier, const std::vector<Topic>& dueTopics);

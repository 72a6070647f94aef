#pragma once
#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include "../core/DueQuery.hpp"
#include "../core/Ladder.hpp"
#include "../core/Scheduler.hpp"
#include "../core/Stats.hpp"
#include "../core/Topic.hpp"

struct StoreOptions {
    std::string path = "forgetmenot.db";
    Ladder ladder;
    std::chrono::milliseconds lock_timeout{ 5000 };
    std::string passphrase;      // empty: plain text store
};

// TopicStore owns every Topic. Each mutating call is one critical section:
// exclusive lock, load, mutate, save, unlock. Reads take a shared lock.
// Callers get copies; the only way to change a Topic is through this API.
class TopicStore {
public:
    explicit TopicStore(StoreOptions options);
    ~TopicStore();

    TopicStore(const TopicStore&) = delete;
    TopicStore& operator=(const TopicStore&) = delete;

    // Whole-collection access (each under its own lock)
    std::vector<Topic> load();
    void save(const std::vector<Topic>& topics);

    Topic addTopic(const std::string& name, const std::string& description, std::time_t now);
    Topic markReview(const std::string& name, ReviewOutcome outcome, std::time_t now);
    void removeTopic(const std::string& name);

    Topic getTopic(const std::string& name);
    std::vector<Topic> listAll();
    std::vector<Topic> listDue(std::time_t now);
    std::vector<Topic> listUpcoming(std::time_t now, int days);

    TopicStats topicStats(const std::string& name, std::time_t now);
    StudySummary summary(std::time_t now);

    // State as of the last successful load or save
    const std::vector<Topic>& cached() const { return topics_; }

    const Ladder& ladder() const { return options_.ladder; }
    const std::string& path() const { return options_.path; }
    std::string lockPath() const { return options_.path + ".lock"; }

private:
    StoreOptions options_;
    Scheduler scheduler_;
    std::vector<Topic> topics_;

    std::vector<Topic> loadUnlocked();
    void saveUnlocked(std::vector<Topic> topics);

    template <typename Fn>
    Topic mutate(const char* op, Fn&& fn);

    std::vector<Topic> readSnapshot();
};

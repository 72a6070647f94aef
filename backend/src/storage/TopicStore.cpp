#include "TopicStore.hpp"
#include "FileLock.hpp"
#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace {

std::vector<Topic>::iterator findByName(std::vector<Topic>& topics, const std::string& name) {
    return std::find_if(topics.begin(), topics.end(),
        [&name](const Topic& t) { return t.name == name; });
}

void sortByName(std::vector<Topic>& topics) {
    std::sort(topics.begin(), topics.end(),
        [](const Topic& a, const Topic& b) { return a.name < b.name; });
}

} // namespace

TopicStore::TopicStore(StoreOptions options)
    : options_(std::move(options)),
    scheduler_(options_.ladder)
{
    spdlog::info("TopicStore initialized at '{}' (ladder [{}], {})",
        options_.path, options_.ladder.toString(),
        options_.passphrase.empty() ? "plain" : "sealed");
}

TopicStore::~TopicStore() {
    if (!options_.passphrase.empty())
        sodium_memzero(&options_.passphrase[0], options_.passphrase.size());
}

/* -------------------------
   Locked cycles
   -------------------------
   The mutation runs on a working copy. topics_ is refreshed only after a
   successful load or save, so a failed operation never leaves it holding
   state that is not on disk.
*/

template <typename Fn>
Topic TopicStore::mutate(const char* op, Fn&& fn) {
    spdlog::debug("Store {} on '{}'", op, options_.path);
    FileLock lock(lockPath(), FileLock::Mode::Exclusive, options_.lock_timeout);

    std::vector<Topic> working = loadUnlocked();
    Topic result = fn(working);
    saveUnlocked(std::move(working));
    return result;
}

std::vector<Topic> TopicStore::load() {
    return readSnapshot();
}

void TopicStore::save(const std::vector<Topic>& topics) {
    FileLock lock(lockPath(), FileLock::Mode::Exclusive, options_.lock_timeout);

    std::vector<Topic> checked;
    checked.reserve(topics.size());
    for (const auto& t : topics) {
        Topic::validateName(t.name);
        t.checkInvariants(options_.ladder);
        if (findByName(checked, t.name) != checked.end())
            throw DuplicateTopicError(t.name);
        checked.push_back(t);
    }

    saveUnlocked(std::move(checked));
}

Topic TopicStore::addTopic(const std::string& name, const std::string& description, std::time_t now) {
    return mutate("add", [&](std::vector<Topic>& topics) {
        if (findByName(topics, name) != topics.end()) {
            spdlog::warn("Add failed: topic '{}' already exists", name);
            throw DuplicateTopicError(name);
        }

        Topic t(name, description, now, options_.ladder);
        topics.push_back(t);
        spdlog::info("Added topic '{}'", name);
        return t;
    });
}

Topic TopicStore::markReview(const std::string& name, ReviewOutcome outcome, std::time_t now) {
    return mutate("review", [&](std::vector<Topic>& topics) {
        auto it = findByName(topics, name);
        if (it == topics.end()) {
            spdlog::warn("Review failed: topic '{}' not found", name);
            throw TopicNotFoundError(name);
        }

        *it = scheduler_.review(*it, outcome, now);
        return *it;
    });
}

void TopicStore::removeTopic(const std::string& name) {
    mutate("remove", [&](std::vector<Topic>& topics) {
        auto it = findByName(topics, name);
        if (it == topics.end()) {
            spdlog::warn("Remove failed: topic '{}' not found", name);
            throw TopicNotFoundError(name);
        }

        Topic removed = *it;
        topics.erase(it);
        spdlog::info("Removed topic '{}'", name);
        return removed;
    });
}

Topic TopicStore::getTopic(const std::string& name) {
    std::vector<Topic> topics = readSnapshot();
    auto it = findByName(topics, name);
    if (it == topics.end())
        throw TopicNotFoundError(name);
    return *it;
}

std::vector<Topic> TopicStore::listAll() {
    return readSnapshot();
}

std::vector<Topic> TopicStore::listDue(std::time_t now) {
    return DueQuery::due(readSnapshot(), now);
}

std::vector<Topic> TopicStore::listUpcoming(std::time_t now, int days) {
    return DueQuery::upcoming(readSnapshot(), now, days);
}

TopicStats TopicStore::topicStats(const std::string& name, std::time_t now) {
    return computeTopicStats(getTopic(name), options_.ladder, now);
}

StudySummary TopicStore::summary(std::time_t now) {
    return computeSummary(readSnapshot(), now);
}

std::vector<Topic> TopicStore::readSnapshot() {
    FileLock lock(lockPath(), FileLock::Mode::Shared, options_.lock_timeout);
    return loadUnlocked();
}

std::vector<Topic> TopicStore::loadUnlocked() {
    std::vector<Topic> loaded = Storage::loadTopics(options_.path, options_.ladder, options_.passphrase);
    sortByName(loaded);
    topics_ = loaded;
    return loaded;
}

void TopicStore::saveUnlocked(std::vector<Topic> topics) {
    sortByName(topics);
    Storage::saveTopics(topics, options_.path, options_.passphrase);
    topics_ = std::move(topics);
}

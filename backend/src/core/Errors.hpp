#pragma once
#include <stdexcept>
#include <string>

// Base for every error the scheduler reports to its callers.
class SchedulerError : public std::runtime_error {
public:
    explicit SchedulerError(const std::string& msg) : std::runtime_error(msg) {}
};

class TopicNotFoundError : public SchedulerError {
public:
    explicit TopicNotFoundError(const std::string& topicName)
        : SchedulerError("Topic '" + topicName + "' not found"), name(topicName) {}

    std::string name;
};

class DuplicateTopicError : public SchedulerError {
public:
    explicit DuplicateTopicError(const std::string& topicName)
        : SchedulerError("Topic '" + topicName + "' already exists"), name(topicName) {}

    std::string name;
};

// Bad input: topic names, ladder definitions, config values, CLI arguments.
class ValidationError : public SchedulerError {
public:
    explicit ValidationError(const std::string& msg) : SchedulerError(msg) {}
};

// A persisted record breaks a Topic invariant.
class InvalidStateError : public SchedulerError {
public:
    explicit InvalidStateError(const std::string& msg) : SchedulerError(msg) {}
};

// Storage unreadable, unwritable, corrupt, or locked by someone else for too long.
class PersistenceError : public SchedulerError {
public:
    explicit PersistenceError(const std::string& msg) : SchedulerError(msg) {}
};

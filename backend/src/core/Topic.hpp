#pragma once
#include <string>
#include <ctime>
#include "Ladder.hpp"

class Topic {
public:
    Topic() = default;

    // Fresh topic on rung 0, first review due one rung after `now`.
    Topic(const std::string& name, const std::string& description, std::time_t now, const Ladder& ladder);

    // Identity
    std::string name;             // Unique, case-sensitive
    std::string description;

    // Schedule (seconds since epoch)
    std::time_t created_at = 0;
    std::time_t last_review_at = 0;
    std::time_t next_review_at = 0;
    int interval_index = 0;

    // Counters
    int review_count = 0;
    int success_streak = 0;
    int total_successes = 0;
    int total_reviews = 0;

    // total_successes / total_reviews, 0 when never reviewed
    double successRate() const;

    // Throws InvalidStateError naming the first broken invariant.
    void checkInvariants(const Ladder& ladder) const;

    // Pulls a persisted record back inside the invariants.
    // Returns true if anything had to change.
    bool coerce(const Ladder& ladder);

    // Throws ValidationError for empty, blank or over-long names.
    static void validateName(const std::string& name);

    static constexpr size_t MAX_NAME_LENGTH = 200;
};

#include "Topic.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {

// UTF-8 code points, counting every byte that is not a continuation byte
size_t codePointCount(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(),
        [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

} // namespace

Topic::Topic(const std::string& n, const std::string& d, std::time_t now, const Ladder& ladder)
    : name(n), description(d)
{
    validateName(name);

    created_at = now;
    last_review_at = now;
    interval_index = 0;
    next_review_at = now + ladder.gapSeconds(0);

    spdlog::debug("Created Topic '{}' next_review_at={}", name, next_review_at);
}

double Topic::successRate() const {
    if (total_reviews <= 0) return 0.0;
    return static_cast<double>(total_successes) / static_cast<double>(total_reviews);
}

void Topic::checkInvariants(const Ladder& ladder) const {
    if (interval_index < 0 || interval_index > ladder.maxIndex())
        throw InvalidStateError("Topic '" + name + "': interval_index " + std::to_string(interval_index)
            + " outside [0, " + std::to_string(ladder.maxIndex()) + "]");

    if (next_review_at != last_review_at + ladder.gapSeconds(interval_index))
        throw InvalidStateError("Topic '" + name + "': next_review_at does not match last_review_at + ladder["
            + std::to_string(interval_index) + "]");

    if (review_count < 0 || success_streak < 0 || total_successes < 0 || total_reviews < 0)
        throw InvalidStateError("Topic '" + name + "': negative counter");

    if (total_reviews != review_count)
        throw InvalidStateError("Topic '" + name + "': total_reviews != review_count");

    if (total_successes > total_reviews)
        throw InvalidStateError("Topic '" + name + "': total_successes > total_reviews");
}

bool Topic::coerce(const Ladder& ladder) {
    bool changed = false;

    int clamped = ladder.clampIndex(interval_index);
    if (clamped != interval_index) {
        interval_index = clamped;
        changed = true;
    }

    std::time_t expected = last_review_at + ladder.gapSeconds(interval_index);
    if (next_review_at != expected) {
        next_review_at = expected;
        changed = true;
    }

    auto nonNegative = [&changed](int& v) {
        if (v < 0) { v = 0; changed = true; }
    };
    nonNegative(review_count);
    nonNegative(success_streak);
    nonNegative(total_successes);
    nonNegative(total_reviews);

    // the larger of the two counts is the one that saw every review
    int reviews = std::max(review_count, total_reviews);
    if (review_count != reviews || total_reviews != reviews) {
        review_count = reviews;
        total_reviews = reviews;
        changed = true;
    }

    if (total_successes > total_reviews) {
        total_successes = total_reviews;
        changed = true;
    }
    if (success_streak > total_successes) {
        success_streak = total_successes;
        changed = true;
    }

    return changed;
}

void Topic::validateName(const std::string& n) {
    bool blank = std::all_of(n.begin(), n.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    if (n.empty() || blank)
        throw ValidationError("Topic name must not be empty");

    if (codePointCount(n) > MAX_NAME_LENGTH)
        throw ValidationError("Topic name longer than " + std::to_string(MAX_NAME_LENGTH) + " characters");
}

#include "Scheduler.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

const char* toString(ReviewOutcome outcome) {
    switch (outcome) {
    case ReviewOutcome::Success: return "success";
    case ReviewOutcome::Failure: return "failure";
    }
    return "unknown";
}

Scheduler::Scheduler(const Ladder& ladder)
    : ladder_(ladder)
{
    spdlog::debug("Scheduler initialized with ladder [{}]", ladder_.toString());
}

Topic Scheduler::review(const Topic& topic, ReviewOutcome outcome, std::time_t now) const {
    Topic next = topic;

    next.interval_index = nextIndex(topic.interval_index, outcome);

    if (outcome == ReviewOutcome::Success) {
        next.success_streak += 1;
        next.total_successes += 1;
    }
    else {
        next.success_streak = 0;
    }

    next.review_count += 1;
    next.total_reviews += 1;
    next.last_review_at = now;
    next.next_review_at = now + ladder_.gapSeconds(next.interval_index);

    spdlog::info("Review '{}' | outcome={} | rung {} -> {} | next in {}d",
        topic.name, toString(outcome), topic.interval_index, next.interval_index,
        ladder_.daysAt(next.interval_index));

    if (outcome == ReviewOutcome::Failure && topic.interval_index == 0)
        spdlog::warn("Topic '{}' failed on the first rung", topic.name);

    return next;
}

int Scheduler::nextIndex(int index, ReviewOutcome outcome) const {
    // stored index may predate a shorter ladder; start from the clamped rung
    int current = ladder_.clampIndex(index);

    if (outcome == ReviewOutcome::Success)
        return std::min(current + 1, ladder_.maxIndex());
    return std::max(current - 1, 0);
}

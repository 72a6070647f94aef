#pragma once
#include <ctime>
#include <string>
#include "Ladder.hpp"
#include "Topic.hpp"

enum class ReviewOutcome {
    Success,
    Failure
};

const char* toString(ReviewOutcome outcome);

/*
  Leitner-style scheduler over a fixed Ladder:
   - Success climbs one rung (saturating at the top rung)
   - Failure drops one rung (saturating at rung 0) and resets the streak
   - Every outcome counts as a review and re-anchors the schedule at `now`
  Reviews are accepted at any time, due or not.
*/

class Scheduler {
public:
    explicit Scheduler(const Ladder& ladder);

    // Pure: returns the reviewed copy, `topic` is left as it was.
    Topic review(const Topic& topic, ReviewOutcome outcome, std::time_t now) const;

    const Ladder& ladder() const { return ladder_; }

private:
    Ladder ladder_;

    int nextIndex(int index, ReviewOutcome outcome) const;
};

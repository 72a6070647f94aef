#pragma once
#include "Topic.hpp"

enum class MasteryLabel {
    Learning,
    Beginner,
    Intermediate,
    Advanced,
    Mastered
};

const char* toString(MasteryLabel label);

// First match wins, from Mastered down to Learning.
MasteryLabel classify(int interval_index, int total_successes, int total_reviews);
MasteryLabel classify(const Topic& topic);

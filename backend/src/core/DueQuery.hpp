#pragma once
#include <ctime>
#include <vector>
#include "Topic.hpp"

// Read-only selections over a snapshot of topics. Inputs are never modified.
class DueQuery {
public:
    // next_review_at <= now, most overdue first
    static std::vector<Topic> due(const std::vector<Topic>& topics, std::time_t now);

    // now < next_review_at <= now + days, soonest first
    static std::vector<Topic> upcoming(const std::vector<Topic>& topics, std::time_t now, int days);

    // Most overdue (earliest next_review_at) first, name breaks ties.
    static void sortByUrgency(std::vector<Topic>& topics);
};

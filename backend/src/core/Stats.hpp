#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "Ladder.hpp"
#include "Mastery.hpp"
#include "Topic.hpp"

struct TopicStats {
    std::string name;
    std::string description;
    double success_rate_pct = 0.0;   // one decimal
    int success_streak = 0;
    int total_reviews = 0;
    int current_interval_days = 0;
    int days_until_review = 0;       // floored, never negative
    std::string next_review_date;    // YYYY-MM-DD, local
    MasteryLabel mastery = MasteryLabel::Learning;
};

struct StudySummary {
    int total_topics = 0;
    int due_now = 0;
    int due_today = 0;               // by the end of the local day
    int mastered_topics = 0;
    double average_success_rate_pct = 0.0;
};

TopicStats computeTopicStats(const Topic& topic, const Ladder& ladder, std::time_t now);
StudySummary computeSummary(const std::vector<Topic>& topics, std::time_t now);

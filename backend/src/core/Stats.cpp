#include "Stats.hpp"
#include "../utils/TimeUtil.hpp"
#include <algorithm>
#include <cmath>

namespace {

double roundOneDecimal(double v) {
    return std::round(v * 10.0) / 10.0;
}

} // namespace

TopicStats computeTopicStats(const Topic& topic, const Ladder& ladder, std::time_t now) {
    TopicStats s;
    s.name = topic.name;
    s.description = topic.description;
    s.success_rate_pct = roundOneDecimal(topic.successRate() * 100.0);
    s.success_streak = topic.success_streak;
    s.total_reviews = topic.total_reviews;
    s.current_interval_days = ladder.daysAt(topic.interval_index);

    std::time_t remaining = topic.next_review_at - now;
    s.days_until_review = remaining > 0
        ? static_cast<int>(remaining / Ladder::SECONDS_PER_DAY)
        : 0;

    s.next_review_date = TimeUtil::toLocalDate(topic.next_review_at);
    s.mastery = classify(topic);
    return s;
}

StudySummary computeSummary(const std::vector<Topic>& topics, std::time_t now) {
    StudySummary s;
    s.total_topics = static_cast<int>(topics.size());
    if (topics.empty()) return s;

    std::time_t todayEnd = TimeUtil::endOfLocalDay(now);
    long long reviews = 0;
    long long successes = 0;

    for (const auto& t : topics) {
        if (t.next_review_at <= now) ++s.due_now;
        if (t.next_review_at <= todayEnd) ++s.due_today;
        if (classify(t) == MasteryLabel::Mastered) ++s.mastered_topics;
        reviews += t.total_reviews;
        successes += t.total_successes;
    }

    if (reviews > 0)
        s.average_success_rate_pct = roundOneDecimal(100.0 * static_cast<double>(successes) / static_cast<double>(reviews));
    return s;
}

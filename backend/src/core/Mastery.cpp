#include "Mastery.hpp"

namespace {

// successes / reviews >= num / den, in integers so 4/5 is exactly 0.80
bool rateAtLeast(int successes, int reviews, long long num, long long den) {
    if (reviews <= 0) return false;
    return static_cast<long long>(successes) * den >= static_cast<long long>(reviews) * num;
}

} // namespace

const char* toString(MasteryLabel label) {
    switch (label) {
    case MasteryLabel::Learning: return "Learning";
    case MasteryLabel::Beginner: return "Beginner";
    case MasteryLabel::Intermediate: return "Intermediate";
    case MasteryLabel::Advanced: return "Advanced";
    case MasteryLabel::Mastered: return "Mastered";
    }
    return "Unknown";
}

MasteryLabel classify(int index, int successes, int reviews) {
    if (index >= 5 && rateAtLeast(successes, reviews, 4, 5)) return MasteryLabel::Mastered;
    if (index >= 3 && rateAtLeast(successes, reviews, 7, 10)) return MasteryLabel::Advanced;
    if (index >= 2 && rateAtLeast(successes, reviews, 3, 5)) return MasteryLabel::Intermediate;
    if (index >= 1) return MasteryLabel::Beginner;
    return MasteryLabel::Learning;
}

MasteryLabel classify(const Topic& topic) {
    return classify(topic.interval_index, topic.total_successes, topic.total_reviews);
}

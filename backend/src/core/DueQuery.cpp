#include "DueQuery.hpp"
#include "Ladder.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::vector<Topic> DueQuery::due(const std::vector<Topic>& topics, std::time_t now) {
    std::vector<Topic> out;
    out.reserve(topics.size() / 4 + 8);

    for (const auto& t : topics) {
        if (t.next_review_at <= now)
            out.push_back(t);
    }

    sortByUrgency(out);
    spdlog::debug("DueQuery: {} of {} topics due", out.size(), topics.size());
    return out;
}

std::vector<Topic> DueQuery::upcoming(const std::vector<Topic>& topics, std::time_t now, int days) {
    std::vector<Topic> out;
    if (days < 0) return out;

    std::time_t horizon = now + static_cast<std::time_t>(days) * Ladder::SECONDS_PER_DAY;
    for (const auto& t : topics) {
        if (t.next_review_at > now && t.next_review_at <= horizon)
            out.push_back(t);
    }

    sortByUrgency(out);
    spdlog::debug("DueQuery: {} topics due within {} days", out.size(), days);
    return out;
}

void DueQuery::sortByUrgency(std::vector<Topic>& topics) {
    std::sort(topics.begin(), topics.end(),
        [](const Topic& a, const Topic& b) {
            if (a.next_review_at != b.next_review_at) return a.next_review_at < b.next_review_at;
            return a.name < b.name;
        });
}

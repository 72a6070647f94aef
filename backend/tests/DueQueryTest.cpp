#include <catch2/catch.hpp>
#include "TestHelpers.hpp"
#include "core/DueQuery.hpp"
#include "core/Scheduler.hpp"
#include "core/Stats.hpp"

namespace {

std::vector<std::string> names(const std::vector<Topic>& topics) {
    std::vector<std::string> out;
    for (const auto& t : topics) out.push_back(t.name);
    return out;
}

} // namespace

TEST_CASE("Due list boundary for the Calculus walk", "[due]") {
    Ladder ladder;
    Scheduler scheduler(ladder);
    Topic t("Calculus", "...", 0, ladder);
    t = scheduler.review(t, ReviewOutcome::Success, 1 * DAY);
    t = scheduler.review(t, ReviewOutcome::Success, 4 * DAY);
    t = scheduler.review(t, ReviewOutcome::Failure, 9 * DAY);
    std::vector<Topic> store{ t };

    REQUIRE(names(DueQuery::due(store, 12 * DAY)) == std::vector<std::string>{ "Calculus" });
    REQUIRE(DueQuery::due(store, 11 * DAY).empty());
    REQUIRE(DueQuery::due(store, 12 * DAY - 1).empty());
}

TEST_CASE("Due list is ordered most overdue first", "[due]") {
    std::vector<Topic> topics{
        makeTopic("b-recent", 9 * DAY),
        makeTopic("future", 20 * DAY),
        makeTopic("a-oldest", 2 * DAY),
        makeTopic("tie-2", 5 * DAY),
        makeTopic("tie-1", 5 * DAY),
    };
    std::time_t now = 10 * DAY;

    std::vector<Topic> due = DueQuery::due(topics, now);
    REQUIRE(names(due) == std::vector<std::string>{ "a-oldest", "tie-1", "tie-2", "b-recent" });

    for (size_t i = 0; i < due.size(); ++i) {
        REQUIRE(due[i].next_review_at <= now);
        if (i > 0) REQUIRE(now - due[i - 1].next_review_at >= now - due[i].next_review_at);
    }

    // the input snapshot is not reordered or modified
    REQUIRE(topics[0].name == "b-recent");
    REQUIRE(topics[1].next_review_at == 20 * DAY);
}

TEST_CASE("Upcoming list covers the window after now", "[due]") {
    std::vector<Topic> topics{
        makeTopic("due", 10 * DAY),
        makeTopic("tomorrow", 11 * DAY),
        makeTopic("week", 17 * DAY),
        makeTopic("later", 18 * DAY),
    };
    std::time_t now = 10 * DAY;

    REQUIRE(names(DueQuery::upcoming(topics, now, 7)) == std::vector<std::string>{ "tomorrow", "week" });
    REQUIRE(DueQuery::upcoming(topics, now, 0).empty());
    REQUIRE(DueQuery::upcoming(topics, now, -1).empty());
}

TEST_CASE("Per-topic statistics", "[stats]") {
    Ladder ladder;
    Scheduler scheduler(ladder);
    Topic t("Biology", "cells", 0, ladder);
    t = scheduler.review(t, ReviewOutcome::Success, DAY);
    t = scheduler.review(t, ReviewOutcome::Failure, 2 * DAY);
    t = scheduler.review(t, ReviewOutcome::Success, 3 * DAY);

    TopicStats s = computeTopicStats(t, ladder, 3 * DAY + 3600);
    REQUIRE(s.name == "Biology");
    REQUIRE(s.description == "cells");
    REQUIRE(s.success_rate_pct == Approx(66.7));
    REQUIRE(s.success_streak == 1);
    REQUIRE(s.total_reviews == 3);
    REQUIRE(s.current_interval_days == 3);
    REQUIRE(s.days_until_review == 2);
    REQUIRE(s.mastery == MasteryLabel::Beginner);
    REQUIRE(s.next_review_date.size() == 10);

    // overdue topics report zero days, never negative
    REQUIRE(computeTopicStats(t, ladder, 100 * DAY).days_until_review == 0);
}

TEST_CASE("Study summary", "[stats]") {
    REQUIRE(computeSummary({}, 0).total_topics == 0);
    REQUIRE(computeSummary({}, 0).average_success_rate_pct == 0.0);

    Ladder ladder;
    Scheduler scheduler(ladder);
    Topic master("Master", "", 0, ladder);
    std::time_t now = 0;
    for (int i = 0; i < 6; ++i)
        master = scheduler.review(master, ReviewOutcome::Success, now += DAY);

    Topic weak("Weak", "", 0, ladder);
    weak = scheduler.review(weak, ReviewOutcome::Failure, DAY);
    weak = scheduler.review(weak, ReviewOutcome::Failure, 2 * DAY);

    std::time_t query = 400 * DAY;
    StudySummary s = computeSummary({ master, weak, makeTopic("Later", 900 * DAY) }, query);
    REQUIRE(s.total_topics == 3);
    REQUIRE(s.due_now == 2);
    REQUIRE(s.due_today >= s.due_now);
    REQUIRE(s.mastered_topics == 1);
    REQUIRE(s.average_success_rate_pct == Approx(75.0));
}

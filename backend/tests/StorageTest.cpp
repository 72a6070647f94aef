#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "TestHelpers.hpp"
#include "core/Errors.hpp"
#include "core/Scheduler.hpp"
#include "storage/Storage.hpp"
#include "utils/TimeUtil.hpp"

namespace {

const char* VALID_RECORD =
    "name=Calculus\n"
    "description=Limits\n"
    "created_at=1970-01-01T00:00:00Z\n"
    "last_review_at=1970-01-10T00:00:00Z\n"
    "next_review_at=1970-01-13T00:00:00Z\n"
    "interval_index=1\n"
    "review_count=3\n"
    "success_streak=0\n"
    "total_successes=2\n"
    "total_reviews=3\n"
    "---\n";

void writeRaw(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

} // namespace

TEST_CASE("ISO-8601 timestamps", "[storage]") {
    REQUIRE(TimeUtil::toIso8601(0) == "1970-01-01T00:00:00Z");
    REQUIRE(TimeUtil::toIso8601(12 * DAY + 3661) == "1970-01-13T01:01:01Z");
    REQUIRE(TimeUtil::fromIso8601("2026-10-18T08:30:00Z").value() == 1792312200);
    REQUIRE(TimeUtil::fromIso8601(TimeUtil::toIso8601(1792312200)).value() == 1792312200);

    REQUIRE_FALSE(TimeUtil::fromIso8601("2026-10-18 08:30:00").has_value());
    REQUIRE_FALSE(TimeUtil::fromIso8601("2026-13-18T08:30:00Z").has_value());
    REQUIRE_FALSE(TimeUtil::fromIso8601("yesterday").has_value());
}

TEST_CASE("Serialized topics parse back to the same values", "[storage]") {
    Ladder ladder;
    Scheduler scheduler(ladder);

    Topic a("Calculus", "Limits\nDerivatives \\ integrals\r\nseries", 0, ladder);
    a = scheduler.review(a, ReviewOutcome::Success, DAY);
    a = scheduler.review(a, ReviewOutcome::Failure, 3 * DAY);
    Topic b("name = with equals", "", 5 * DAY, ladder);

    std::string plain = Storage::serializeTopics({ a, b });
    REQUIRE(plain.rfind("FMNSTORE1\n", 0) == 0);

    std::vector<Topic> parsed = Storage::parseTopics(plain, ladder);
    REQUIRE(parsed.size() == 2);

    const Topic& p = parsed[0];
    REQUIRE(p.name == a.name);
    REQUIRE(p.description == a.description);
    REQUIRE(p.created_at == a.created_at);
    REQUIRE(p.last_review_at == a.last_review_at);
    REQUIRE(p.next_review_at == a.next_review_at);
    REQUIRE(p.interval_index == a.interval_index);
    REQUIRE(p.review_count == a.review_count);
    REQUIRE(p.success_streak == a.success_streak);
    REQUIRE(p.total_successes == a.total_successes);
    REQUIRE(p.total_reviews == a.total_reviews);

    REQUIRE(parsed[1].name == "name = with equals");
}

TEST_CASE("Topics on the longest allowed rung survive a reload", "[storage]") {
    Ladder ladder(std::vector<int>{ 1, Ladder::MAX_RUNG_DAYS });
    Scheduler scheduler(ladder);

    Topic t("Archive", "", 1700000000, ladder);
    t = scheduler.review(t, ReviewOutcome::Success, 1700000000);
    t = scheduler.review(t, ReviewOutcome::Success, 1700000000 + DAY);
    REQUIRE(t.interval_index == 1);

    std::string iso = TimeUtil::toIso8601(t.next_review_at);
    REQUIRE(iso.size() == 20);
    REQUIRE(TimeUtil::fromIso8601(iso) == t.next_review_at);

    std::vector<Topic> parsed = Storage::parseTopics(Storage::serializeTopics({ t }), ladder);
    REQUIRE(parsed.size() == 1);
    REQUIRE(parsed[0].next_review_at == t.next_review_at);
    REQUIRE(parsed[0].interval_index == 1);
}

TEST_CASE("Bad headers are persistence errors", "[storage]") {
    Ladder ladder;
    REQUIRE_THROWS_AS(Storage::parseTopics("", ladder), PersistenceError);
    REQUIRE_THROWS_AS(Storage::parseTopics("{\"Calculus\": {}}", ladder), PersistenceError);
    REQUIRE_THROWS_AS(Storage::parseTopics("FMNSTORE9\n", ladder), PersistenceError);
    REQUIRE(Storage::parseTopics("FMNSTORE1\n", ladder).empty());
    REQUIRE(Storage::parseTopics("FMNSTORE1\r\n", ladder).empty());
}

TEST_CASE("Records breaking invariants are repaired on load", "[storage]") {
    Ladder ladder;
    std::string data = std::string("FMNSTORE1\n") +
        "name=Overflow\n"
        "created_at=1970-01-01T00:00:00Z\n"
        "last_review_at=1970-01-02T00:00:00Z\n"
        "next_review_at=1970-01-03T00:00:00Z\n"
        "interval_index=42\n"
        "review_count=4\n"
        "success_streak=1\n"
        "total_successes=9\n"
        "total_reviews=2\n"
        "---\n";

    std::vector<Topic> parsed = Storage::parseTopics(data, ladder);
    REQUIRE(parsed.size() == 1);

    const Topic& t = parsed[0];
    REQUIRE(t.interval_index == 6);
    REQUIRE(t.next_review_at == DAY + 88 * DAY);
    REQUIRE(t.review_count == 4);
    REQUIRE(t.total_reviews == 4);
    REQUIRE(t.total_successes == 4);
    REQUIRE_NOTHROW(t.checkInvariants(ladder));
}

TEST_CASE("Unusable records are skipped, the rest still load", "[storage]") {
    Ladder ladder;
    std::string data = std::string("FMNSTORE1\n") +
        // missing interval_index
        "name=NoIndex\n"
        "created_at=1970-01-01T00:00:00Z\n"
        "last_review_at=1970-01-01T00:00:00Z\n"
        "review_count=0\n"
        "total_successes=0\n"
        "total_reviews=0\n"
        "---\n"
        // unreadable timestamp
        "name=BadTime\n"
        "created_at=last tuesday\n"
        "last_review_at=1970-01-01T00:00:00Z\n"
        "interval_index=0\n"
        "review_count=0\n"
        "total_successes=0\n"
        "total_reviews=0\n"
        "---\n"
        // line without '='
        "name=Garbled\n"
        "this is not a field\n"
        "---\n" +
        VALID_RECORD +
        // same name again
        "name=Calculus\n"
        "created_at=1970-01-01T00:00:00Z\n"
        "last_review_at=1970-01-01T00:00:00Z\n"
        "interval_index=0\n"
        "review_count=0\n"
        "total_successes=0\n"
        "total_reviews=0\n"
        "---\n"
        // cut off before its terminator
        "name=Truncated\n"
        "created_at=1970-01-01T00:00:00Z\n";

    std::vector<Topic> parsed = Storage::parseTopics(data, ladder);
    REQUIRE(parsed.size() == 1);
    REQUIRE(parsed[0].name == "Calculus");
    REQUIRE(parsed[0].interval_index == 1);
    REQUIRE(parsed[0].next_review_at == 12 * DAY);
}

TEST_CASE("Derived fields may be absent", "[storage]") {
    Ladder ladder;
    std::string data = std::string("FMNSTORE1\n") +
        "name=Minimal\n"
        "created_at=1970-01-01T00:00:00Z\n"
        "last_review_at=1970-01-05T00:00:00Z\n"
        "interval_index=2\n"
        "review_count=2\n"
        "total_successes=2\n"
        "total_reviews=2\n"
        "---\n";

    std::vector<Topic> parsed = Storage::parseTopics(data, ladder);
    REQUIRE(parsed.size() == 1);
    REQUIRE(parsed[0].description.empty());
    REQUIRE(parsed[0].success_streak == 0);
    REQUIRE(parsed[0].next_review_at == 4 * DAY + 5 * DAY);
}

TEST_CASE("Sealed stores need the right passphrase", "[storage][crypto]") {
    std::string plain = std::string("FMNSTORE1\n") + VALID_RECORD;

    std::string sealed = Storage::seal(plain, "correct horse");
    REQUIRE(Storage::isSealed(sealed));
    REQUIRE_FALSE(Storage::isSealed(plain));
    REQUIRE(sealed.find("Calculus") == std::string::npos);

    REQUIRE(Storage::unseal(sealed, "correct horse") == plain);
    REQUIRE_THROWS_AS(Storage::unseal(sealed, "wrong horse"), PersistenceError);
    REQUIRE_THROWS_AS(Storage::unseal(sealed, ""), PersistenceError);
    REQUIRE_THROWS_AS(Storage::unseal(sealed.substr(0, 20), "correct horse"), PersistenceError);
    REQUIRE_THROWS_AS(Storage::seal(plain, ""), PersistenceError);

    std::string tampered = sealed;
    tampered.back() ^= 0x01;
    REQUIRE_THROWS_AS(Storage::unseal(tampered, "correct horse"), PersistenceError);
}

TEST_CASE("Atomic writes replace the file and leave no temp files", "[storage]") {
    TempDir dir;
    std::string path = dir.file("store.db");

    REQUIRE_FALSE(Storage::readFile(path).has_value());

    Storage::writeFileAtomic(path, "first");
    Storage::writeFileAtomic(path, "second");
    REQUIRE(Storage::readFile(path).value() == "second");

    size_t entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir.path)) {
        (void)e;
        ++entries;
    }
    REQUIRE(entries == 1);

    REQUIRE_THROWS_AS(Storage::writeFileAtomic(dir.file("missing/store.db"), "x"), PersistenceError);
}

TEST_CASE("loadTopics and saveTopics", "[storage]") {
    TempDir dir;
    std::string path = dir.file("store.db");
    Ladder ladder;

    REQUIRE(Storage::loadTopics(path, ladder, "").empty());

    writeRaw(path, "not a store");
    REQUIRE_THROWS_AS(Storage::loadTopics(path, ladder, ""), PersistenceError);

    Topic t("Geometry", "angles", 0, ladder);
    Storage::saveTopics({ t }, path, "");
    REQUIRE(Storage::loadTopics(path, ladder, "")[0].name == "Geometry");

    SECTION("sealed on disk") {
        Storage::saveTopics({ t }, path, "pw");
        REQUIRE(Storage::isSealed(Storage::readFile(path).value()));
        REQUIRE(Storage::loadTopics(path, ladder, "pw")[0].description == "angles");
        REQUIRE_THROWS_AS(Storage::loadTopics(path, ladder, ""), PersistenceError);
    }
}

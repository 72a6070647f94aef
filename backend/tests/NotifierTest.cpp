#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "TestHelpers.hpp"
#include "notify/Notifier.hpp"

namespace {

class RecordingNotifier : public Notifier {
public:
    void notify(const std::vector<Topic>& dueTopics) override {
        ++calls;
        lastCount = dueTopics.size();
    }

    int calls = 0;
    size_t lastCount = 0;
};

class BrokenNotifier : public Notifier {
public:
    void notify(const std::vector<Topic>&) override {
        throw std::runtime_error("no notification daemon");
    }
};

struct NotifierFault {
    int code;
};

class FaultyNotifier : public Notifier {
public:
    void notify(const std::vector<Topic>&) override {
        throw NotifierFault{ 7 };
    }
};

} // namespace

TEST_CASE("Due message wording", "[notify]") {
    REQUIRE(dueMessage(1) == "You have 1 topic ready for review");
    REQUIRE(dueMessage(4) == "You have 4 topics ready for review");
    REQUIRE(dueTitle().find("Review Time") != std::string::npos);
}

TEST_CASE("Dispatch skips empty due lists", "[notify]") {
    RecordingNotifier n;
    REQUIRE_FALSE(dispatchDue(n, {}));
    REQUIRE(n.calls == 0);
}

TEST_CASE("Dispatch hands the due list to the notifier", "[notify]") {
    RecordingNotifier n;
    std::vector<Topic> due{ makeTopic("A", DAY), makeTopic("B", 2 * DAY) };

    REQUIRE(dispatchDue(n, due));
    REQUIRE(n.calls == 1);
    REQUIRE(n.lastCount == 2);
}

TEST_CASE("Notifier failures stop at the dispatch boundary", "[notify]") {
    BrokenNotifier broken;
    std::vector<Topic> due{ makeTopic("A", DAY) };

    REQUIRE_NOTHROW(dispatchDue(broken, due));
    REQUIRE_FALSE(dispatchDue(broken, due));
}

TEST_CASE("Failures of any type stop at the dispatch boundary", "[notify]") {
    FaultyNotifier faulty;
    std::vector<Topic> due{ makeTopic("A", DAY) };

    REQUIRE_NOTHROW(dispatchDue(faulty, due));
    REQUIRE_FALSE(dispatchDue(faulty, due));
}

TEST_CASE("Desktop notifier reports a missing program", "[notify]") {
    DesktopNotifier n(1, std::chrono::milliseconds(2000), "forgetmenot-no-such-program");
    std::vector<Topic> due{ makeTopic("A", DAY) };
    REQUIRE_FALSE(dispatchDue(n, due));
}

TEST_CASE("Desktop notifier gives up on a hung program", "[notify]") {
    TempDir dir;
    std::string script = dir.file("hang.sh");
    {
        std::ofstream out(script);
        out << "#!/bin/sh\nexec sleep 30\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    DesktopNotifier n(1, std::chrono::milliseconds(200), script);
    std::vector<Topic> due{ makeTopic("A", DAY) };

    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(dispatchDue(n, due));
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

TEST_CASE("Log notifier never throws", "[notify]") {
    LogNotifier n;
    std::vector<Topic> due{ makeTopic("A", DAY) };
    REQUIRE(dispatchDue(n, due));
}

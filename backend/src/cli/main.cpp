#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/Mastery.hpp"
#include "../core/Stats.hpp"
#include "../storage/TopicStore.hpp"
#include "../notify/Notifier.hpp"

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_NOT_FOUND = 1,
    EXIT_DUPLICATE = 2,
    EXIT_PERSISTENCE = 3,
    EXIT_USAGE = 64
};

struct CliArgs {
    std::string storePath;
    std::string configPath;
    std::string command;
    std::vector<std::string> rest;
};

void printUsage(std::ostream& os) {
    os << "Usage: forgetmenot [--store PATH] [--config PATH] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  add NAME [--description TEXT]   Add a topic to the review schedule\n"
        "  review NAME --success|--failure Record a review outcome\n"
        "  list [--urgent]                 List topics (only due ones with --urgent)\n"
        "  due [--within DAYS] [--notify]  Show due topics, optionally upcoming ones\n"
        "  stats [--topic NAME]            Overall or per-topic statistics\n"
        "  remove NAME                     Permanently remove a topic\n"
        "  help                            Show this message\n"
        "\n"
        "Exit codes: 0 ok, 1 topic not found, 2 duplicate topic,\n"
        "            3 storage failure, 64 invalid arguments\n";
}

CliArgs parseGlobal(int argc, char** argv) {
    CliArgs args;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--store" || a == "--config") {
            if (i + 1 >= argc) throw ValidationError(a + " needs a value");
            (a == "--store" ? args.storePath : args.configPath) = argv[++i];
        }
        else if (a == "-h" || a == "--help") {
            args.command = "help";
            return args;
        }
        else if (!a.empty() && a[0] == '-') {
            throw ValidationError("Unknown option '" + a + "'");
        }
        else {
            break;
        }
    }

    if (i < argc) args.command = argv[i++];
    for (; i < argc; ++i) args.rest.push_back(argv[i]);
    return args;
}

// Pulls "--flag VALUE" out of rest; returns true if present.
bool takeValue(std::vector<std::string>& rest, const std::string& flag, std::string& out) {
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] != flag) continue;
        if (i + 1 >= rest.size()) throw ValidationError(flag + " needs a value");
        out = rest[i + 1];
        rest.erase(rest.begin() + i, rest.begin() + i + 2);
        return true;
    }
    return false;
}

bool takeFlag(std::vector<std::string>& rest, const std::string& flag) {
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == flag) {
            rest.erase(rest.begin() + i);
            return true;
        }
    }
    return false;
}

std::string takeName(std::vector<std::string>& rest, const std::string& command) {
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i].size() > 1 && rest[i][0] == '-' && rest[i][1] == '-') continue;
        std::string name = rest[i];
        rest.erase(rest.begin() + i);
        return name;
    }
    throw ValidationError(command + " needs a topic NAME");
}

void rejectLeftovers(const std::vector<std::string>& rest) {
    if (!rest.empty())
        throw ValidationError("Unexpected argument '" + rest.front() + "'");
}

std::string shorten(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    return s.substr(0, width - 3) + "...";
}

void printTopicTable(const std::vector<Topic>& topics, const Ladder& ladder, std::time_t now) {
    std::cout << std::left
        << std::setw(32) << "Topic"
        << std::setw(14) << "Mastery"
        << std::setw(14) << "Success Rate"
        << std::setw(14) << "Next Review"
        << "Interval\n";
    std::cout << std::string(82, '-') << "\n";

    for (const auto& t : topics) {
        TopicStats s = computeTopicStats(t, ladder, now);
        std::ostringstream rate;
        rate << std::fixed << std::setprecision(1) << s.success_rate_pct << "%";
        std::string next = t.next_review_at <= now
            ? "Due now"
            : std::to_string(s.days_until_review) + " days";

        std::cout << std::setw(32) << shorten(s.name, 30)
            << std::setw(14) << toString(s.mastery)
            << std::setw(14) << rate.str()
            << std::setw(14) << next
            << s.current_interval_days << "d\n";
    }
    std::cout << std::right;
}

void printSummaryLine(const StudySummary& s) {
    std::cout << "\nSummary: " << s.total_topics << " topics, "
        << s.due_now << " due now, "
        << s.mastered_topics << " mastered\n";
}

int cmdAdd(TopicStore& store, std::vector<std::string> rest, std::time_t now) {
    std::string description;
    takeValue(rest, "--description", description);
    std::string name = takeName(rest, "add");
    rejectLeftovers(rest);

    Topic t = store.addTopic(name, description, now);
    std::cout << "Added '" << t.name << "' to review schedule (first review "
        << computeTopicStats(t, store.ladder(), now).next_review_date << ")\n";
    return EXIT_OK;
}

int cmdReview(TopicStore& store, std::vector<std::string> rest, std::time_t now) {
    bool success = takeFlag(rest, "--success");
    bool failure = takeFlag(rest, "--failure");
    if (success == failure)
        throw ValidationError("review needs exactly one of --success or --failure");
    std::string name = takeName(rest, "review");
    rejectLeftovers(rest);

    ReviewOutcome outcome = success ? ReviewOutcome::Success : ReviewOutcome::Failure;
    Topic t = store.markReview(name, outcome, now);
    TopicStats s = computeTopicStats(t, store.ladder(), now);

    std::cout << "Marked '" << t.name << "' as " << (success ? "successful" : "failed") << " review\n"
        << "Next review: " << s.next_review_date << " (in " << s.current_interval_days << " days), "
        << "mastery: " << toString(s.mastery) << "\n";
    return EXIT_OK;
}

int cmdList(TopicStore& store, std::vector<std::string> rest, std::time_t now) {
    bool urgent = takeFlag(rest, "--urgent");
    rejectLeftovers(rest);

    std::vector<Topic> topics = urgent ? store.listDue(now) : store.listAll();
    if (topics.empty()) {
        std::cout << (urgent ? "No topics are due for review right now\n" : "No topics in your review schedule\n");
        return EXIT_OK;
    }

    if (!urgent) DueQuery::sortByUrgency(topics);
    printTopicTable(topics, store.ladder(), now);
    printSummaryLine(computeSummary(store.cached(), now));
    return EXIT_OK;
}

int cmdDue(TopicStore& store, const Config& config, std::vector<std::string> rest, std::time_t now) {
    bool notify = takeFlag(rest, "--notify") || config.notify;
    std::string withinArg;
    int within = -1;
    if (takeValue(rest, "--within", withinArg)) {
        try {
            size_t used = 0;
            within = std::stoi(withinArg, &used);
            if (used != withinArg.size() || within < 0) throw ValidationError("");
        }
        catch (const std::exception&) {
            throw ValidationError("--within needs a non-negative number of days");
        }
    }
    rejectLeftovers(rest);

    std::vector<Topic> due = store.listDue(now);
    if (due.empty()) {
        std::cout << "No topics are due for review right now\n";
    }
    else {
        std::cout << "You have " << due.size() << " topic" << (due.size() == 1 ? "" : "s") << " due for review\n";
        int n = 0;
        for (const auto& t : due) {
            std::cout << std::setw(4) << ++n << ". " << t.name
                << " - " << (t.description.empty() ? "No description" : t.description) << "\n";
        }
    }

    if (within >= 0) {
        std::vector<Topic> upcoming = store.listUpcoming(now, within);
        std::cout << "\nComing up in the next " << within << " days: " << upcoming.size() << "\n";
        for (const auto& t : upcoming) {
            std::cout << "  " << computeTopicStats(t, store.ladder(), now).next_review_date
                << "  " << t.name << "\n";
        }
    }

    LogNotifier logNotifier;
    dispatchDue(logNotifier, due);

    if (notify) {
        DesktopNotifier notifier;
        if (!due.empty() && !dispatchDue(notifier, due))
            std::cerr << "warning: desktop notification could not be delivered\n";
    }
    return EXIT_OK;
}

int cmdStats(TopicStore& store, std::vector<std::string> rest, std::time_t now) {
    std::string name;
    bool single = takeValue(rest, "--topic", name);
    rejectLeftovers(rest);

    std::cout << std::fixed << std::setprecision(1);
    if (single) {
        TopicStats s = store.topicStats(name, now);
        std::cout << "Stats for " << s.name << "\n"
            << "  Mastery Level: " << toString(s.mastery) << "\n"
            << "  Success Rate: " << s.success_rate_pct << "%\n"
            << "  Success Streak: " << s.success_streak << "\n"
            << "  Total Reviews: " << s.total_reviews << "\n"
            << "  Current Interval: " << s.current_interval_days << " days\n"
            << "  Next Review: " << s.next_review_date
            << " (in " << s.days_until_review << " days)\n";
        return EXIT_OK;
    }

    StudySummary s = store.summary(now);
    std::cout << "Overall Review Statistics\n"
        << "  Total Topics: " << s.total_topics << "\n"
        << "  Due Now: " << s.due_now << "\n"
        << "  Due Today: " << s.due_today << "\n"
        << "  Mastered Topics: " << s.mastered_topics << "\n"
        << "  Average Success Rate: " << s.average_success_rate_pct << "%\n";
    return EXIT_OK;
}

int cmdRemove(TopicStore& store, std::vector<std::string> rest) {
    std::string name = takeName(rest, "remove");
    rejectLeftovers(rest);

    store.removeTopic(name);
    std::cout << "Removed '" << name << "' from review schedule\n";
    return EXIT_OK;
}

int runCommand(TopicStore& store, const Config& config, const CliArgs& args) {
    std::time_t now = std::time(nullptr);

    try {
        if (args.command == "add") return cmdAdd(store, args.rest, now);
        if (args.command == "review") return cmdReview(store, args.rest, now);
        if (args.command == "list") return cmdList(store, args.rest, now);
        if (args.command == "due") return cmdDue(store, config, args.rest, now);
        if (args.command == "stats") return cmdStats(store, args.rest, now);
        if (args.command == "remove") return cmdRemove(store, args.rest);

        std::cerr << "Unknown command '" << args.command << "'\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }
    catch (const TopicNotFoundError& e) {
        std::cerr << "Topic '" << e.name << "' not found in review schedule\n";
        return EXIT_NOT_FOUND;
    }
    catch (const DuplicateTopicError& e) {
        std::cerr << "Topic '" << e.name << "' is already in your review schedule\n";
        return EXIT_DUPLICATE;
    }
    catch (const ValidationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    catch (const SchedulerError& e) {
        spdlog::error("{} failed: {}", args.command, e.what());
        std::cerr << "storage error: " << e.what() << "\n";
        return EXIT_PERSISTENCE;
    }
}

} // namespace

int main(int argc, char** argv) {
    Log::bootstrap();

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return EXIT_PERSISTENCE;
    }

    CliArgs args;
    try {
        args = parseGlobal(argc, argv);
    }
    catch (const ValidationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (args.command.empty() || args.command == "help") {
        printUsage(std::cout);
        return args.command.empty() ? EXIT_USAGE : EXIT_OK;
    }

    Config config;
    try {
        std::string path = args.configPath.empty() ? Config::DEFAULT_FILE : args.configPath;
        if (!config.loadFile(path) && !args.configPath.empty())
            throw ValidationError("Config file '" + path + "' not found");
        config.applyEnvironment();
        if (!args.storePath.empty()) config.store_path = args.storePath;
    }
    catch (const ValidationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    try {
        Log::init(config.log_path, config.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "warning: logging to stderr, cannot open '" << config.log_path << "': " << e.what() << "\n";
    }

    StoreOptions options;
    options.path = config.store_path;
    options.ladder = config.ladder;
    options.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
    options.passphrase = config.passphrase;
    sodium_memzero(&config.passphrase[0], config.passphrase.size());

    TopicStore store(std::move(options));
    int rc = runCommand(store, config, args);
    spdlog::info("Command '{}' finished with exit code {}", args.command, rc);
    return rc;
}

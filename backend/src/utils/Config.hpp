#pragma once
#include <string>
#include "../core/Ladder.hpp"

// Settings come from, in increasing priority:
//   defaults, a JSON file, FORGETMENOT_* environment variables, CLI flags.
class Config {
public:
    std::string store_path = "forgetmenot.db";
    std::string log_path = "forgetmenot.log";
    std::string log_level = "info";
    int lock_timeout_ms = 5000;
    Ladder ladder;
    bool notify = false;
    std::string passphrase;      // environment only

    // Throws ValidationError on malformed JSON or wrongly typed values;
    // unknown keys are logged and skipped.
    void deserialize(const std::string& data);

    // Returns false if the file does not exist.
    bool loadFile(const std::string& path);

    void applyEnvironment();

    static constexpr const char* DEFAULT_FILE = "forgetmenot.json";

};

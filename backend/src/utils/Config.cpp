#include "Config.hpp"
#include "../core/Errors.hpp"
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

int parseTimeout(const std::string& v) {
    try {
        size_t used = 0;
        int ms = std::stoi(v, &used);
        if (used == v.size() && ms >= 0) return ms;
    }
    catch (const std::exception&) {
    }
    throw ValidationError("lock_timeout_ms must be a non-negative integer, got '" + v + "'");
}

std::string requireString(const std::string& key, const nlohmann::json& value) {
    if (!value.is_string())
        throw ValidationError(key + " must be a string, got " + value.dump());
    return value.get<std::string>();
}

int requireMillis(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number_integer())
        throw ValidationError(key + " must be a non-negative integer, got " + value.dump());
    long long ms = value.get<long long>();
    if (ms < 0 || ms > INT_MAX)
        throw ValidationError(key + " out of range: " + value.dump());
    return static_cast<int>(ms);
}

Ladder requireLadder(const std::string& key, const nlohmann::json& value) {
    if (!value.is_array())
        throw ValidationError(key + " must be an array of day counts, got " + value.dump());

    std::vector<int> days;
    days.reserve(value.size());
    for (const auto& rung : value) {
        if (!rung.is_number_integer())
            throw ValidationError(key + " entries must be integers, got " + rung.dump());
        long long d = rung.get<long long>();
        if (d < INT_MIN || d > INT_MAX)
            throw ValidationError(key + " entry out of range: " + rung.dump());
        days.push_back(static_cast<int>(d));
    }
    return Ladder(days);
}

} // namespace

void Config::deserialize(const std::string& data) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(data);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Config is not valid JSON: ") + e.what());
    }

    if (!j.is_object())
        throw ValidationError("Config must be a JSON object");

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "store_path") {
            std::string path = requireString(key, value);
            if (path.empty()) throw ValidationError("store_path must not be empty");
            store_path = path;
        }
        else if (key == "log_path") {
            log_path = requireString(key, value);
        }
        else if (key == "log_level") {
            log_level = requireString(key, value);
        }
        else if (key == "lock_timeout_ms") {
            lock_timeout_ms = requireMillis(key, value);
        }
        else if (key == "ladder_days") {
            ladder = requireLadder(key, value);
        }
        else if (key == "notify") {
            if (!value.is_boolean())
                throw ValidationError("notify must be true or false, got " + value.dump());
            notify = value.get<bool>();
        }
        else if (key == "passphrase") {
            spdlog::warn("Ignoring 'passphrase' in config file; use FORGETMENOT_PASSPHRASE");
        }
        else {
            spdlog::warn("Unknown config key '{}' ignored", key);
        }
    }
}

bool Config::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::debug("Config file '{}' not found; using defaults", path);
        return false;
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    deserialize(oss.str());
    spdlog::debug("Config loaded from '{}'", path);
    return true;
}

void Config::applyEnvironment() {
    if (const char* v = std::getenv("FORGETMENOT_STORE")) store_path = v;
    if (const char* v = std::getenv("FORGETMENOT_LOG")) log_path = v;
    if (const char* v = std::getenv("FORGETMENOT_LOG_LEVEL")) log_level = v;
    if (const char* v = std::getenv("FORGETMENOT_LOCK_TIMEOUT_MS")) lock_timeout_ms = parseTimeout(v);
    if (const char* v = std::getenv("FORGETMENOT_PASSPHRASE")) passphrase = v;
}

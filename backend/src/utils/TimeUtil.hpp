#pragma once
#include <ctime>
#include <optional>
#include <string>

namespace TimeUtil
{
    // "YYYY-MM-DDTHH:MM:SSZ"
    std::string toIso8601(std::time_t t);

    // Accepts exactly the format toIso8601 writes; nullopt otherwise.
    std::optional<std::time_t> fromIso8601(const std::string& s);

    // "YYYY-MM-DD" in local time, for display.
    std::string toLocalDate(std::time_t t);

    // Last second of the local calendar day containing t.
    std::time_t endOfLocalDay(std::time_t t);
}

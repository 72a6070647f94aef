#include "Ladder.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <sstream>

Ladder::Ladder()
    : days_{ 1, 3, 5, 11, 25, 44, 88 }
{
}

Ladder::Ladder(const std::vector<int>& days)
    : days_(days)
{
    if (days_.empty())
        throw ValidationError("Ladder must have at least one rung");

    for (size_t i = 0; i < days_.size(); ++i) {
        if (days_[i] < 1)
            throw ValidationError("Ladder rung " + std::to_string(i) + " must be at least 1 day");
        if (days_[i] > MAX_RUNG_DAYS)
            throw ValidationError("Ladder rung " + std::to_string(i) + " exceeds "
                + std::to_string(MAX_RUNG_DAYS) + " days");
        if (i > 0 && days_[i] <= days_[i - 1])
            throw ValidationError("Ladder must be strictly increasing (rung " + std::to_string(i) + ")");
    }
}

int Ladder::daysAt(int index) const {
    return days_.at(static_cast<size_t>(clampIndex(index)));
}

std::time_t Ladder::gapSeconds(int index) const {
    return static_cast<std::time_t>(daysAt(index)) * SECONDS_PER_DAY;
}

int Ladder::clampIndex(int index) const {
    return std::clamp(index, 0, maxIndex());
}

std::string Ladder::toString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < days_.size(); ++i) {
        if (i) oss << ",";
        oss << days_[i];
    }
    return oss.str();
}

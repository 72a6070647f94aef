#pragma once
#include <ctime>
#include <string>
#include <vector>

// Fixed, strictly increasing sequence of review gaps (in days).
// Index 0 is the least practiced rung, size()-1 the most practiced.
class Ladder {
public:
    // Reference ladder: 1, 3, 5, 11, 25, 44, 88 days
    Ladder();

    // Throws ValidationError unless days is non-empty, strictly increasing
    // and each rung lies in [1, MAX_RUNG_DAYS].
    explicit Ladder(const std::vector<int>& days);

    int size() const { return static_cast<int>(days_.size()); }
    int maxIndex() const { return size() - 1; }

    int daysAt(int index) const;
    std::time_t gapSeconds(int index) const;

    int clampIndex(int index) const;

    const std::vector<int>& days() const { return days_; }
    std::string toString() const;

    static constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;
    // Keeps every scheduled date inside four-digit ISO-8601 years.
    static constexpr int MAX_RUNG_DAYS = 36500;

private:
    std::vector<int> days_;
};

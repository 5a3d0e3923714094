#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace hsdsync {

// UTC wall-clock minute, the granularity of HSD observation times.
struct Timestamp {
    int year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};

    // Accepts "YYYY-MM-DD HH:MM" and "YYYY-MM-DDTHH:MM".
    [[nodiscard]] static std::optional<Timestamp> parse(const std::string& text);
    [[nodiscard]] static Timestamp fromTime(std::time_t seconds);

    [[nodiscard]] std::time_t toTime() const;

    [[nodiscard]] std::string compact() const;       // YYYYMMDD_HHMM
    [[nodiscard]] std::string dateToken() const;     // YYYYMMDD
    [[nodiscard]] std::string timeToken() const;     // HHMM
    [[nodiscard]] std::string yearMonth() const;     // YYYYMM
    [[nodiscard]] std::string dayToken() const;      // DD
    [[nodiscard]] std::string hourToken() const;     // HH
    [[nodiscard]] std::string display() const;       // YYYY-MM-DD HH:MM

    friend bool operator==(const Timestamp& a, const Timestamp& b) {
        return a.toTime() == b.toTime();
    }
    friend bool operator!=(const Timestamp& a, const Timestamp& b) { return !(a == b); }
    friend bool operator<(const Timestamp& a, const Timestamp& b) {
        return a.toTime() < b.toTime();
    }
};

// Ordered, deduplicated observation times from `start` (rounded down to the
// step) through `end` inclusive. An empty list is returned when end < start.
[[nodiscard]] std::vector<Timestamp> makeTimeList(const Timestamp& start,
                                                  const Timestamp& end,
                                                  std::chrono::minutes step);

} // namespace hsdsync

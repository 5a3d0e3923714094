#include "hsdsync/timestamp.hpp"

#include <cstdio>
#include <stdexcept>

#include <fmt/format.h>

namespace hsdsync {

std::optional<Timestamp> Timestamp::parse(const std::string& text) {
    Timestamp ts;
    char separator = 0;
    int consumed = 0;
    const int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d%n",
                                   &ts.year, &ts.month, &ts.day, &separator,
                                   &ts.hour, &ts.minute, &consumed);
    if (fields != 6 || static_cast<std::size_t>(consumed) != text.size()) {
        return std::nullopt;
    }
    if (separator != ' ' && separator != 'T') {
        return std::nullopt;
    }
    if (ts.month < 1 || ts.month > 12 || ts.day < 1 || ts.day > 31 ||
        ts.hour < 0 || ts.hour > 23 || ts.minute < 0 || ts.minute > 59) {
        return std::nullopt;
    }

    // Reject dates such as Feb 30 that timegm would silently normalize.
    const Timestamp normalized = fromTime(ts.toTime());
    if (normalized.year != ts.year || normalized.month != ts.month || normalized.day != ts.day) {
        return std::nullopt;
    }
    return ts;
}

Timestamp Timestamp::fromTime(std::time_t seconds) {
    std::tm tm{};
    if (gmtime_r(&seconds, &tm) == nullptr) {
        throw std::runtime_error("Timestamp out of range");
    }
    return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min};
}

std::time_t Timestamp::toTime() const {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    return timegm(&tm);
}

std::string Timestamp::compact() const {
    return fmt::format("{:04}{:02}{:02}_{:02}{:02}", year, month, day, hour, minute);
}

std::string Timestamp::dateToken() const {
    return fmt::format("{:04}{:02}{:02}", year, month, day);
}

std::string Timestamp::timeToken() const {
    return fmt::format("{:02}{:02}", hour, minute);
}

std::string Timestamp::yearMonth() const {
    return fmt::format("{:04}{:02}", year, month);
}

std::string Timestamp::dayToken() const {
    return fmt::format("{:02}", day);
}

std::string Timestamp::hourToken() const {
    return fmt::format("{:02}", hour);
}

std::string Timestamp::display() const {
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}", year, month, day, hour, minute);
}

std::vector<Timestamp> makeTimeList(const Timestamp& start, const Timestamp& end,
                                    std::chrono::minutes step) {
    if (step.count() <= 0) {
        throw std::invalid_argument("Time step must be positive");
    }

    std::vector<Timestamp> times;
    const std::time_t step_seconds = static_cast<std::time_t>(step.count()) * 60;
    const std::time_t last = end.toTime();
    std::time_t current = start.toTime();
    if (last < current) {
        return times;
    }
    current -= current % step_seconds;

    for (; current <= last; current += step_seconds) {
        times.push_back(Timestamp::fromTime(current));
    }
    return times;
}

} // namespace hsdsync

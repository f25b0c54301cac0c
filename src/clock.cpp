#include "clock.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>

#include <fmt/format.h>

// ─────────────────────────────────────
Timestamp SystemClock::Now() const {
    return std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
}

// ─────────────────────────────────────
std::string ToIso8601(Timestamp t) {
    const auto ms = t.time_since_epoch().count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    long frac = static_cast<long>(ms % 1000);
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
}

// ─────────────────────────────────────
std::optional<Timestamp> ParseIso8601(const std::string &s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute,
                    &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    long millis = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    // Only UTC is ever written; accept an explicit zero offset too.
    const std::string zone = s.substr(pos);
    if (!zone.empty() && zone != "Z" && zone != "+00:00") {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t secs = timegm(&tm);

    return Timestamp(Millis(static_cast<long long>(secs) * 1000 + millis));
}

// ─────────────────────────────────────
std::string LocalDayKey(Timestamp t) {
    std::time_t secs = static_cast<std::time_t>(
        std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count());
    std::tm tm{};
    localtime_r(&secs, &tm);

    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

// ─────────────────────────────────────
std::optional<int> DaysBetween(const std::string &a, const std::string &b) {
    auto toEpochDay = [](const std::string &key) -> std::optional<long long> {
        int y = 0, m = 0, d = 0;
        if (std::sscanf(key.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3) {
            return std::nullopt;
        }
        std::tm tm{};
        tm.tm_year = y - 1900;
        tm.tm_mon = m - 1;
        tm.tm_mday = d;
        tm.tm_hour = 12;
        return static_cast<long long>(timegm(&tm)) / 86400;
    };

    const auto da = toEpochDay(a);
    const auto db = toEpochDay(b);
    if (!da || !db) {
        return std::nullopt;
    }
    return static_cast<int>(*db - *da);
}

// ─────────────────────────────────────
std::string FormatDuration(Millis d) {
    const long long minutes = std::max<long long>(0, d.count()) / 60000;
    if (minutes < 60) {
        return std::to_string(minutes) + "m";
    }
    return std::to_string(minutes / 60) + "h " + std::to_string(minutes % 60) + "m";
}

// ─────────────────────────────────────
std::string FormatCountdown(Millis remaining) {
    const long long ms = std::max<long long>(0, remaining.count());
    const long long total = (ms + 999) / 1000;

    return fmt::format("{:02}:{:02}", total / 60, total % 60);
}

#pragma once

#include <chrono>
#include <optional>
#include <string>

using Millis = std::chrono::milliseconds;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Millis>;

class Clock {
  public:
    virtual ~Clock() = default;
    virtual Timestamp Now() const = 0;
};

class SystemClock : public Clock {
  public:
    Timestamp Now() const override;
};

// Test and replay clock: time only moves when told to.
class ManualClock : public Clock {
  public:
    explicit ManualClock(Timestamp start) : m_Now(start) {
    }
    Timestamp Now() const override {
        return m_Now;
    }
    void Set(Timestamp t) {
        m_Now = t;
    }
    void Advance(Millis d) {
        m_Now += d;
    }

  private:
    Timestamp m_Now;
};

// 2026-03-10T12:00:00.000Z
std::string ToIso8601(Timestamp t);
std::optional<Timestamp> ParseIso8601(const std::string &s);

// Local calendar day of t, "YYYY-MM-DD".
std::string LocalDayKey(Timestamp t);
// Whole days between two "YYYY-MM-DD" keys (b - a); nullopt if either is malformed.
std::optional<int> DaysBetween(const std::string &a, const std::string &b);

// "12m" under an hour, "1h 5m" otherwise.
std::string FormatDuration(Millis d);
// "MM:SS", rounding up to the next whole second.
std::string FormatCountdown(Millis remaining);

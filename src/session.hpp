#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "clock.hpp"
#include "ledger.hpp"

enum class Phase { Idle, Work, Break };

const char *PhaseName(Phase phase);
std::optional<Phase> ParsePhase(const std::string &name);

// The current focus session. anchor is set iff phase is Work or Break and the timer is
// not paused; while paused, pausedElapsed holds the frozen elapsed time.
struct Session {
    std::optional<std::string> targetId; // none: untracked eye-rest session
    Phase phase = Phase::Idle;
    std::optional<Timestamp> anchor;
    int sessionsCompletedToday = 0;
    bool paused = false;
    Millis pausedElapsed{0};
};

bool operator==(const Session &a, const Session &b);
bool operator!=(const Session &a, const Session &b);

constexpr Millis kMinimumEntryDuration{5000};
constexpr Millis kDefaultWorkDuration{25 * 60 * 1000};
constexpr Millis kDefaultBreakDuration{5 * 60 * 1000};

struct SessionDurations {
    Millis work{kDefaultWorkDuration};
    Millis breakTime{kDefaultBreakDuration};
};

// Side effects requested by a transition. The caller applies them in order.
struct AppendEntry {
    TimeEntry entry;
};

struct SessionCompleted {
    std::optional<std::string> target;
    int sessionsCompletedToday = 0;
};

struct BreakCompleted {};

// start() over a running work session drops its unrecorded time.
struct DiscardedElapsed {
    std::optional<std::string> target;
    Millis elapsed{0};
};

using Effect = std::variant<AppendEntry, SessionCompleted, BreakCompleted, DiscardedElapsed>;

struct Transition {
    Session session;
    std::vector<Effect> effects;

    bool Changed(const Session &before) const {
        return session != before || !effects.empty();
    }
};

// Every transition is a total function of (session, now): calls that make no sense in the
// current phase return the session unchanged with no effects.
class SessionMachine {
  public:
    explicit SessionMachine(SessionDurations durations = {});

    Transition Start(const Session &s, std::optional<std::string> targetId, Timestamp now) const;
    Transition PauseOrResume(const Session &s, Timestamp now) const;
    Transition Stop(const Session &s, Timestamp now) const;
    Transition CompleteWork(const Session &s, Timestamp now) const;
    Transition CompleteBreak(const Session &s, Timestamp now) const;

    // Poll for phase completion. Safe to call at any frequency; a process that slept
    // through a deadline completes the phase on its first tick after waking.
    Transition Tick(const Session &s, Timestamp now) const;

    Millis Remaining(const Session &s, Timestamp now) const;
    const SessionDurations &Durations() const {
        return m_Durations;
    }

  private:
    SessionDurations m_Durations;
};

Millis Elapsed(const Session &s, Timestamp now);

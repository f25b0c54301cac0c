#include "session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

std::string TargetName(const std::optional<std::string> &target) {
    return target ? *target : std::string("<eye-rest>");
}

std::optional<AppendEntry> RecordIfLongEnough(const Session &s, Timestamp now) {
    if (s.phase != Phase::Work || !s.targetId) {
        return std::nullopt;
    }
    const Millis elapsed = Elapsed(s, now);
    if (elapsed < kMinimumEntryDuration) {
        spdlog::debug("Session: {} ms on '{}' is below the recording threshold",
                      elapsed.count(), *s.targetId);
        return std::nullopt;
    }

    TimeEntry entry;
    entry.id = NewEntryId();
    entry.taskId = *s.targetId;
    entry.startedAt = now - elapsed;
    entry.endedAt = now;
    entry.duration = elapsed;
    return AppendEntry{std::move(entry)};
}

} // namespace

// ─────────────────────────────────────
const char *PhaseName(Phase phase) {
    switch (phase) {
    case Phase::Work:
        return "work";
    case Phase::Break:
        return "break";
    case Phase::Idle:
        break;
    }
    return "idle";
}

// ─────────────────────────────────────
std::optional<Phase> ParsePhase(const std::string &name) {
    if (name == "idle") {
        return Phase::Idle;
    }
    if (name == "work") {
        return Phase::Work;
    }
    if (name == "break") {
        return Phase::Break;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool operator==(const Session &a, const Session &b) {
    return a.targetId == b.targetId && a.phase == b.phase && a.anchor == b.anchor &&
           a.sessionsCompletedToday == b.sessionsCompletedToday && a.paused == b.paused &&
           a.pausedElapsed == b.pausedElapsed;
}

bool operator!=(const Session &a, const Session &b) {
    return !(a == b);
}

// ─────────────────────────────────────
Millis Elapsed(const Session &s, Timestamp now) {
    if (s.phase == Phase::Idle) {
        return Millis{0};
    }
    if (s.paused) {
        return s.pausedElapsed;
    }
    if (!s.anchor) {
        return Millis{0};
    }
    // A clock stepping backwards must not produce negative time.
    return std::max(Millis{0}, now - *s.anchor);
}

// ─────────────────────────────────────
SessionMachine::SessionMachine(SessionDurations durations) : m_Durations(durations) {
}

// ─────────────────────────────────────
Transition SessionMachine::Start(const Session &s, std::optional<std::string> targetId,
                                 Timestamp now) const {
    Transition t{s, {}};

    if (s.phase == Phase::Work && s.targetId) {
        const Millis lost = Elapsed(s, now);
        if (lost >= kMinimumEntryDuration) {
            t.effects.emplace_back(DiscardedElapsed{s.targetId, lost});
        }
    }

    t.session.targetId = std::move(targetId);
    t.session.phase = Phase::Work;
    t.session.anchor = now;
    t.session.paused = false;
    t.session.pausedElapsed = Millis{0};
    // sessionsCompletedToday is carried over untouched.

    spdlog::debug("Session: start on '{}' ({} completed today)", TargetName(t.session.targetId),
                  t.session.sessionsCompletedToday);
    return t;
}

// ─────────────────────────────────────
Transition SessionMachine::PauseOrResume(const Session &s, Timestamp now) const {
    Transition t{s, {}};
    if (s.phase == Phase::Idle) {
        return t;
    }

    if (s.paused) {
        t.session.anchor = now - s.pausedElapsed;
        t.session.paused = false;
        t.session.pausedElapsed = Millis{0};
        spdlog::debug("Session: resumed {} at {} ms", PhaseName(s.phase), s.pausedElapsed.count());
    } else {
        t.session.pausedElapsed = Elapsed(s, now);
        t.session.paused = true;
        t.session.anchor.reset();
        spdlog::debug("Session: paused {} at {} ms", PhaseName(s.phase),
                      t.session.pausedElapsed.count());
    }
    return t;
}

// ─────────────────────────────────────
Transition SessionMachine::Stop(const Session &s, Timestamp now) const {
    Transition t{Session{}, {}};

    if (auto append = RecordIfLongEnough(s, now)) {
        t.effects.emplace_back(std::move(*append));
    }

    // targetId, anchor and pause bookkeeping go back to defaults, and so does the daily
    // counter: stop means done for now.
    if (s.phase != Phase::Idle) {
        spdlog::debug("Session: stop from {}", PhaseName(s.phase));
    }
    return t;
}

// ─────────────────────────────────────
Transition SessionMachine::CompleteWork(const Session &s, Timestamp now) const {
    Transition t{s, {}};
    if (s.phase != Phase::Work) {
        return t;
    }

    if (auto append = RecordIfLongEnough(s, now)) {
        t.effects.emplace_back(std::move(*append));
    }

    t.session.phase = Phase::Break;
    t.session.anchor = now;
    t.session.paused = false;
    t.session.pausedElapsed = Millis{0};
    t.session.sessionsCompletedToday = s.sessionsCompletedToday + 1;

    t.effects.emplace_back(SessionCompleted{t.session.targetId, t.session.sessionsCompletedToday});
    spdlog::info("Session: work on '{}' complete, {} today", TargetName(s.targetId),
                 t.session.sessionsCompletedToday);
    return t;
}

// ─────────────────────────────────────
Transition SessionMachine::CompleteBreak(const Session &s, Timestamp now) const {
    Transition t{s, {}};
    if (s.phase != Phase::Break) {
        return t;
    }

    t.session.phase = Phase::Work;
    t.session.anchor = now;
    t.session.paused = false;
    t.session.pausedElapsed = Millis{0};

    spdlog::debug("Session: break over, back to '{}'", TargetName(s.targetId));
    return t;
}

// ─────────────────────────────────────
Transition SessionMachine::Tick(const Session &s, Timestamp now) const {
    if (s.paused) {
        return Transition{s, {}};
    }

    if (s.phase == Phase::Work && Elapsed(s, now) >= m_Durations.work) {
        return CompleteWork(s, now);
    }

    if (s.phase == Phase::Break && Elapsed(s, now) >= m_Durations.breakTime) {
        Transition t = CompleteBreak(s, now);
        t.effects.emplace_back(BreakCompleted{});
        return t;
    }

    return Transition{s, {}};
}

// ─────────────────────────────────────
Millis SessionMachine::Remaining(const Session &s, Timestamp now) const {
    if (s.phase == Phase::Idle) {
        return Millis{0};
    }
    const Millis total = s.phase == Phase::Work ? m_Durations.work : m_Durations.breakTime;
    return std::max(Millis{0}, total - Elapsed(s, now));
}

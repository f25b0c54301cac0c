#include "focus_controller.hpp"

#include <spdlog/spdlog.h>

#include "aggregation.hpp"

// ─────────────────────────────────────
FocusController::FocusController(const Clock &clock, SessionDurations durations,
                                 SyncBridge *bridge, bool drivesTimer)
    : m_Clock(clock), m_Machine(durations), m_Bridge(bridge), m_DrivesTimer(drivesTimer) {
}

// ─────────────────────────────────────
void FocusController::SetListener(FocusListener listener) {
    m_Listener = std::move(listener);
}

// ─────────────────────────────────────
bool FocusController::Hydrate() {
    if (!m_Bridge) {
        return false;
    }
    auto snapshot = m_Bridge->Load();
    if (!snapshot) {
        return false;
    }
    m_Snapshot = std::move(*snapshot);
    spdlog::info("Hydrated: {} phase, {} ledger entries, {} tasks",
                 PhaseName(m_Snapshot.session.phase), m_Snapshot.ledger.Size(),
                 m_Snapshot.board.Tasks().size());
    return true;
}

// ─────────────────────────────────────
bool FocusController::Sync() {
    if (!m_Bridge) {
        return false;
    }
    const bool replaced = m_Bridge->PollExternal([this](FocusSnapshot snapshot) {
        m_Snapshot = std::move(snapshot);
        if (m_Listener.onExternalChange) {
            m_Listener.onExternalChange();
        }
    });
    if (replaced) {
        spdlog::debug("Picked up external state: {} phase, {} ledger entries",
                      PhaseName(m_Snapshot.session.phase), m_Snapshot.ledger.Size());
    }
    return replaced;
}

// ─────────────────────────────────────
void FocusController::Start(std::optional<std::string> targetId) {
    Sync();
    Apply(m_Machine.Start(m_Snapshot.session, std::move(targetId), m_Clock.Now()), "start");
}

// ─────────────────────────────────────
void FocusController::PauseOrResume() {
    Sync();
    Apply(m_Machine.PauseOrResume(m_Snapshot.session, m_Clock.Now()), "pause");
}

// ─────────────────────────────────────
void FocusController::Stop() {
    Sync();
    Apply(m_Machine.Stop(m_Snapshot.session, m_Clock.Now()), "stop");
}

// ─────────────────────────────────────
void FocusController::CompleteWork() {
    Sync();
    Apply(m_Machine.CompleteWork(m_Snapshot.session, m_Clock.Now()), "complete-work");
}

// ─────────────────────────────────────
void FocusController::CompleteBreak() {
    Sync();
    Apply(m_Machine.CompleteBreak(m_Snapshot.session, m_Clock.Now()), "complete-break");
}

// ─────────────────────────────────────
void FocusController::Tick() {
    Sync();
    if (!m_DrivesTimer) {
        return;
    }
    Apply(m_Machine.Tick(m_Snapshot.session, m_Clock.Now()), "tick");
}

// ─────────────────────────────────────
bool FocusController::SetTaskCompleted(const std::string &taskId, bool completed) {
    Sync();
    if (!m_Snapshot.board.SetTaskCompleted(taskId, completed)) {
        return false;
    }
    Persist();
    return true;
}

// ─────────────────────────────────────
bool FocusController::DeleteTask(const std::string &taskId) {
    Sync();
    if (!m_Snapshot.board.RemoveTask(taskId)) {
        return false;
    }
    const auto removed = m_Snapshot.ledger.RemoveEntriesForTask(taskId);
    spdlog::info("Deleted task '{}' and {} of its time entries", taskId, removed);
    Persist();
    return true;
}

// ─────────────────────────────────────
Millis FocusController::TimeForTask(const std::string &taskId) const {
    return ::TimeForTask(m_Snapshot.ledger, m_Snapshot.session, taskId, m_Clock.Now());
}

// ─────────────────────────────────────
Millis FocusController::TimeForProject(const std::string &projectId) const {
    return ::TimeForProject(m_Snapshot.ledger, m_Snapshot.session, m_Snapshot.board, projectId,
                            m_Clock.Now());
}

// ─────────────────────────────────────
Millis FocusController::Elapsed() const {
    return ::Elapsed(m_Snapshot.session, m_Clock.Now());
}

// ─────────────────────────────────────
Millis FocusController::Remaining() const {
    return m_Machine.Remaining(m_Snapshot.session, m_Clock.Now());
}

// ─────────────────────────────────────
void FocusController::Apply(Transition t, const char *command) {
    if (!t.Changed(m_Snapshot.session)) {
        return;
    }

    m_Snapshot.session = t.session;
    for (auto &effect : t.effects) {
        if (auto *append = std::get_if<AppendEntry>(&effect)) {
            m_Snapshot.ledger.Append(std::move(append->entry));
        } else if (auto *lost = std::get_if<DiscardedElapsed>(&effect)) {
            spdlog::warn("{}: dropped {} ms of unrecorded work on '{}'", command,
                         lost->elapsed.count(), lost->target.value_or(""));
        }
    }

    // The other surface must see the new state before anyone reacts to the signals.
    Persist();

    for (const auto &effect : t.effects) {
        if (auto *done = std::get_if<SessionCompleted>(&effect)) {
            if (m_Listener.onSessionCompleted) {
                m_Listener.onSessionCompleted(*done);
            }
        } else if (auto *breakDone = std::get_if<BreakCompleted>(&effect)) {
            if (m_Listener.onBreakCompleted) {
                m_Listener.onBreakCompleted(*breakDone);
            }
        }
    }
}

// ─────────────────────────────────────
void FocusController::Persist() {
    if (m_Bridge && !m_Bridge->Persist(m_Snapshot)) {
        spdlog::warn("State is held in memory only until the next successful write");
    }
}

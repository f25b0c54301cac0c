#pragma once

#include <functional>
#include <optional>
#include <string>

#include "blob.hpp"
#include "clock.hpp"
#include "session.hpp"
#include "sync_bridge.hpp"

// Outbound signals for the host shell. Fire and forget.
struct FocusListener {
    std::function<void(const SessionCompleted &)> onSessionCompleted;
    std::function<void(const BreakCompleted &)> onBreakCompleted;
    // Another surface's snapshot replaced the local state.
    std::function<void()> onExternalChange;
};

// Owns the one Session of this surface together with the ledger and task board it
// persists. All mutation goes through the commands below; each one first picks up any
// write made by the other surface so it acts on the freshest state.
class FocusController {
  public:
    // bridge may be null for a purely local engine. When drivesTimer is false the
    // controller mirrors the shared state but leaves phase completion to the other surface.
    FocusController(const Clock &clock, SessionDurations durations, SyncBridge *bridge = nullptr,
                    bool drivesTimer = true);

    void SetListener(FocusListener listener);

    // Replace local state with the persisted blob, if there is a readable one.
    bool Hydrate();
    // Apply a pending external write. Returns true when the local state was replaced.
    bool Sync();

    // Session commands
    void Start(std::optional<std::string> targetId);
    void PauseOrResume();
    void Stop();
    void CompleteWork();
    void CompleteBreak();
    // Periodic poll; completes the current phase once its duration has elapsed.
    void Tick();

    // Task board commands
    bool SetTaskCompleted(const std::string &taskId, bool completed);
    // Removes the task and every ledger entry recorded against it.
    bool DeleteTask(const std::string &taskId);

    // Queries
    Millis TimeForTask(const std::string &taskId) const;
    Millis TimeForProject(const std::string &projectId) const;
    Millis Elapsed() const;
    Millis Remaining() const;

    const FocusSnapshot &Snapshot() const {
        return m_Snapshot;
    }
    const Session &CurrentSession() const {
        return m_Snapshot.session;
    }
    const Ledger &GetLedger() const {
        return m_Snapshot.ledger;
    }
    const TaskBoard &Board() const {
        return m_Snapshot.board;
    }
    const SessionMachine &Machine() const {
        return m_Machine;
    }
    const Clock &GetClock() const {
        return m_Clock;
    }
    bool DrivesTimer() const {
        return m_DrivesTimer;
    }

  private:
    void Apply(Transition t, const char *command);
    void Persist();

  private:
    const Clock &m_Clock;
    SessionMachine m_Machine;
    SyncBridge *m_Bridge;
    bool m_DrivesTimer;

    FocusSnapshot m_Snapshot;
    FocusListener m_Listener;
};

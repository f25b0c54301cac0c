#pragma once

#include <string>

#include "board.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "session.hpp"

// Read-only queries over the ledger and the live session. They never mutate either, so
// they are safe to call once per render tick.

// Recorded time for the task plus the in-flight time of a work session targeting it
// (now - anchor while running, pausedElapsed while paused).
Millis TimeForTask(const Ledger &ledger, const Session &session, const std::string &taskId,
                   Timestamp now);

// Sum of TimeForTask over the tasks of the project and its sub-projects.
Millis TimeForProject(const Ledger &ledger, const Session &session, const TaskBoard &board,
                      const std::string &projectId, Timestamp now);

// Unrecorded time of the running work session, zero for breaks and eye-rest sessions.
Millis InFlightTime(const Session &session, Timestamp now);

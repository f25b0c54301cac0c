#include "aggregation.hpp"

// ─────────────────────────────────────
Millis InFlightTime(const Session &session, Timestamp now) {
    if (session.phase != Phase::Work || !session.targetId) {
        return Millis{0};
    }
    return Elapsed(session, now);
}

// ─────────────────────────────────────
Millis TimeForTask(const Ledger &ledger, const Session &session, const std::string &taskId,
                   Timestamp now) {
    Millis total = ledger.TotalForTask(taskId);
    if (session.targetId && *session.targetId == taskId) {
        total += InFlightTime(session, now);
    }
    return total;
}

// ─────────────────────────────────────
Millis TimeForProject(const Ledger &ledger, const Session &session, const TaskBoard &board,
                      const std::string &projectId, Timestamp now) {
    Millis total{0};
    for (const auto &taskId : board.TaskIdsInProject(projectId)) {
        total += TimeForTask(ledger, session, taskId, now);
    }
    return total;
}

#include "blob.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const char *kTasksKey = "tasks";
const char *kProjectsKey = "projects";
const char *kEntriesKey = "timeEntries";
const char *kSessionKey = "session";

nlohmann::json OptionalToJson(const std::optional<std::string> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

// ─────────────────────────────────────
nlohmann::json BlobCodec::SessionToJson(const Session &session) const {
    return {
        {"targetId", OptionalToJson(session.targetId)},
        {"phase", PhaseName(session.phase)},
        {"anchor", session.anchor ? nlohmann::json(ToIso8601(*session.anchor))
                                  : nlohmann::json(nullptr)},
        {"sessionsCompletedToday", session.sessionsCompletedToday},
        {"paused", session.paused},
        {"pausedElapsed", session.pausedElapsed.count()},
    };
}

// ─────────────────────────────────────
nlohmann::json BlobCodec::EntryToJson(const TimeEntry &entry) const {
    return {
        {"id", entry.id},
        {"taskId", entry.taskId},
        {"startedAt", ToIso8601(entry.startedAt)},
        {"endedAt", ToIso8601(entry.endedAt)},
        {"duration", entry.duration.count()},
    };
}

// ─────────────────────────────────────
nlohmann::json BlobCodec::ToJson(const FocusSnapshot &snapshot) const {
    nlohmann::json j = snapshot.extra.is_object() ? snapshot.extra : nlohmann::json::object();

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto &t : snapshot.board.Tasks()) {
        nlohmann::json tj = t.raw.is_object() ? t.raw : nlohmann::json::object();
        tj["id"] = t.id;
        tj["projectId"] = OptionalToJson(t.projectId);
        tj["title"] = t.title;
        tj["completed"] = t.completed;
        tasks.push_back(std::move(tj));
    }

    nlohmann::json projects = nlohmann::json::array();
    for (const auto &p : snapshot.board.Projects()) {
        nlohmann::json pj = p.raw.is_object() ? p.raw : nlohmann::json::object();
        pj["id"] = p.id;
        pj["name"] = p.name;
        pj["parentId"] = OptionalToJson(p.parentId);
        projects.push_back(std::move(pj));
    }

    nlohmann::json entries = nlohmann::json::array();
    for (const auto &e : snapshot.ledger.Entries()) {
        entries.push_back(EntryToJson(e));
    }

    j[kTasksKey] = std::move(tasks);
    j[kProjectsKey] = std::move(projects);
    j[kEntriesKey] = std::move(entries);
    j[kSessionKey] = SessionToJson(snapshot.session);
    return j;
}

// ─────────────────────────────────────
std::string BlobCodec::Encode(const FocusSnapshot &snapshot) const {
    return ToJson(snapshot).dump();
}

// ─────────────────────────────────────
std::optional<FocusSnapshot> BlobCodec::Decode(const std::string &text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("BlobCodec: blob is not valid JSON ({} bytes), ignoring", text.size());
        return std::nullopt;
    }
    return FromJson(j);
}

// ─────────────────────────────────────
std::optional<FocusSnapshot> BlobCodec::FromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        spdlog::warn("BlobCodec: blob root is {}, expected object", j.type_name());
        return std::nullopt;
    }

    FocusSnapshot snapshot;

    std::vector<Task> tasks;
    for (const auto &tj : m_JsonParse.GetArray(j, kTasksKey)) {
        if (auto t = TaskFromJson(tj)) {
            tasks.push_back(std::move(*t));
        }
    }

    std::vector<Project> projects;
    for (const auto &pj : m_JsonParse.GetArray(j, kProjectsKey)) {
        if (auto p = ProjectFromJson(pj)) {
            projects.push_back(std::move(*p));
        }
    }
    snapshot.board = TaskBoard(std::move(tasks), std::move(projects));

    std::vector<TimeEntry> entries;
    for (const auto &ej : m_JsonParse.GetArray(j, kEntriesKey)) {
        if (auto e = EntryFromJson(ej)) {
            entries.push_back(std::move(*e));
        }
    }
    snapshot.ledger = Ledger(std::move(entries));

    if (j.contains(kSessionKey)) {
        snapshot.session = SessionFromJson(j.at(kSessionKey));
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != kTasksKey && it.key() != kProjectsKey && it.key() != kEntriesKey &&
            it.key() != kSessionKey) {
            snapshot.extra[it.key()] = it.value();
        }
    }

    return snapshot;
}

// ─────────────────────────────────────
Session BlobCodec::SessionFromJson(const nlohmann::json &j) {
    Session s;
    if (!j.is_object()) {
        spdlog::warn("BlobCodec: session is {}, using idle session", j.type_name());
        return s;
    }

    const std::string phaseName = m_JsonParse.GetString(j, "phase", "idle");
    const auto phase = ParsePhase(phaseName);
    if (!phase) {
        spdlog::warn("BlobCodec: unknown phase '{}', using idle", phaseName);
    }
    s.phase = phase.value_or(Phase::Idle);
    s.targetId = m_JsonParse.GetOptionalString(j, "targetId");
    s.sessionsCompletedToday = std::max(0, m_JsonParse.GetInt(j, "sessionsCompletedToday", 0));
    s.paused = m_JsonParse.GetBool(j, "paused", false);
    s.pausedElapsed =
        Millis(std::max<std::int64_t>(0, m_JsonParse.GetInt64(j, "pausedElapsed", 0)));

    if (auto anchorText = m_JsonParse.GetOptionalString(j, "anchor")) {
        s.anchor = ParseIso8601(*anchorText);
        if (!s.anchor) {
            spdlog::warn("BlobCodec: unreadable anchor '{}'", *anchorText);
        }
    }

    // Restore the anchor/paused invariant if the writer broke it.
    if (s.phase == Phase::Idle) {
        s.anchor.reset();
        s.paused = false;
        s.pausedElapsed = Millis{0};
    } else if (s.paused) {
        s.anchor.reset();
    } else {
        s.pausedElapsed = Millis{0};
        if (!s.anchor) {
            spdlog::warn("BlobCodec: running {} session without anchor, resetting to idle",
                         PhaseName(s.phase));
            s.phase = Phase::Idle;
        }
    }
    return s;
}

// ─────────────────────────────────────
std::optional<TimeEntry> BlobCodec::EntryFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        spdlog::warn("BlobCodec: skipping time entry of type {}", j.type_name());
        return std::nullopt;
    }

    TimeEntry e;
    e.id = m_JsonParse.GetString(j, "id", "");
    e.taskId = m_JsonParse.GetString(j, "taskId", "");
    const auto started = ParseIso8601(m_JsonParse.GetString(j, "startedAt", ""));
    const auto ended = ParseIso8601(m_JsonParse.GetString(j, "endedAt", ""));
    if (e.taskId.empty() || !started || !ended) {
        spdlog::warn("BlobCodec: skipping incomplete time entry '{}'", e.id);
        return std::nullopt;
    }
    e.startedAt = *started;
    e.endedAt = *ended;
    e.duration = *ended - *started;
    if (e.duration < Millis{0}) {
        spdlog::warn("BlobCodec: skipping time entry '{}' that ends before it starts", e.id);
        return std::nullopt;
    }

    // The timestamps are authoritative for the duration.
    const std::int64_t stored = m_JsonParse.GetInt64(j, "duration", e.duration.count());
    if (stored != e.duration.count()) {
        spdlog::warn("BlobCodec: time entry '{}' stores {} ms but spans {} ms, using the span",
                     e.id, stored, e.duration.count());
    }

    // Both surfaces must agree on the id of an entry written without one.
    if (e.id.empty()) {
        e.id = fmt::format("{}@{}", e.taskId, e.startedAt.time_since_epoch().count());
        spdlog::debug("BlobCodec: time entry without id, using '{}'", e.id);
    }
    return e;
}

// ─────────────────────────────────────
std::optional<Task> BlobCodec::TaskFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    Task t;
    t.id = m_JsonParse.GetString(j, "id", "");
    if (t.id.empty()) {
        spdlog::warn("BlobCodec: skipping task without id");
        return std::nullopt;
    }
    t.projectId = m_JsonParse.GetOptionalString(j, "projectId");
    t.title = m_JsonParse.GetString(j, "title", "");
    t.completed = m_JsonParse.GetBool(j, "completed", false);
    t.raw = j;
    return t;
}

// ─────────────────────────────────────
std::optional<Project> BlobCodec::ProjectFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    Project p;
    p.id = m_JsonParse.GetString(j, "id", "");
    if (p.id.empty()) {
        spdlog::warn("BlobCodec: skipping project without id");
        return std::nullopt;
    }
    p.name = m_JsonParse.GetString(j, "name", "");
    p.parentId = m_JsonParse.GetOptionalString(j, "parentId");
    p.raw = j;
    return p;
}

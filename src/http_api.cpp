#include "http_api.hpp"

#include <spdlog/spdlog.h>

#include "blob.hpp"
#include "reports.hpp"

namespace {

void SetError(httplib::Response &res, int status, const std::string &message) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

nlohmann::json ProjectTotalJson(const ProjectTotal &p) {
    nlohmann::json j;
    j["projectId"] = p.projectId ? nlohmann::json(*p.projectId) : nlohmann::json(nullptr);
    j["name"] = p.name;
    j["timeMs"] = p.time.count();
    j["time"] = FormatDuration(p.time);
    j["sessions"] = p.sessions;
    return j;
}

} // namespace

// ─────────────────────────────────────
FocusApi::FocusApi(FocusController &controller, std::mutex &mutex, int focusGoalMinutes,
                   std::function<void()> wake)
    : m_Controller(controller), m_Mutex(mutex), m_FocusGoalMinutes(focusGoalMinutes),
      m_Wake(std::move(wake)) {
}

// ─────────────────────────────────────
void FocusApi::Register(httplib::Server &server) {
    RegisterSession(server);
    RegisterTasks(server);
    RegisterReports(server);
}

// ─────────────────────────────────────
nlohmann::json FocusApi::StateJson() const {
    BlobCodec codec;
    const SessionDurations &d = m_Controller.Machine().Durations();
    const Millis remaining = m_Controller.Remaining();

    nlohmann::json j;
    j["session"] = codec.SessionToJson(m_Controller.CurrentSession());
    j["elapsedMs"] = m_Controller.Elapsed().count();
    j["remainingMs"] = remaining.count();
    j["countdown"] = FormatCountdown(remaining);
    j["workMs"] = d.work.count();
    j["breakMs"] = d.breakTime.count();
    j["drivesTimer"] = m_Controller.DrivesTimer();
    j["now"] = ToIso8601(m_Controller.GetClock().Now());
    return j;
}

// ─────────────────────────────────────
void FocusApi::Wake() {
    if (m_Wake) {
        m_Wake();
    }
}

// ─────────────────────────────────────
void FocusApi::Command(httplib::Response &res, const char *name,
                       const std::function<void()> &fn) {
    try {
        nlohmann::json state;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            fn();
            state = StateJson();
        }
        Wake();
        res.set_content(state.dump(), "application/json");
    } catch (const std::exception &e) {
        spdlog::error("{} failed: {}", name, e.what());
        SetError(res, 500, e.what());
    }
}

// ─────────────────────────────────────
void FocusApi::RegisterSession(httplib::Server &server) {
    server.Get("/api/v1/focus/state", [this](const httplib::Request &, httplib::Response &res) {
        try {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Controller.Sync();
            res.set_content(StateJson().dump(), "application/json");
        } catch (const std::exception &e) {
            SetError(res, 500, e.what());
        }
    });

    server.Post("/api/v1/focus/start", [this](const httplib::Request &req, httplib::Response &res) {
        std::optional<std::string> target;
        if (!req.body.empty()) {
            nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                SetError(res, 400, "body must be a JSON object");
                return;
            }
            if (body.contains("taskId") && !body["taskId"].is_null()) {
                if (!body["taskId"].is_string() || body["taskId"].get<std::string>().empty()) {
                    SetError(res, 400, "'taskId' must be a non-empty string or null");
                    return;
                }
                target = body["taskId"].get<std::string>();
            }
        }
        Command(res, "start", [&] { m_Controller.Start(target); });
    });

    server.Post("/api/v1/focus/pause", [this](const httplib::Request &, httplib::Response &res) {
        Command(res, "pause", [&] { m_Controller.PauseOrResume(); });
    });

    server.Post("/api/v1/focus/stop", [this](const httplib::Request &, httplib::Response &res) {
        Command(res, "stop", [&] { m_Controller.Stop(); });
    });

    server.Post("/api/v1/focus/complete-work",
                [this](const httplib::Request &, httplib::Response &res) {
                    Command(res, "complete-work", [&] { m_Controller.CompleteWork(); });
                });

    server.Post("/api/v1/focus/complete-break",
                [this](const httplib::Request &, httplib::Response &res) {
                    Command(res, "complete-break", [&] { m_Controller.CompleteBreak(); });
                });
}

// ─────────────────────────────────────
void FocusApi::RegisterTasks(httplib::Server &server) {
    server.Get(R"(/api/v1/tasks/([^/]+)/time)",
               [this](const httplib::Request &req, httplib::Response &res) {
                   const std::string id = req.matches[1];
                   std::lock_guard<std::mutex> lock(m_Mutex);
                   m_Controller.Sync();
                   const Millis t = m_Controller.TimeForTask(id);
                   nlohmann::json j{{"taskId", id},
                                    {"timeMs", t.count()},
                                    {"time", FormatDuration(t)}};
                   res.set_content(j.dump(), "application/json");
               });

    server.Get(R"(/api/v1/projects/([^/]+)/time)",
               [this](const httplib::Request &req, httplib::Response &res) {
                   const std::string id = req.matches[1];
                   std::lock_guard<std::mutex> lock(m_Mutex);
                   m_Controller.Sync();
                   if (!m_Controller.Board().FindProject(id)) {
                       SetError(res, 404, "unknown project '" + id + "'");
                       return;
                   }
                   const Millis t = m_Controller.TimeForProject(id);
                   nlohmann::json j{{"projectId", id},
                                    {"timeMs", t.count()},
                                    {"time", FormatDuration(t)}};
                   res.set_content(j.dump(), "application/json");
               });

    // Without a body the flag is toggled.
    server.Post(R"(/api/v1/tasks/([^/]+)/complete)",
                [this](const httplib::Request &req, httplib::Response &res) {
                    const std::string id = req.matches[1];
                    std::optional<bool> completed;
                    if (!req.body.empty()) {
                        nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
                        if (body.is_discarded() || !body.is_object() ||
                            (body.contains("completed") && !body["completed"].is_boolean())) {
                            SetError(res, 400, "expected {\"completed\": bool}");
                            return;
                        }
                        if (body.contains("completed")) {
                            completed = body["completed"].get<bool>();
                        }
                    }

                    bool found = false;
                    bool value = false;
                    {
                        std::lock_guard<std::mutex> lock(m_Mutex);
                        m_Controller.Sync();
                        const Task *task = m_Controller.Board().FindTask(id);
                        if (task) {
                            value = completed.value_or(!task->completed);
                            found = m_Controller.SetTaskCompleted(id, value);
                        }
                    }
                    if (!found) {
                        SetError(res, 404, "unknown task '" + id + "'");
                        return;
                    }
                    Wake();
                    res.set_content(nlohmann::json{{"taskId", id}, {"completed", value}}.dump(),
                                    "application/json");
                });

    server.Delete(R"(/api/v1/tasks/([^/]+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                      const std::string id = req.matches[1];
                      bool removed = false;
                      {
                          std::lock_guard<std::mutex> lock(m_Mutex);
                          removed = m_Controller.DeleteTask(id);
                      }
                      if (!removed) {
                          SetError(res, 404, "unknown task '" + id + "'");
                          return;
                      }
                      Wake();
                      res.set_content(R"({"status":"ok"})", "application/json");
                  });
}

// ─────────────────────────────────────
void FocusApi::RegisterReports(httplib::Server &server) {
    server.Get("/api/v1/focus/today", [this](const httplib::Request &, httplib::Response &res) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Controller.Sync();
        Reports reports(m_Controller.GetLedger(), m_Controller.Board());
        const TodayStats today = reports.Today(m_Controller.GetClock().Now(), m_FocusGoalMinutes);

        nlohmann::json j;
        j["day"] = today.day;
        j["sessions"] = today.sessions;
        j["focusMs"] = today.focus.count();
        j["focus"] = FormatDuration(today.focus);
        j["goalMinutes"] = today.goalMinutes;
        j["goalProgress"] = today.goalProgress;
        j["sessionsCompletedToday"] = m_Controller.CurrentSession().sessionsCompletedToday;
        res.set_content(j.dump(), "application/json");
    });

    server.Get("/api/v1/focus/summary", [this](const httplib::Request &, httplib::Response &res) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Controller.Sync();
        Reports reports(m_Controller.GetLedger(), m_Controller.Board());
        const FocusSummary summary = reports.Summary();

        nlohmann::json projects = nlohmann::json::array();
        for (const auto &p : summary.projects) {
            projects.push_back(ProjectTotalJson(p));
        }

        nlohmann::json j;
        j["totalMs"] = summary.total.count();
        j["total"] = FormatDuration(summary.total);
        j["sessions"] = summary.sessions;
        j["mostProductiveDay"] = summary.mostProductiveDay
                                     ? nlohmann::json(*summary.mostProductiveDay)
                                     : nlohmann::json(nullptr);
        j["mostProductiveDayMs"] = summary.mostProductiveDayTime.count();
        j["longestStreak"] = summary.longestStreak;
        j["projects"] = std::move(projects);
        res.set_content(j.dump(), "application/json");
    });

    server.Get("/api/v1/focus/export", [this](const httplib::Request &req, httplib::Response &res) {
        const std::string format =
            req.has_param("format") ? req.get_param_value("format") : std::string("json");

        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Controller.Sync();
        Reports reports(m_Controller.GetLedger(), m_Controller.Board());
        const Timestamp now = m_Controller.GetClock().Now();
        const std::string day = LocalDayKey(now);

        if (format == "csv") {
            res.set_header("Content-Disposition",
                           "attachment; filename=\"focus-log-" + day + ".csv\"");
            res.set_content(reports.ExportCsv(), "text/csv");
        } else if (format == "json") {
            res.set_header("Content-Disposition",
                           "attachment; filename=\"focus-log-" + day + ".json\"");
            res.set_content(reports.ExportJson(now).dump(2), "application/json");
        } else if (format == "markdown") {
            res.set_content(reports.MarkdownSummary(now), "text/markdown");
        } else {
            SetError(res, 400, "unknown format '" + format + "', expected csv, json or markdown");
        }
    });
}

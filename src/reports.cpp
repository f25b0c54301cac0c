#include "reports.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <map>
#include <sstream>

namespace {

const char *kNoProject = "No Project";

std::string CsvEscape(const std::string &s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

long long RoundedMinutes(Millis d) {
    return std::llround(static_cast<double>(d.count()) / 60000.0);
}

// "Mar 10, 2026"
std::string LongDate(Timestamp t) {
    static const char *kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::time_t secs = static_cast<std::time_t>(
        std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count());
    std::tm tm{};
    localtime_r(&secs, &tm);
    return std::string(kMonths[tm.tm_mon]) + " " + std::to_string(tm.tm_mday) + ", " +
           std::to_string(tm.tm_year + 1900);
}

} // namespace

// ─────────────────────────────────────
Reports::Reports(const Ledger &ledger, const TaskBoard &board) : m_Ledger(ledger), m_Board(board) {
}

// ─────────────────────────────────────
std::string Reports::TaskTitle(const std::string &taskId) const {
    const Task *task = m_Board.FindTask(taskId);
    return task ? task->title : std::string();
}

// ─────────────────────────────────────
std::string Reports::ProjectName(const std::string &taskId) const {
    const Project *project = m_Board.ProjectOfTask(taskId);
    return project ? project->name : std::string();
}

// ─────────────────────────────────────
TodayStats Reports::Today(Timestamp now, int goalMinutes) const {
    TodayStats stats;
    stats.day = LocalDayKey(now);
    stats.goalMinutes = std::max(0, goalMinutes);

    for (const auto &e : m_Ledger.Entries()) {
        if (LocalDayKey(e.startedAt) == stats.day) {
            stats.sessions += 1;
            stats.focus += e.duration;
        }
    }

    if (stats.goalMinutes > 0) {
        const double minutes = static_cast<double>(stats.focus.count()) / 60000.0;
        stats.goalProgress = std::min(1.0, minutes / stats.goalMinutes);
    }
    return stats;
}

// ─────────────────────────────────────
FocusSummary Reports::Summary() const {
    FocusSummary summary;

    std::map<std::string, Millis> byDay;
    std::vector<ProjectTotal> projects;

    for (const auto &e : m_Ledger.Entries()) {
        summary.total += e.duration;
        summary.sessions += 1;
        byDay[LocalDayKey(e.startedAt)] += e.duration;

        const Project *project = m_Board.ProjectOfTask(e.taskId);
        std::optional<std::string> key;
        if (project) {
            key = project->id;
        }
        auto it = std::find_if(projects.begin(), projects.end(),
                               [&](const ProjectTotal &p) { return p.projectId == key; });
        if (it == projects.end()) {
            ProjectTotal total;
            total.projectId = key;
            total.name = project ? project->name : kNoProject;
            projects.push_back(std::move(total));
            it = projects.end() - 1;
        }
        it->time += e.duration;
        it->sessions += 1;
    }

    for (const auto &[day, dayTotal] : byDay) {
        if (!summary.mostProductiveDay || dayTotal > summary.mostProductiveDayTime) {
            summary.mostProductiveDay = day;
            summary.mostProductiveDayTime = dayTotal;
        }
    }

    // byDay is ordered, so consecutive keys are consecutive active days.
    int current = 0;
    const std::string *previous = nullptr;
    for (const auto &entry : byDay) {
        const std::string &day = entry.first;
        std::optional<int> gap;
        if (previous) {
            gap = DaysBetween(*previous, day);
        }
        current = (gap && *gap == 1) ? current + 1 : 1;
        summary.longestStreak = std::max(summary.longestStreak, current);
        previous = &day;
    }

    std::stable_sort(projects.begin(), projects.end(),
                     [](const ProjectTotal &a, const ProjectTotal &b) { return a.time > b.time; });
    summary.projects = std::move(projects);
    return summary;
}

// ─────────────────────────────────────
std::string Reports::ExportCsv() const {
    std::ostringstream out;
    out << "Task,Project,Date,Duration (min),StartedAt,EndedAt";
    for (const auto &e : m_Ledger.Entries()) {
        out << '\n'
            << CsvEscape(TaskTitle(e.taskId)) << ',' << CsvEscape(ProjectName(e.taskId)) << ','
            << LocalDayKey(e.startedAt) << ',' << RoundedMinutes(e.duration) << ','
            << ToIso8601(e.startedAt) << ',' << ToIso8601(e.endedAt);
    }
    return out.str();
}

// ─────────────────────────────────────
nlohmann::json Reports::ExportJson(Timestamp now) const {
    nlohmann::json entries = nlohmann::json::array();
    Millis total{0};
    for (const auto &e : m_Ledger.Entries()) {
        total += e.duration;
        entries.push_back({
            {"task", TaskTitle(e.taskId)},
            {"project", ProjectName(e.taskId)},
            {"startedAt", ToIso8601(e.startedAt)},
            {"endedAt", ToIso8601(e.endedAt)},
            {"durationMs", e.duration.count()},
            {"durationMin", RoundedMinutes(e.duration)},
        });
    }

    return {
        {"exportedAt", ToIso8601(now)},
        {"totalDurationMs", total.count()},
        {"entries", std::move(entries)},
    };
}

// ─────────────────────────────────────
std::string Reports::MarkdownSummary(Timestamp now) const {
    const FocusSummary summary = Summary();

    std::ostringstream out;
    out << "## Horizon Focus Summary - " << LongDate(now) << "\n\n";
    out << "| Project | Time | Sessions |\n";
    out << "|---------|------|----------|\n";
    for (const auto &p : summary.projects) {
        out << "| " << p.name << " | " << FormatDuration(p.time) << " | " << p.sessions << " |\n";
    }
    out << "\n**Total:** " << FormatDuration(summary.total) << " across " << summary.sessions
        << " sessions";
    return out.str();
}

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "board.hpp"
#include "clock.hpp"
#include "ledger.hpp"

struct TodayStats {
    std::string day; // local "YYYY-MM-DD"
    int sessions = 0;
    Millis focus{0};
    int goalMinutes = 0;
    double goalProgress = 0.0; // 0..1, 0 without a goal
};

struct ProjectTotal {
    std::optional<std::string> projectId; // none: tasks without a project
    std::string name;
    Millis time{0};
    int sessions = 0;
};

struct FocusSummary {
    Millis total{0};
    int sessions = 0;
    std::optional<std::string> mostProductiveDay;
    Millis mostProductiveDayTime{0};
    int longestStreak = 0; // consecutive active local days
    std::vector<ProjectTotal> projects; // by time, descending
};

// Read-only views over recorded time. Entries are attributed to a project through their
// task; entries of deleted or project-less tasks fall under "No Project".
class Reports {
  public:
    Reports(const Ledger &ledger, const TaskBoard &board);

    TodayStats Today(Timestamp now, int goalMinutes) const;
    FocusSummary Summary() const;

    std::string ExportCsv() const;
    nlohmann::json ExportJson(Timestamp now) const;
    std::string MarkdownSummary(Timestamp now) const;

  private:
    std::string TaskTitle(const std::string &taskId) const;
    std::string ProjectName(const std::string &taskId) const;

    const Ledger &m_Ledger;
    const TaskBoard &m_Board;
};

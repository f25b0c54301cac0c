#pragma once

#include <string>
#include <vector>

#include "clock.hpp"

// A completed, recorded focus session. duration == endedAt - startedAt.
struct TimeEntry {
    std::string id;
    std::string taskId;
    Timestamp startedAt;
    Timestamp endedAt;
    Millis duration{0};
};

bool operator==(const TimeEntry &a, const TimeEntry &b);

std::string NewEntryId();

// Append-only history of focus sessions, in insertion order. Existing entries are never
// edited or reordered; the only removal is the per-task cascade used by task deletion.
class Ledger {
  public:
    Ledger() = default;
    explicit Ledger(std::vector<TimeEntry> entries);

    const TimeEntry &Append(TimeEntry entry);
    std::size_t RemoveEntriesForTask(const std::string &taskId);

    const std::vector<TimeEntry> &Entries() const {
        return m_Entries;
    }
    std::size_t Size() const {
        return m_Entries.size();
    }
    bool Empty() const {
        return m_Entries.empty();
    }

    Millis TotalForTask(const std::string &taskId) const;
    std::vector<TimeEntry> EntriesForTask(const std::string &taskId) const;

  private:
    std::vector<TimeEntry> m_Entries;
};

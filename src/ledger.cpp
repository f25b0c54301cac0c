#include "ledger.hpp"

#include <algorithm>
#include <iterator>
#include <random>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
bool operator==(const TimeEntry &a, const TimeEntry &b) {
    return a.id == b.id && a.taskId == b.taskId && a.startedAt == b.startedAt &&
           a.endedAt == b.endedAt && a.duration == b.duration;
}

// ─────────────────────────────────────
std::string NewEntryId() {
    // RFC 4122 version 4
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;
    unsigned long long hi = dist(rng);
    unsigned long long lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFFULL,
                       hi & 0xFFFFULL, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

// ─────────────────────────────────────
Ledger::Ledger(std::vector<TimeEntry> entries) : m_Entries(std::move(entries)) {
}

// ─────────────────────────────────────
const TimeEntry &Ledger::Append(TimeEntry entry) {
    if (entry.id.empty()) {
        entry.id = NewEntryId();
    }
    spdlog::info("Ledger: recorded {} ms for task '{}'", entry.duration.count(), entry.taskId);
    m_Entries.push_back(std::move(entry));
    return m_Entries.back();
}

// ─────────────────────────────────────
std::size_t Ledger::RemoveEntriesForTask(const std::string &taskId) {
    const auto before = m_Entries.size();
    m_Entries.erase(std::remove_if(m_Entries.begin(), m_Entries.end(),
                                   [&](const TimeEntry &e) { return e.taskId == taskId; }),
                    m_Entries.end());
    const auto removed = before - m_Entries.size();
    if (removed > 0) {
        spdlog::debug("Ledger: removed {} entries of deleted task '{}'", removed, taskId);
    }
    return removed;
}

// ─────────────────────────────────────
Millis Ledger::TotalForTask(const std::string &taskId) const {
    Millis total{0};
    for (const auto &e : m_Entries) {
        if (e.taskId == taskId) {
            total += e.duration;
        }
    }
    return total;
}

// ─────────────────────────────────────
std::vector<TimeEntry> Ledger::EntriesForTask(const std::string &taskId) const {
    std::vector<TimeEntry> out;
    std::copy_if(m_Entries.begin(), m_Entries.end(), std::back_inserter(out),
                 [&](const TimeEntry &e) { return e.taskId == taskId; });
    return out;
}

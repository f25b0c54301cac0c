#include "notice_queue.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Notice SessionCompletedNotice(const SessionCompleted &done, const TaskBoard &board) {
    Notice notice;
    if (!done.target) {
        notice.icon = "horizon-break";
        notice.summary = "Eye rest";
        notice.body = "Look at something 20 feet away for 20 seconds.";
        notice.lowUrgency = true;
        return notice;
    }

    const Task *task = board.FindTask(*done.target);
    const std::string &title = task ? task->title : *done.target;
    notice.icon = "horizon-done";
    notice.summary = "Focus session complete";
    notice.body =
        fmt::format("{} ({} today). Time for a break.", title, done.sessionsCompletedToday);
    return notice;
}

// ─────────────────────────────────────
Notice BreakCompletedNotice() {
    Notice notice;
    notice.icon = "horizon-focus";
    notice.summary = "Break over";
    notice.body = "Ready for the next session?";
    return notice;
}

// ─────────────────────────────────────
void NoticeQueue::Push(Notice notice) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    spdlog::debug("NoticeQueue: queued '{}'", notice.summary);
    m_Pending.push_back(std::move(notice));
}

// ─────────────────────────────────────
std::vector<Notice> NoticeQueue::TakeAll() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    std::vector<Notice> out;
    out.swap(m_Pending);
    return out;
}

// ─────────────────────────────────────
size_t NoticeQueue::Size() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Pending.size();
}

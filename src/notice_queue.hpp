#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "board.hpp"
#include "session.hpp"

// A desktop notification waiting to be sent.
struct Notice {
    std::string icon;
    std::string summary;
    std::string body;
    bool lowUrgency = false;
};

Notice SessionCompletedNotice(const SessionCompleted &done, const TaskBoard &board);
Notice BreakCompletedNotice();

// Signals fire while the engine lock is held; they are queued here and sent by the
// scheduler loop once the lock is released.
class NoticeQueue {
  public:
    void Push(Notice notice);
    std::vector<Notice> TakeAll();
    size_t Size() const;

  private:
    mutable std::mutex m_Mutex;
    std::vector<Notice> m_Pending;
};

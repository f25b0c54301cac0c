#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

// Libs
#include <httplib.h>
#include <spdlog/spdlog.h>

// parts
#include "clock.hpp"
#include "config.hpp"
#include "focus_controller.hpp"
#include "http_api.hpp"
#include "notice_queue.hpp"
#include "notification.hpp"
#include "sqlite.hpp"
#include "sync_bridge.hpp"

// One surface of the focus timer: the SQLite-backed shared state, the HTTP command API
// and the loop that completes phases on time.
class Horizon {
  public:
    explicit Horizon(const Config &config);
    ~Horizon();

    // Runs until `stop` is set or the server fails.
    void Run(const std::atomic<bool> &stop);

  private:
    bool InitServer();
    void SendPendingNotices();
    void WakeScheduler();
    void WaitUntilNextDeadline(const std::atomic<bool> &stop);

  private:
    const Config m_Config;
    std::mutex m_GlobalMutex;

    SystemClock m_Clock;
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<SyncBridge> m_Bridge;
    std::unique_ptr<FocusController> m_Controller;
    std::unique_ptr<Notification> m_Notification;
    NoticeQueue m_Notices;
    std::unique_ptr<FocusApi> m_Api;

    // Scheduler
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};

    std::thread m_Thread;
    httplib::Server m_Server;
};

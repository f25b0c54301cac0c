#include "horizon.hpp"

#include <algorithm>
#include <chrono>

// ─────────────────────────────────────
Horizon::Horizon(const Config &config) : m_Config(config) {
    if (config.logLevel == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (config.logLevel == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (config.logLevel == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    const bool mainSurface = m_Config.surface == Surface::Main;
    spdlog::info("Surface: {}", SurfaceName(m_Config.surface));
    spdlog::info("DataBase path: {}", m_Config.dbPath.string());

    // SQlite
    std::error_code ec;
    std::filesystem::create_directories(m_Config.dbPath.parent_path(), ec);
    if (ec) {
        spdlog::warn("Could not create {}: {}", m_Config.dbPath.parent_path().string(),
                     ec.message());
    }
    m_SQLite = std::make_unique<SQLite>(m_Config.dbPath.string());
    spdlog::info("SQLite database initialized");

    // Engine
    m_Bridge = std::make_unique<SyncBridge>(*m_SQLite, m_Config.blobKey);
    m_Controller = std::make_unique<FocusController>(m_Clock, m_Config.Durations(),
                                                     m_Bridge.get(), mainSurface);
    if (!m_Controller->Hydrate()) {
        spdlog::info("No stored state under '{}', starting fresh", m_Config.blobKey);
    }

    FocusListener listener;
    // Listeners run under m_GlobalMutex; D-Bus sends wait for the scheduler loop.
    listener.onSessionCompleted = [this](const SessionCompleted &done) {
        m_Notices.Push(SessionCompletedNotice(done, m_Controller->Board()));
        WakeScheduler();
    };
    listener.onBreakCompleted = [this](const BreakCompleted &) {
        m_Notices.Push(BreakCompletedNotice());
        WakeScheduler();
    };
    listener.onExternalChange = [] { spdlog::debug("State replaced by the other surface"); };
    m_Controller->SetListener(std::move(listener));

    // Notifications
    if (m_Config.notifications) {
        m_Notification = std::make_unique<Notification>();
        if (m_Notification->Available()) {
            spdlog::info("Notification system initialized");
        } else {
            spdlog::warn("No session bus; phase changes will only be logged");
        }
    }

    // Server
    m_Api = std::make_unique<FocusApi>(*m_Controller, m_GlobalMutex, m_Config.focusGoalMinutes,
                                       [this] { WakeScheduler(); });
    InitServer();
    spdlog::info("Serving on: http://127.0.0.1:{}", m_Config.Port());
}

// ─────────────────────────────────────
Horizon::~Horizon() {
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
bool Horizon::InitServer() {
    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);         // seconds
    m_Server.set_payload_max_length(64 * 1024); // 64 KB

    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);
    m_Server.set_idle_interval(1, 0);

    m_Api->Register(m_Server);

    const std::string host = "127.0.0.1";
    int port = static_cast<int>(m_Config.Port());
    m_Thread = std::thread([this, host, port] {
        if (!m_Server.listen(host, port) && !m_ShutdownRequested.load()) {
            spdlog::error("Could not listen on {}:{}", host, port);
            m_ShutdownRequested.store(true);
            WakeScheduler();
        }
    });
    return true;
}

// ─────────────────────────────────────
void Horizon::SendPendingNotices() {
    for (const Notice &notice : m_Notices.TakeAll()) {
        if (!m_Notification) {
            spdlog::info("{}: {}", notice.summary, notice.body);
            continue;
        }
        m_Notification->SendNotification(notice.icon, notice.summary, notice.body,
                                         notice.lowUrgency ? Notification::LOW
                                                           : Notification::NORMAL);
    }
}

// ─────────────────────────────────────
void Horizon::WakeScheduler() {
    m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    m_SchedulerCv.notify_one();
}

// ─────────────────────────────────────
void Horizon::WaitUntilNextDeadline(const std::atomic<bool> &stop) {
    const auto now = std::chrono::steady_clock::now();
    auto deadline = now + std::chrono::milliseconds(m_Config.tickMs);

    // Wake right at the end of a running phase instead of up to one tick late.
    {
        std::lock_guard<std::mutex> lock(m_GlobalMutex);
        const Session &s = m_Controller->CurrentSession();
        if (m_Controller->DrivesTimer() && s.phase != Phase::Idle && !s.paused) {
            const Millis remaining = m_Controller->Remaining();
            deadline = std::min(deadline, now + std::max(remaining, Millis(1)));
        }
    }

    const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    m_SchedulerCv.wait_until(lk, deadline, [&] {
        return stop.load() || m_ShutdownRequested.load() ||
               m_WakeupSeq.load(std::memory_order_relaxed) != seq;
    });
}

// ─────────────────────────────────────
void Horizon::Run(const std::atomic<bool> &stop) {
    while (!stop.load() && !m_ShutdownRequested.load()) {
        {
            std::lock_guard<std::mutex> lock(m_GlobalMutex);
            m_Controller->Tick();
        }
        SendPendingNotices();
        WaitUntilNextDeadline(stop);
    }
    m_ShutdownRequested.store(true);
    spdlog::info("Shutting down");
}

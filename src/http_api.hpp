#pragma once

#include <functional>
#include <mutex>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "focus_controller.hpp"

// JSON command and query endpoints of one surface under /api/v1. Every handler runs with
// `mutex` held; commands call `wake` afterwards so the main loop recomputes its deadline.
class FocusApi {
  public:
    FocusApi(FocusController &controller, std::mutex &mutex, int focusGoalMinutes,
             std::function<void()> wake = {});

    void Register(httplib::Server &server);

    nlohmann::json StateJson() const;

  private:
    void RegisterSession(httplib::Server &server);
    void RegisterTasks(httplib::Server &server);
    void RegisterReports(httplib::Server &server);
    void Command(httplib::Response &res, const char *name, const std::function<void()> &fn);
    void Wake();

  private:
    FocusController &m_Controller;
    std::mutex &m_Mutex;
    int m_FocusGoalMinutes;
    std::function<void()> m_Wake;
};

#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <string>

// Desktop notifications over org.freedesktop.Notifications. Without a session bus every
// send is a logged no-op.
class Notification {
  public:
    // org.freedesktop.Notifications urgency levels.
    enum Urgency : unsigned char { LOW = 0, NORMAL = 1, CRITICAL = 2 };

    explicit Notification(std::string appName = "Horizon");
    ~Notification();
    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool Available() const {
        return m_Conn != nullptr;
    }
    void SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg, Urgency urgency = NORMAL);

  private:
    DBusMessage *BuildNotify(const std::string &icon, const std::string &summary,
                             const std::string &msg, Urgency urgency) const;

    std::string m_AppName;
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;
    std::chrono::time_point<std::chrono::system_clock> m_LastNotification;
};

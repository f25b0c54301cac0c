#include "notification.hpp"

#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
// Two notifications closer than this are collapsed into the first.
constexpr std::chrono::milliseconds kMinInterval{3000};
constexpr int32_t kExpireTimeout = 5000; // ms
} // namespace

// ─────────────────────────────────────
Notification::Notification(std::string appName) : m_AppName(std::move(appName)) {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::error("Failed to connect to session bus: {}",
                      m_Err.message ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
DBusMessage *Notification::BuildNotify(const std::string &icon, const std::string &summary,
                                       const std::string &msg, Urgency urgency) const {
    DBusMessage *m = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                  "/org/freedesktop/Notifications",
                                                  "org.freedesktop.Notifications", "Notify");
    if (!m) {
        return nullptr;
    }

    // Notify(app_name, replaces_id, app_icon, summary, body, actions, hints, expire_timeout)
    const char *appName = m_AppName.c_str();
    const char *iconName = icon.c_str();
    const char *title = summary.c_str();
    const char *body = msg.c_str();
    uint32_t replacesId = 0;
    int32_t expire = kExpireTimeout;

    DBusMessageIter args;
    dbus_message_iter_init_append(m, &args);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &appName);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replacesId);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &iconName);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &title);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body);

    DBusMessageIter actions;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions);
    dbus_message_iter_close_container(&args, &actions);

    // hints: {"urgency": <byte>, "category": <"presence">}
    DBusMessageIter hints, entry, variant;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);

    const char *urgencyKey = "urgency";
    unsigned char level = urgency;
    dbus_message_iter_open_container(&hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &urgencyKey);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_BYTE_AS_STRING, &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BYTE, &level);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&hints, &entry);

    const char *categoryKey = "category";
    const char *category = "presence";
    dbus_message_iter_open_container(&hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &categoryKey);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_STRING_AS_STRING,
                                     &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &category);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&hints, &entry);

    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &expire);
    return m;
}

// ─────────────────────────────────────
void Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg, Urgency urgency) {
    if (!m_Conn) {
        spdlog::debug("Notification skipped, no session bus: {}", summary);
        return;
    }

    const auto now = std::chrono::system_clock::now();
    if (now - m_LastNotification < kMinInterval) {
        spdlog::debug("Notification '{}' skipped: rate limit", summary);
        return;
    }

    DBusMessage *notify = BuildNotify(icon, summary, msg, urgency);
    if (!notify) {
        spdlog::error("Failed to create DBus message");
        return;
    }

    const bool sent = dbus_connection_send(m_Conn, notify, nullptr);
    dbus_message_unref(notify);
    if (!sent) {
        spdlog::error("Failed to send notification '{}'", summary);
        return;
    }
    dbus_connection_flush(m_Conn);

    spdlog::debug("Notification sent: {}", summary);
    m_LastNotification = now;
}

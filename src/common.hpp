#pragma once

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

// The main view drives the timer; the companion widget mirrors it.
enum class Surface { Main, Widget };

inline const char *SurfaceName(Surface surface) {
    return surface == Surface::Widget ? "widget" : "main";
}

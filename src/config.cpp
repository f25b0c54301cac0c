#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::filesystem::path XdgDir(const char *variable, const char *fallback) {
    const char *xdg = std::getenv(variable);
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "horizon";
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        return std::filesystem::path();
    }
    return std::filesystem::path(home) / fallback / "horizon";
}

bool ParseUnsigned(const std::string &text, unsigned &out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        text.size() > 5) {
        return false;
    }
    const unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        return false;
    }
    out = static_cast<unsigned>(value);
    return true;
}

bool ParseSurface(const std::string &text, Surface &out) {
    if (text == "main") {
        out = Surface::Main;
        return true;
    }
    if (text == "widget") {
        out = Surface::Widget;
        return true;
    }
    return false;
}

void LoadConfigFile(const std::filesystem::path &path, bool required, Config &config) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            spdlog::warn("Config file {} does not exist, using defaults", path.string());
        }
        return;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Could not open config file {}", path.string());
        return;
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Config file {} is not a JSON object, ignoring it", path.string());
        return;
    }

    ApplyConfigJson(j, config);
    spdlog::debug("Loaded config from {}", path.string());
}

} // namespace

// ─────────────────────────────────────
unsigned Config::Port() const {
    if (port != 0) {
        return port;
    }
    return surface == Surface::Widget ? 8082 : 8081;
}

// ─────────────────────────────────────
SessionDurations Config::Durations() const {
    SessionDurations d;
    d.work = std::chrono::minutes(workMinutes);
    d.breakTime = std::chrono::minutes(breakMinutes);
    return d;
}

// ─────────────────────────────────────
std::filesystem::path DefaultDBPath() {
    const auto dir = XdgDir("XDG_DATA_HOME", ".local/share");
    return dir.empty() ? dir : dir / "horizon.db";
}

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    const auto dir = XdgDir("XDG_CONFIG_HOME", ".config");
    return dir.empty() ? dir : dir / "config.json";
}

// ─────────────────────────────────────
void ApplyConfigJson(const nlohmann::json &j, Config &config) {
    JsonParse parser;

    const std::string surface = parser.GetString(j, "surface", SurfaceName(config.surface));
    if (!ParseSurface(surface, config.surface)) {
        spdlog::warn("Config: unknown surface '{}', keeping '{}'", surface,
                     SurfaceName(config.surface));
    }

    const int port = parser.GetInt(j, "port", static_cast<int>(config.port));
    if (port >= 0 && port <= 65535) {
        config.port = static_cast<unsigned>(port);
    } else {
        spdlog::warn("Config: port {} out of range, ignoring it", port);
    }

    const std::string dbPath = parser.GetString(j, "db_path", config.dbPath.string());
    config.dbPath = dbPath;
    config.blobKey = parser.GetString(j, "blob_key", config.blobKey);
    if (config.blobKey.empty()) {
        spdlog::warn("Config: empty blob_key, using 'calendar-storage'");
        config.blobKey = "calendar-storage";
    }

    const int work = parser.GetInt(j, "work_minutes", config.workMinutes);
    if (work > 0) {
        config.workMinutes = work;
    } else {
        spdlog::warn("Config: work_minutes must be positive, keeping {}", config.workMinutes);
    }

    const int rest = parser.GetInt(j, "break_minutes", config.breakMinutes);
    if (rest > 0) {
        config.breakMinutes = rest;
    } else {
        spdlog::warn("Config: break_minutes must be positive, keeping {}", config.breakMinutes);
    }

    const int tick = parser.GetInt(j, "tick_ms", config.tickMs);
    if (tick >= 50) {
        config.tickMs = tick;
    } else {
        spdlog::warn("Config: tick_ms below 50 is not allowed, keeping {}", config.tickMs);
    }

    config.focusGoalMinutes =
        std::max(0, parser.GetInt(j, "focus_goal_minutes", config.focusGoalMinutes));
    config.notifications = parser.GetBool(j, "notifications", config.notifications);

    const std::string level = parser.GetString(j, "log_level", "");
    if (level == "debug") {
        config.logLevel = LOG_DEBUG;
    } else if (level == "info") {
        config.logLevel = LOG_INFO;
    } else if (level == "off") {
        config.logLevel = LOG_OFF;
    } else if (!level.empty()) {
        spdlog::warn("Config: unknown log_level '{}'", level);
    }
}

// ─────────────────────────────────────
bool LoadConfig(int argc, char **argv, Config &config, std::string &error) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    // The file is applied before the flags, so find it first.
    bool explicitConfig = false;
    config.configPath = DefaultConfigPath();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a path";
                return false;
            }
            config.configPath = args[i + 1];
            explicitConfig = true;
        }
    }

    config.dbPath = DefaultDBPath();
    if (!config.configPath.empty()) {
        LoadConfigFile(config.configPath, explicitConfig, config);
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        auto value = [&](std::string &out) {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string v;
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--debug") {
            config.logLevel = LOG_DEBUG;
        } else if (arg == "--quiet") {
            config.logLevel = LOG_OFF;
        } else if (arg == "--no-notify") {
            config.notifications = false;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--port") {
            if (!value(v)) {
                return false;
            }
            if (!ParseUnsigned(v, config.port)) {
                error = "invalid port '" + v + "'";
                return false;
            }
        } else if (arg == "--surface") {
            if (!value(v)) {
                return false;
            }
            if (!ParseSurface(v, config.surface)) {
                error = "unknown surface '" + v + "', expected main or widget";
                return false;
            }
        } else if (arg == "--db") {
            if (!value(v)) {
                return false;
            }
            config.dbPath = v;
        } else {
            error = "unknown argument '" + arg + "'";
            return false;
        }
    }

    if (config.dbPath.empty()) {
        error = "no database path: set HOME, XDG_DATA_HOME or pass --db";
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::string Usage(const char *program) {
    return std::string("Usage: ") + program +
           " [--surface main|widget] [--port N] [--db PATH] [--config PATH]"
           " [--no-notify] [--debug|--quiet]\n";
}

#pragma once

#include <filesystem>
#include <string>

#include "common.hpp"
#include "json.hpp"
#include "session.hpp"

struct Config {
    Surface surface = Surface::Main;
    unsigned port = 0; // 0: default port of the surface
    std::filesystem::path dbPath;
    std::filesystem::path configPath;
    std::string blobKey = "calendar-storage";
    int workMinutes = 25;
    int breakMinutes = 5;
    int tickMs = 500;
    int focusGoalMinutes = 0;
    bool notifications = true;
    LogLevel logLevel = LOG_INFO;
    bool showHelp = false;

    unsigned Port() const;
    SessionDurations Durations() const;
};

// Defaults, then the JSON config file, then command-line flags. Returns false with a
// message for unusable flags; problems inside the config file only produce warnings.
bool LoadConfig(int argc, char **argv, Config &config, std::string &error);

// Overlays the keys present in `j` onto `config`.
void ApplyConfigJson(const nlohmann::json &j, Config &config);

std::filesystem::path DefaultDBPath();
std::filesystem::path DefaultConfigPath();

std::string Usage(const char *program);

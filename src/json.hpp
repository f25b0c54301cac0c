#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Lenient accessors for data written by other surfaces: a missing or mistyped key yields
// the fallback and a log line, never an exception.
class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    std::int64_t GetInt64(const nlohmann::json &j, const std::string &key, std::int64_t fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    // null and missing both map to nullopt.
    std::optional<std::string> GetOptionalString(const nlohmann::json &j, const std::string &key);
    nlohmann::json GetArray(const nlohmann::json &j, const std::string &key);
};

#include "json.hpp"

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
template <typename T>
static std::optional<T> NumberInRange(const nlohmann::json &value) {
    using Limits = std::numeric_limits<T>;
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(Limits::max())) {
            return std::nullopt;
        }
        return static_cast<T>(v);
    }
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        if (v < static_cast<std::int64_t>(Limits::min()) ||
            v > static_cast<std::int64_t>(Limits::max())) {
            return std::nullopt;
        }
        return static_cast<T>(v);
    }
    // Doubles: compare against the limits as doubles, the upper bound exclusive since
    // max() of a 64-bit type rounds up to a power of two.
    const double d = value.get<double>();
    if (!std::isfinite(d) || d < static_cast<double>(Limits::min()) ||
        d >= static_cast<double>(Limits::max()) + 1.0) {
        return std::nullopt;
    }
    return static_cast<T>(d);
}

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
        return fallback;
    }
    const auto val = NumberInRange<int>(j.at(key));
    if (!val) {
        spdlog::warn("JsonParse: Key '{}' is out of range, using fallback {}", key, fallback);
        return fallback;
    }
    return *val;
}

// ─────────────────────────────────────
std::int64_t JsonParse::GetInt64(const nlohmann::json &j, const std::string &key,
                                 std::int64_t fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
        return fallback;
    }
    // JS numbers arrive as doubles once they pass through some serializers.
    const auto val = NumberInRange<std::int64_t>(j.at(key));
    if (!val) {
        spdlog::warn("JsonParse: Key '{}' is out of range, using fallback {}", key, fallback);
        return fallback;
    }
    return *val;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_boolean()) {
        return j.at(key).get<bool>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a boolean, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::optional<std::string> JsonParse::GetOptionalString(const nlohmann::json &j,
                                                        const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is neither string nor null, treating as null", key);
    return std::nullopt;
}

// ─────────────────────────────────────
nlohmann::json JsonParse::GetArray(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using empty array", key);
        return nlohmann::json::array();
    }
    if (j.at(key).is_array()) {
        return j.at(key);
    }
    spdlog::warn("JsonParse: Key '{}' is not an array, using empty array", key);
    return nlohmann::json::array();
}

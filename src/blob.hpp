#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "board.hpp"
#include "json.hpp"
#include "ledger.hpp"
#include "session.hpp"

// Everything one surface persists under the shared key.
struct FocusSnapshot {
    Session session;
    Ledger ledger;
    TaskBoard board;
    // Top-level keys owned by other parts of the UI, written back untouched.
    nlohmann::json extra = nlohmann::json::object();
};

// Blob layout:
//   { "tasks": [...], "projects": [...], "timeEntries": [...], "session": {...}, ... }
class BlobCodec {
  public:
    nlohmann::json ToJson(const FocusSnapshot &snapshot) const;
    std::string Encode(const FocusSnapshot &snapshot) const;

    // nullopt if the text is not a JSON object at all. Inside a valid object, broken
    // members degrade to defaults and broken entries are dropped.
    std::optional<FocusSnapshot> Decode(const std::string &text);
    std::optional<FocusSnapshot> FromJson(const nlohmann::json &j);

    nlohmann::json SessionToJson(const Session &session) const;
    nlohmann::json EntryToJson(const TimeEntry &entry) const;

  private:
    Session SessionFromJson(const nlohmann::json &j);
    std::optional<TimeEntry> EntryFromJson(const nlohmann::json &j);
    std::optional<Task> TaskFromJson(const nlohmann::json &j);
    std::optional<Project> ProjectFromJson(const nlohmann::json &j);

    JsonParse m_JsonParse;
};

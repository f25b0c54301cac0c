#pragma once

#include <sqlite3.h>

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "blob_store.hpp"

// Blob storage in a local SQLite database. Surfaces open their own connection to the same
// file; PRAGMA data_version tells a connection when another one has committed.
class SQLite : public BlobStore {
  public:
    SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    std::optional<std::string> Read(const std::string &key) override;
    bool Write(const std::string &key, const std::string &value, std::string &error) override;
    std::vector<std::string> PollChangedKeys() override;

  private:
    void Init();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);
    std::int64_t DataVersion();

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;

    sqlite3_stmt *m_ReadStmt = nullptr;
    sqlite3_stmt *m_WriteStmt = nullptr;
    sqlite3_stmt *m_RevisionsStmt = nullptr;
    sqlite3_stmt *m_DataVersionStmt = nullptr;

    std::int64_t m_DataVersion = -1;
    std::unordered_map<std::string, std::int64_t> m_Known;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};

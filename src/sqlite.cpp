#include "sqlite.hpp"

#include <ctime>
#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database");
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    // Both surfaces hit the same file; wait for the other writer instead of failing.
    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");
    ExecIgnoringErrors("PRAGMA mmap_size=0;");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    for (sqlite3_stmt **stmt : {&m_ReadStmt, &m_WriteStmt, &m_RevisionsStmt, &m_DataVersionStmt}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    // One row per shared blob. revision grows on every write and lets a connection tell
    // whether it has already seen the current value.
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS blobs ("
                       "key TEXT PRIMARY KEY,"
                       "value TEXT NOT NULL,"
                       "revision INTEGER NOT NULL DEFAULT 1,"
                       "updated_at REAL NOT NULL"
                       ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    {
        const char *sql = "SELECT value, revision FROM blobs WHERE key = ?";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_ReadStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Read stmt: {}", sqlite3_errmsg(m_Db));
            m_ReadStmt = nullptr;
        }
    }

    {
        const char *sql = R"(
            INSERT INTO blobs (key, value, revision, updated_at)
            VALUES (?, ?, 1, ?)
            ON CONFLICT(key) DO UPDATE SET
                value = excluded.value,
                revision = blobs.revision + 1,
                updated_at = excluded.updated_at
            RETURNING revision
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_WriteStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Write stmt: {}", sqlite3_errmsg(m_Db));
            m_WriteStmt = nullptr;
        }
    }

    {
        const char *sql = "SELECT key, revision FROM blobs";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_RevisionsStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Revisions stmt: {}", sqlite3_errmsg(m_Db));
            m_RevisionsStmt = nullptr;
        }
    }

    {
        const char *sql = "PRAGMA data_version";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_DataVersionStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for DataVersion stmt: {}", sqlite3_errmsg(m_Db));
            m_DataVersionStmt = nullptr;
        }
    }
}

// ─────────────────────────────────────
std::optional<std::string> SQLite::Read(const std::string &key) {
    if (!m_ReadStmt) {
        return std::nullopt;
    }

    sqlite3_reset(m_ReadStmt);
    sqlite3_clear_bindings(m_ReadStmt);
    sqlite3_bind_text(m_ReadStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    const int rc = sqlite3_step(m_ReadStmt);
    if (rc == SQLITE_ROW) {
        const char *text = reinterpret_cast<const char *>(sqlite3_column_text(m_ReadStmt, 0));
        value = text ? text : "";
        m_Known[key] = sqlite3_column_int64(m_ReadStmt, 1);
    } else if (rc != SQLITE_DONE) {
        spdlog::error("Read of '{}' failed: {}", key, sqlite3_errmsg(m_Db));
    }

    sqlite3_reset(m_ReadStmt);
    return value;
}

// ─────────────────────────────────────
bool SQLite::Write(const std::string &key, const std::string &value, std::string &error) {
    error.clear();
    if (!m_WriteStmt) {
        error = "write statement not prepared";
        return false;
    }

    sqlite3_reset(m_WriteStmt);
    sqlite3_clear_bindings(m_WriteStmt);
    sqlite3_bind_text(m_WriteStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_WriteStmt, 2, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_double(m_WriteStmt, 3, static_cast<double>(std::time(nullptr)));

    int rc = sqlite3_step(m_WriteStmt);
    if (rc == SQLITE_ROW) {
        m_Known[key] = sqlite3_column_int64(m_WriteStmt, 0);
        rc = sqlite3_step(m_WriteStmt);
    }
    sqlite3_reset(m_WriteStmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("Write of '{}' failed: {}", key, sqlite3_errmsg(m_Db));
        return false;
    }

    spdlog::debug("Wrote blob '{}' revision {} ({} bytes)", key, m_Known[key], value.size());
    return true;
}

// ─────────────────────────────────────
std::int64_t SQLite::DataVersion() {
    if (!m_DataVersionStmt) {
        return -1;
    }
    sqlite3_reset(m_DataVersionStmt);
    std::int64_t version = -1;
    if (sqlite3_step(m_DataVersionStmt) == SQLITE_ROW) {
        version = sqlite3_column_int64(m_DataVersionStmt, 0);
    }
    sqlite3_reset(m_DataVersionStmt);
    return version;
}

// ─────────────────────────────────────
std::vector<std::string> SQLite::PollChangedKeys() {
    std::vector<std::string> changed;

    // data_version only moves when another connection commits, so the common case of
    // nothing new costs one pragma.
    const std::int64_t version = DataVersion();
    if (version != -1 && version == m_DataVersion) {
        return changed;
    }
    m_DataVersion = version;

    if (!m_RevisionsStmt) {
        return changed;
    }

    sqlite3_reset(m_RevisionsStmt);
    while (sqlite3_step(m_RevisionsStmt) == SQLITE_ROW) {
        const char *key = reinterpret_cast<const char *>(sqlite3_column_text(m_RevisionsStmt, 0));
        if (!key) {
            continue;
        }
        const std::int64_t revision = sqlite3_column_int64(m_RevisionsStmt, 1);
        auto known = m_Known.find(key);
        if (known == m_Known.end() || known->second != revision) {
            changed.emplace_back(key);
        }
    }
    sqlite3_reset(m_RevisionsStmt);

    if (!changed.empty()) {
        spdlog::debug("{} blob(s) changed by another connection", changed.size());
    }
    return changed;
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}

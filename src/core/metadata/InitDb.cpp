// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

#include "core/Errors.hpp"

namespace zipcat {

static const char* kSchemaSql = R"SQL(
  CREATE TABLE IF NOT EXISTS archives (
    id            TEXT PRIMARY KEY,
    source_path   TEXT NOT NULL,
    volume        TEXT NOT NULL,
    size          INTEGER NOT NULL DEFAULT 0,
    content_hash  TEXT,
    modified_at   INTEGER NOT NULL DEFAULT 0,
    scanned_at    INTEGER NOT NULL DEFAULT 0,
    UNIQUE (source_path, volume)
  );

  CREATE TABLE IF NOT EXISTS entries (
    archive_id       TEXT NOT NULL REFERENCES archives(id) ON DELETE CASCADE,
    entry_path       TEXT NOT NULL,
    name             TEXT NOT NULL,
    size             INTEGER NOT NULL DEFAULT 0,
    compressed_size  INTEGER NOT NULL DEFAULT 0,
    modified_at      INTEGER NOT NULL DEFAULT 0,
    content_hash     TEXT,
    category         TEXT NOT NULL DEFAULT 'other',
    PRIMARY KEY (archive_id, entry_path)
  );

  CREATE INDEX IF NOT EXISTS idx_archives_volume ON archives(volume);
  CREATE INDEX IF NOT EXISTS idx_entries_name ON entries(name);
  CREATE INDEX IF NOT EXISTS idx_entries_hash ON entries(content_hash);
)SQL";

void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw CatalogError(ErrorCode::StoreFailure, "SQLite exec failed: " + msg);
    }
}

sqlite3* openCatalogDb(const std::string& dbPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw CatalogError(ErrorCode::StoreFailure, "Failed to open DB " + dbPath + ": " + msg);
    }

    try {
        // Pragmas: concurrency + durability + integrity
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA foreign_keys=ON;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        execAll(db, kSchemaSql);
        execAll(db, "PRAGMA user_version=1;");
        return db;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

bool initDatabase(const std::string& dbPath) {
    sqlite3_close(openCatalogDb(dbPath));
    return true;
}

} // namespace zipcat

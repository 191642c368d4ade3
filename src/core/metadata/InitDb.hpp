#pragma once
#include <string>

struct sqlite3;

namespace zipcat {

// Opens (creating if needed) a catalog database, applies pragmas and the
// schema. The caller owns the returned handle.
sqlite3* openCatalogDb(const std::string& dbPath);

// Creates the database file and schema, then closes it. Idempotent.
bool initDatabase(const std::string& dbPath);

void execAll(sqlite3* db, const std::string& sql);

} // namespace zipcat

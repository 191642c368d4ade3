#include "CatalogStore.hpp"

#include <chrono>
#include <regex>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/util/Ids.hpp"

namespace zipcat {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw CatalogError(ErrorCode::StoreFailure, what + ": " + sqlite3_errmsg(db));
}

// Owns one prepared statement.
struct Stmt {
  Stmt(sqlite3* db, const char* sql) : db(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) fail(db, "prepare failed");
  }
  ~Stmt() { sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void text(int i, const std::string& v) { sqlite3_bind_text(st, i, v.c_str(), -1, SQLITE_TRANSIENT); }
  void i64(int i, int64_t v) { sqlite3_bind_int64(st, i, v); }
  void optText(int i, const std::optional<std::string>& v) {
    if (v) text(i, *v); else sqlite3_bind_null(st, i);
  }

  bool row() {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail(db, "step failed");
  }
  void run(const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE) fail(db, what);
  }
  void reset() { sqlite3_reset(st); sqlite3_clear_bindings(st); }

  std::string colText(int c) const {
    const auto* p = sqlite3_column_text(st, c);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }
  std::optional<std::string> colOptText(int c) const {
    if (sqlite3_column_type(st, c) == SQLITE_NULL) return std::nullopt;
    return colText(c);
  }
  int64_t colI64(int c) const { return sqlite3_column_int64(st, c); }

  sqlite3* db;
  sqlite3_stmt* st = nullptr;
};

// Rolls back unless commit() was reached.
class Transaction {
public:
  Transaction(sqlite3* db, const char* begin = "BEGIN IMMEDIATE;") : db_(db) { execAll(db_, begin); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() { execAll(db_, "COMMIT;"); done_ = true; }

private:
  sqlite3* db_;
  bool done_ = false;
};

const char* kMatchColumns = R"SQL(
  a.id, a.source_path, a.volume, a.size, a.content_hash, a.modified_at, a.scanned_at,
  e.entry_path, e.name, e.size, e.compressed_size, e.modified_at, e.content_hash, e.category
)SQL";

ArchiveRecord readArchive(const Stmt& s, int c) {
  ArchiveRecord r;
  r.id           = s.colText(c + 0);
  r.source_path  = s.colText(c + 1);
  r.volume       = s.colText(c + 2);
  r.size         = s.colI64(c + 3);
  r.content_hash = s.colOptText(c + 4);
  r.modified_at  = s.colI64(c + 5);
  r.scanned_at   = s.colI64(c + 6);
  return r;
}

CatalogMatch readMatch(const Stmt& s) {
  CatalogMatch m;
  m.archive = readArchive(s, 0);
  m.entry.archive_id      = m.archive.id;
  m.entry.entry_path      = s.colText(7);
  m.entry.name            = s.colText(8);
  m.entry.size            = s.colI64(9);
  m.entry.compressed_size = s.colI64(10);
  m.entry.modified_at     = s.colI64(11);
  m.entry.content_hash    = s.colOptText(12);
  m.entry.category        = category_from_string(s.colText(13));
  return m;
}

// regexp(pattern, value): backs the REGEXP operator.
void regexpFunc(sqlite3_context* ctx, int, sqlite3_value** argv) {
  const auto* pat = sqlite3_value_text(argv[0]);
  const auto* val = sqlite3_value_text(argv[1]);
  if (!pat || !val) { sqlite3_result_int(ctx, 0); return; }

  const char* value = reinterpret_cast<const char*>(val);
  if (auto* cached = static_cast<std::regex*>(sqlite3_get_auxdata(ctx, 0))) {
    sqlite3_result_int(ctx, std::regex_search(value, *cached) ? 1 : 0);
    return;
  }

  std::unique_ptr<std::regex> re;
  try {
    re = std::make_unique<std::regex>(reinterpret_cast<const char*>(pat), std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    sqlite3_result_error(ctx, e.what(), -1);
    return;
  }
  const bool hit = std::regex_search(value, *re);
  sqlite3_set_auxdata(ctx, 0, re.release(), [](void* p) { delete static_cast<std::regex*>(p); });
  sqlite3_result_int(ctx, hit ? 1 : 0);
}

std::string likeEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '%';
  for (char c : s) {
    if (c == '%' || c == '_' || c == '\\') out += '\\';
    out += c;
  }
  out += '%';
  return out;
}

std::string sanitizeTag(const std::string& tag) {
  std::string out;
  for (char c : tag) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_';
    out += ok ? c : '_';
  }
  return out.empty() ? "store" : out;
}

} // namespace

CatalogStore::CatalogStore(const std::string& dbPath, bool isolated)
  : db_(nullptr), path_(dbPath), isolated_(isolated) {
  sqlite3* db = openCatalogDb(dbPath);
  if (sqlite3_create_function_v2(db, "regexp", 2, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                 regexpFunc, nullptr, nullptr, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_close(db);
    throw CatalogError(ErrorCode::StoreFailure, "register regexp failed: " + err);
  }
  db_ = db;
}

CatalogStore::~CatalogStore() {
  try {
    dispose();
  } catch (const std::exception& e) {
    spdlog::warn("closing catalog {} failed: {}", path_, e.what());
  }
}

std::unique_ptr<CatalogStore> CatalogStore::createIsolated(const std::filesystem::path& dir,
                                                           const std::string& tag) {
  std::filesystem::create_directories(dir);
  const auto file = dir / (sanitizeTag(tag) + "." + uuid4().substr(0, 8) + ".db.tmp");
  return std::make_unique<CatalogStore>(file.string(), true);
}

void* CatalogStore::handle() const {
  if (!db_) throw CatalogError(ErrorCode::StoreFailure, "catalog store is disposed: " + path_);
  return db_;
}

bool CatalogStore::disposed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return db_ == nullptr;
}

void CatalogStore::dispose() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!db_) return;
  auto* db = static_cast<sqlite3*>(db_);
  if (sqlite3_close(db) != SQLITE_OK) fail(db, "close failed");
  db_ = nullptr;

  if (isolated_) {
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
      std::error_code ec;
      std::filesystem::remove(path_ + suffix, ec);
      if (ec) spdlog::warn("could not remove {}{}: {}", path_, suffix, ec.message());
    }
  }
}

// -------- inserts --------

std::string CatalogStore::insertArchiveLocked(const ArchiveRecord& r) {
  auto* db = static_cast<sqlite3*>(handle());

  Stmt find(db, "SELECT id FROM archives WHERE source_path = ? AND volume = ?");
  find.text(1, r.source_path);
  find.text(2, r.volume);
  if (find.row()) {
    const std::string existing = find.colText(0);
    Stmt up(db, R"SQL(
      UPDATE archives
         SET size = ?, content_hash = COALESCE(?, content_hash), modified_at = ?, scanned_at = ?
       WHERE id = ?
    )SQL");
    int i = 1;
    up.i64(i++, r.size);
    up.optText(i++, r.content_hash);
    up.i64(i++, r.modified_at);
    up.i64(i++, r.scanned_at);
    up.text(i++, existing);
    up.run("update archive failed");
    return existing;
  }

  Stmt byId(db, "SELECT source_path, volume FROM archives WHERE id = ?");
  byId.text(1, r.id);
  if (byId.row()) {
    throw CatalogError(ErrorCode::MergeConflict,
                       "archive id " + r.id + " already belongs to " + byId.colText(0) +
                       " on " + byId.colText(1));
  }

  const char* sql = R"SQL(
    INSERT INTO archives (id, source_path, volume, size, content_hash, modified_at, scanned_at)
    VALUES (?,?,?,?,?,?,?)
  )SQL";
  Stmt st(db, sql);
  int i = 1;
  st.text(i++, r.id);
  st.text(i++, r.source_path);
  st.text(i++, r.volume);
  st.i64(i++, r.size);
  st.optText(i++, r.content_hash);
  st.i64(i++, r.modified_at);
  st.i64(i++, r.scanned_at);
  st.run("insertArchive failed");
  return r.id;
}

void CatalogStore::insertEntriesLocked(const std::string& archiveId,
                                       const std::vector<EntryRecord>& entries) {
  auto* db = static_cast<sqlite3*>(handle());
  const char* sql = R"SQL(
    INSERT INTO entries
      (archive_id, entry_path, name, size, compressed_size, modified_at, content_hash, category)
    VALUES (?,?,?,?,?,?,?,?)
    ON CONFLICT (archive_id, entry_path) DO UPDATE SET
      name = excluded.name,
      size = excluded.size,
      compressed_size = excluded.compressed_size,
      modified_at = excluded.modified_at,
      content_hash = COALESCE(excluded.content_hash, entries.content_hash),
      category = excluded.category
  )SQL";
  Stmt st(db, sql);
  for (const auto& e : entries) {
    int i = 1;
    st.text(i++, archiveId);
    st.text(i++, e.entry_path);
    st.text(i++, e.name);
    st.i64(i++, e.size);
    st.i64(i++, e.compressed_size);
    st.i64(i++, e.modified_at);
    st.optText(i++, e.content_hash);
    st.text(i++, to_string(e.category));
    st.run("insertEntries failed");
    st.reset();
  }
}

std::string CatalogStore::insertArchive(const ArchiveRecord& r) {
  std::lock_guard<std::mutex> lk(mu_);
  Transaction tx(static_cast<sqlite3*>(handle()));
  auto id = insertArchiveLocked(r);
  tx.commit();
  return id;
}

void CatalogStore::insertEntries(const std::string& archiveId, const std::vector<EntryRecord>& entries) {
  std::lock_guard<std::mutex> lk(mu_);
  Transaction tx(static_cast<sqlite3*>(handle()));
  insertEntriesLocked(archiveId, entries);
  tx.commit();
}

std::string CatalogStore::insertProbe(const ArchiveRecord& r, const std::vector<EntryRecord>& entries) {
  std::lock_guard<std::mutex> lk(mu_);
  Transaction tx(static_cast<sqlite3*>(handle()));
  auto id = insertArchiveLocked(r);
  insertEntriesLocked(id, entries);
  tx.commit();
  return id;
}

// -------- merge --------

MergeSummary CatalogStore::mergeFrom(CatalogStore& other) {
  if (&other == this) throw CatalogError(ErrorCode::MergeConflict, "cannot merge a store into itself");
  const auto t0 = std::chrono::steady_clock::now();

  {
    // Fold the source WAL into its main file so the attached copy is complete.
    std::lock_guard<std::mutex> olk(other.mu_);
    execAll(static_cast<sqlite3*>(other.handle()), "PRAGMA wal_checkpoint(TRUNCATE);");
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(handle());

  {
    Stmt at(db, "ATTACH DATABASE ? AS src");
    at.text(1, other.path());
    at.run("attach failed");
  }

  MergeSummary sum;
  try {
    Transaction tx(db);

    Stmt clash(db, R"SQL(
      SELECT s.id, s.source_path, s.volume, m.source_path, m.volume
        FROM src.archives s JOIN main.archives m ON m.id = s.id
       WHERE m.source_path <> s.source_path OR m.volume <> s.volume
       LIMIT 1
    )SQL");
    if (clash.row()) {
      throw CatalogError(ErrorCode::MergeConflict,
                         "archive id " + clash.colText(0) + " (" + clash.colText(1) + " on " +
                         clash.colText(2) + ") already belongs to " + clash.colText(3) + " on " +
                         clash.colText(4));
    }

    auto count = [&](const char* sql) {
      Stmt s(db, sql);
      return s.row() ? s.colI64(0) : int64_t{0};
    };
    const int64_t archives = count("SELECT COUNT(*) FROM src.archives");
    const int64_t entries  = count("SELECT COUNT(*) FROM src.entries");
    sum.archives_skipped = count(R"SQL(
      SELECT COUNT(*) FROM src.archives s
        JOIN main.archives m ON m.source_path = s.source_path AND m.volume = s.volume
    )SQL");
    sum.entries_skipped = count(R"SQL(
      SELECT COUNT(*) FROM src.entries e
        JOIN src.archives s ON s.id = e.archive_id
        JOIN main.archives m ON m.source_path = s.source_path AND m.volume = s.volume
        JOIN main.entries me ON me.archive_id = m.id AND me.entry_path = e.entry_path
    )SQL");

    // Archives first: entries reference them.
    execAll(db, R"SQL(
      UPDATE main.archives AS m
         SET size = s.size,
             content_hash = COALESCE(s.content_hash, m.content_hash),
             modified_at = s.modified_at,
             scanned_at = s.scanned_at
        FROM src.archives s
       WHERE m.source_path = s.source_path AND m.volume = s.volume;

      INSERT INTO main.archives (id, source_path, volume, size, content_hash, modified_at, scanned_at)
      SELECT s.id, s.source_path, s.volume, s.size, s.content_hash, s.modified_at, s.scanned_at
        FROM src.archives s
       WHERE NOT EXISTS (SELECT 1 FROM main.archives m
                          WHERE m.source_path = s.source_path AND m.volume = s.volume);
    )SQL");

    // Entries are keyed onto whichever id now holds their (source_path, volume).
    execAll(db, R"SQL(
      UPDATE main.entries AS me
         SET name = e.name,
             size = e.size,
             compressed_size = e.compressed_size,
             modified_at = e.modified_at,
             content_hash = COALESCE(e.content_hash, me.content_hash),
             category = e.category
        FROM src.entries e
        JOIN src.archives s ON s.id = e.archive_id
        JOIN main.archives m ON m.source_path = s.source_path AND m.volume = s.volume
       WHERE me.archive_id = m.id AND me.entry_path = e.entry_path;

      INSERT INTO main.entries
        (archive_id, entry_path, name, size, compressed_size, modified_at, content_hash, category)
      SELECT m.id, e.entry_path, e.name, e.size, e.compressed_size, e.modified_at, e.content_hash, e.category
        FROM src.entries e
        JOIN src.archives s ON s.id = e.archive_id
        JOIN main.archives m ON m.source_path = s.source_path AND m.volume = s.volume
       WHERE NOT EXISTS (SELECT 1 FROM main.entries x
                          WHERE x.archive_id = m.id AND x.entry_path = e.entry_path);
    )SQL");

    tx.commit();
    sum.archives_merged = archives - sum.archives_skipped;
    sum.entries_merged  = entries - sum.entries_skipped;
  } catch (...) {
    sqlite3_exec(db, "DETACH DATABASE src;", nullptr, nullptr, nullptr);
    throw;
  }
  execAll(db, "DETACH DATABASE src;");

  sum.elapsed_seconds =
    std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  return sum;
}

// -------- queries --------

std::vector<CatalogMatch> CatalogStore::query(const QueryFilter& f) const {
  if (f.regex) {
    try {
      std::regex check(*f.regex, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw CatalogError(ErrorCode::InvalidQuery, "invalid regular expression '" + *f.regex + "': " + e.what());
    }
  }
  if (f.min_size && f.max_size && *f.min_size > *f.max_size) {
    throw CatalogError(ErrorCode::InvalidQuery, "min_size is greater than max_size");
  }

  std::string sql = std::string("SELECT ") + kMatchColumns +
                    " FROM entries e JOIN archives a ON a.id = e.archive_id WHERE 1=1";
  if (f.name)       sql += " AND e.entry_path LIKE ? ESCAPE '\\'";
  if (f.regex)      sql += " AND e.entry_path REGEXP ?";
  if (f.min_size)   sql += " AND e.size >= ?";
  if (f.max_size)   sql += " AND e.size <= ?";
  if (f.archive_id) sql += " AND a.id = ?";
  if (!f.categories.empty()) {
    sql += " AND e.category IN (";
    for (size_t i = 0; i < f.categories.size(); ++i) sql += i ? ",?" : "?";
    sql += ")";
  }
  sql += " ORDER BY a.source_path, a.volume, a.id, e.entry_path";
  if (f.limit) sql += " LIMIT ?";

  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), sql.c_str());
  int i = 1;
  if (f.name)       st.text(i++, likeEscape(*f.name));
  if (f.regex)      st.text(i++, *f.regex);
  if (f.min_size)   st.i64(i++, *f.min_size);
  if (f.max_size)   st.i64(i++, *f.max_size);
  if (f.archive_id) st.text(i++, *f.archive_id);
  for (auto c : f.categories) st.text(i++, to_string(c));
  if (f.limit)      st.i64(i++, *f.limit);

  std::vector<CatalogMatch> out;
  while (st.row()) out.push_back(readMatch(st));
  return out;
}

std::optional<ArchiveRecord> CatalogStore::archive(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), R"SQL(
    SELECT id, source_path, volume, size, content_hash, modified_at, scanned_at
      FROM archives WHERE id = ?
  )SQL");
  st.text(1, id);
  if (!st.row()) return std::nullopt;
  return readArchive(st, 0);
}

std::vector<ArchiveListing> CatalogStore::listArchives(std::optional<int64_t> limit) const {
  std::string sql = R"SQL(
    SELECT a.id, a.source_path, a.volume, a.size, a.content_hash, a.modified_at, a.scanned_at,
           (SELECT COUNT(*) FROM entries e WHERE e.archive_id = a.id)
      FROM archives a
     ORDER BY a.source_path, a.volume, a.id
  )SQL";
  if (limit) sql += " LIMIT ?";

  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), sql.c_str());
  if (limit) st.i64(1, *limit);
  std::vector<ArchiveListing> out;
  while (st.row()) out.push_back({readArchive(st, 0), st.colI64(7)});
  return out;
}

CatalogStats CatalogStore::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), R"SQL(
    SELECT (SELECT COUNT(DISTINCT volume) FROM archives),
           (SELECT COUNT(*) FROM archives),
           (SELECT COUNT(*) FROM entries),
           (SELECT COALESCE(SUM(size), 0) FROM entries)
  )SQL");
  CatalogStats s;
  if (st.row()) {
    s.volumes = st.colI64(0);
    s.archives = st.colI64(1);
    s.entries = st.colI64(2);
    s.total_bytes = st.colI64(3);
  }
  return s;
}

std::vector<VolumeStats> CatalogStore::volumeStats() const {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), R"SQL(
    SELECT a.volume, COUNT(DISTINCT a.id), COUNT(e.archive_id), COALESCE(SUM(e.size), 0)
      FROM archives a LEFT JOIN entries e ON e.archive_id = a.id
     GROUP BY a.volume
     ORDER BY a.volume
  )SQL");
  std::vector<VolumeStats> out;
  while (st.row()) {
    VolumeStats v;
    v.volume = st.colText(0);
    v.archives = st.colI64(1);
    v.entries = st.colI64(2);
    v.total_bytes = st.colI64(3);
    out.push_back(std::move(v));
  }
  return out;
}

std::vector<DuplicateGroup> CatalogStore::duplicateEntries() const {
  const std::string sql = std::string("SELECT ") + kMatchColumns + R"SQL(
      FROM entries e JOIN archives a ON a.id = e.archive_id
     WHERE e.content_hash IN (SELECT content_hash FROM entries
                               WHERE content_hash IS NOT NULL
                               GROUP BY content_hash HAVING COUNT(*) > 1)
     ORDER BY e.content_hash, a.source_path, a.volume, e.entry_path
  )SQL";

  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(handle()), sql.c_str());
  std::vector<DuplicateGroup> out;
  while (st.row()) {
    auto m = readMatch(st);
    if (out.empty() || out.back().content_hash != *m.entry.content_hash) {
      out.push_back({*m.entry.content_hash, m.entry.size, {}});
    }
    out.back().members.push_back(std::move(m));
  }
  return out;
}

} // namespace zipcat

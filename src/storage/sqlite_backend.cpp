#include "model_cache/sqlite_backend.hpp"

#include <limits>
#include <string>

#include <sqlite3.h>

namespace model_cache {
namespace {

const char *kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS models (
  id               TEXT PRIMARY KEY,
  payload          BLOB NOT NULL,
  size             INTEGER NOT NULL,
  created_at_ms    INTEGER NOT NULL,
  last_accessed_ms INTEGER NOT NULL,
  version          TEXT NOT NULL,
  checksum         TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_models_created_at ON models(created_at_ms);
CREATE INDEX IF NOT EXISTS idx_models_last_accessed
  ON models(last_accessed_ms, created_at_ms, id);
)SQL";

constexpr const char *kMetaColumns =
    "id, size, created_at_ms, last_accessed_ms, version, checksum";

// Finalizes the statement on every return path.
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
  sqlite3_stmt *get() const { return stmt_; }

  int bind_text(int idx, const std::string &s) {
    return sqlite3_bind_text64(stmt_, idx, s.data(),
                               static_cast<sqlite3_uint64>(s.size()),
                               SQLITE_TRANSIENT, SQLITE_UTF8);
  }
  int bind_i64(int idx, std::int64_t v) {
    return sqlite3_bind_int64(stmt_, idx, v);
  }
  int bind_blob(int idx, const std::vector<std::uint8_t> &b) {
    // A zero-length blob still binds as a blob, never as NULL.
    if (b.empty())
      return sqlite3_bind_zeroblob(stmt_, idx, 0);
    return sqlite3_bind_blob64(stmt_, idx, b.data(),
                               static_cast<sqlite3_uint64>(b.size()),
                               SQLITE_TRANSIENT);
  }

private:
  sqlite3_stmt *stmt_{nullptr};
  int rc_{SQLITE_ERROR};
};

std::string column_text(sqlite3_stmt *s, int col) {
  const auto *p = sqlite3_column_text(s, col);
  const int n = sqlite3_column_bytes(s, col);
  if (!p)
    return {};
  return std::string(reinterpret_cast<const char *>(p),
                     static_cast<std::size_t>(n));
}

ModelMeta read_meta(sqlite3_stmt *s) {
  ModelMeta m;
  m.id = column_text(s, 0);
  m.size_bytes = static_cast<std::size_t>(sqlite3_column_int64(s, 1));
  m.created_at = from_epoch_ms(sqlite3_column_int64(s, 2));
  m.last_accessed = from_epoch_ms(sqlite3_column_int64(s, 3));
  m.version = column_text(s, 4);
  m.checksum = column_text(s, 5);
  return m;
}

} // namespace

SqliteBackend::SqliteBackend(std::string db_path) : path_(std::move(db_path)) {}

SqliteBackend::~SqliteBackend() {
  if (db_)
    sqlite3_close(db_);
}

bool SqliteBackend::open(std::string *err) {
  if (db_)
    return true;
  const int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    if (err)
      *err = "sqlite open failed: " + last_error();
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return false;
  }
  sqlite3_busy_timeout(db_, 5000);
  if (!exec("PRAGMA journal_mode=WAL;", err) ||
      !exec("PRAGMA synchronous=NORMAL;", err) || !exec(kSchemaSql, err)) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

std::size_t SqliteBackend::limit_value_size(std::size_t max_bytes) {
  if (!db_)
    return 0;
  constexpr auto kIntMax = std::numeric_limits<int>::max();
  const int cap = max_bytes > static_cast<std::size_t>(kIntMax)
                      ? kIntMax
                      : static_cast<int>(max_bytes);
  return static_cast<std::size_t>(
      sqlite3_limit(db_, SQLITE_LIMIT_LENGTH, cap));
}

bool SqliteBackend::put(const CacheEntry &entry, std::string *err) {
  if (!db_) {
    if (err)
      *err = "database not open";
    return false;
  }
  Statement st(db_, "INSERT OR REPLACE INTO models(id, payload, size, "
                    "created_at_ms, last_accessed_ms, version, checksum) "
                    "VALUES(?, ?, ?, ?, ?, ?, ?);");
  if (!st.ok()) {
    if (err)
      *err = "prepare put: " + last_error();
    return false;
  }
  const auto &m = entry.meta;
  if (m.size_bytes != entry.payload.size()) {
    if (err)
      *err = "size does not match payload for " + m.id;
    return false;
  }
  if (st.bind_blob(2, entry.payload) != SQLITE_OK) {
    if (err)
      *err = "bind payload for " + m.id + ": " + last_error();
    return false;
  }
  if (st.bind_text(1, m.id) != SQLITE_OK ||
      st.bind_i64(3, static_cast<std::int64_t>(m.size_bytes)) != SQLITE_OK ||
      st.bind_i64(4, to_epoch_ms(m.created_at)) != SQLITE_OK ||
      st.bind_i64(5, to_epoch_ms(m.last_accessed)) != SQLITE_OK ||
      st.bind_text(6, m.version) != SQLITE_OK ||
      st.bind_text(7, m.checksum) != SQLITE_OK) {
    if (err)
      *err = "bind " + m.id + ": " + last_error();
    return false;
  }
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    if (err)
      *err = "put " + m.id + ": " + last_error();
    return false;
  }
  return true;
}

std::optional<CacheEntry> SqliteBackend::get(const std::string &id,
                                             std::string *err) {
  if (!db_) {
    if (err)
      *err = "database not open";
    return std::nullopt;
  }
  Statement st(db_, std::string("SELECT ") + kMetaColumns +
                        ", payload FROM models WHERE id = ?;");
  if (!st.ok()) {
    if (err)
      *err = "prepare get: " + last_error();
    return std::nullopt;
  }
  if (st.bind_text(1, id) != SQLITE_OK) {
    if (err)
      *err = "bind " + id + ": " + last_error();
    return std::nullopt;
  }
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE)
    return std::nullopt;
  if (rc != SQLITE_ROW) {
    if (err)
      *err = "get " + id + ": " + last_error();
    return std::nullopt;
  }
  CacheEntry e;
  e.meta = read_meta(st.get());
  const auto *blob =
      static_cast<const std::uint8_t *>(sqlite3_column_blob(st.get(), 6));
  const int n = sqlite3_column_bytes(st.get(), 6);
  if (blob && n > 0)
    e.payload.assign(blob, blob + n);
  if (e.payload.size() != e.meta.size_bytes) {
    if (err)
      *err = "stored payload of " + id + " is " +
             std::to_string(e.payload.size()) + " bytes, expected " +
             std::to_string(e.meta.size_bytes);
    return std::nullopt;
  }
  return e;
}

std::optional<ModelMeta> SqliteBackend::stat(const std::string &id,
                                             std::string *err) {
  if (!db_) {
    if (err)
      *err = "database not open";
    return std::nullopt;
  }
  Statement st(db_, std::string("SELECT ") + kMetaColumns +
                        " FROM models WHERE id = ?;");
  if (!st.ok()) {
    if (err)
      *err = "prepare stat: " + last_error();
    return std::nullopt;
  }
  if (st.bind_text(1, id) != SQLITE_OK) {
    if (err)
      *err = "bind " + id + ": " + last_error();
    return std::nullopt;
  }
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE)
    return std::nullopt;
  if (rc != SQLITE_ROW) {
    if (err)
      *err = "stat " + id + ": " + last_error();
    return std::nullopt;
  }
  return read_meta(st.get());
}

bool SqliteBackend::remove(const std::string &id, std::string *err) {
  if (!db_) {
    if (err)
      *err = "database not open";
    return false;
  }
  Statement st(db_, "DELETE FROM models WHERE id = ?;");
  if (!st.ok()) {
    if (err)
      *err = "prepare remove: " + last_error();
    return false;
  }
  if (st.bind_text(1, id) != SQLITE_OK) {
    if (err)
      *err = "bind " + id + ": " + last_error();
    return false;
  }
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    if (err)
      *err = "remove " + id + ": " + last_error();
    return false;
  }
  return true;
}

bool SqliteBackend::touch(const std::string &id, TimePoint at,
                          std::string *err) {
  if (!db_) {
    if (err)
      *err = "database not open";
    return false;
  }
  Statement st(db_, "UPDATE models SET last_accessed_ms = ? WHERE id = ?;");
  if (!st.ok()) {
    if (err)
      *err = "prepare touch: " + last_error();
    return false;
  }
  if (st.bind_i64(1, to_epoch_ms(at)) != SQLITE_OK ||
      st.bind_text(2, id) != SQLITE_OK) {
    if (err)
      *err = "bind " + id + ": " + last_error();
    return false;
  }
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    if (err)
      *err = "touch " + id + ": " + last_error();
    return false;
  }
  return sqlite3_changes(db_) > 0;
}

bool SqliteBackend::list_all(std::vector<ModelMeta> *out, std::string *err) {
  out->clear();
  if (!db_) {
    if (err)
      *err = "database not open";
    return false;
  }
  Statement st(db_, std::string("SELECT ") + kMetaColumns +
                        " FROM models ORDER BY last_accessed_ms ASC, "
                        "created_at_ms ASC, id ASC;");
  if (!st.ok()) {
    if (err)
      *err = "prepare list: " + last_error();
    return false;
  }
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW)
    out->push_back(read_meta(st.get()));
  if (rc != SQLITE_DONE) {
    if (err)
      *err = "list: " + last_error();
    return false;
  }
  return true;
}

bool SqliteBackend::exec(const char *sql, std::string *err) {
  char *msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
    if (err)
      *err = std::string("sqlite exec: ") + (msg ? msg : "unknown");
    if (msg)
      sqlite3_free(msg);
    return false;
  }
  return true;
}

bool SqliteBackend::scan_lru(std::size_t bytes, const std::string &exclude,
                             std::vector<ModelMeta> *out, std::string *err) {
  out->clear();
  if (!db_) {
    if (err)
      *err = "database not open";
    return false;
  }
  if (bytes == 0)
    return true;
  Statement st(db_, std::string("SELECT ") + kMetaColumns +
                        " FROM models INDEXED BY idx_models_last_accessed "
                        "ORDER BY last_accessed_ms ASC, created_at_ms ASC, "
                        "id ASC;");
  if (!st.ok()) {
    if (err)
      *err = "prepare scan: " + last_error();
    return false;
  }
  std::size_t covered = 0;
  int rc = SQLITE_ROW;
  while (covered < bytes && (rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    ModelMeta m = read_meta(st.get());
    if (m.id == exclude)
      continue;
    covered += m.size_bytes;
    out->push_back(std::move(m));
  }
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    if (err)
      *err = "scan: " + last_error();
    return false;
  }
  return true;
}

std::string SqliteBackend::last_error() const {
  return db_ ? sqlite3_errmsg(db_) : "no database handle";
}

} // namespace model_cache

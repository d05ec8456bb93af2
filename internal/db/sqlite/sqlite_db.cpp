#include "sqlite_db.hpp"

#include <stdexcept>

namespace waveq::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

Statement::Statement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  ThrowIf(sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr), db, "sqlite prepare");
  stmt_.reset(raw);
}

void Statement::BindText(int idx, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindInt(int idx, int value) {
  sqlite3_bind_int(stmt_.get(), idx, value);
}

void Statement::BindInt64(int idx, uint64_t value) {
  sqlite3_bind_int64(stmt_.get(), idx, static_cast<sqlite3_int64>(value));
}

int Statement::Step() {
  return sqlite3_step(stmt_.get());
}

std::string Statement::Text(int col) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

int Statement::Int(int col) const {
  return sqlite3_column_int(stmt_.get(), col);
}

uint64_t Statement::Int64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_.get(), col));
}

SqliteDB::SqliteDB(std::string path, bool wal_mode, int busy_timeout_ms) : path_(std::move(path)), wal_mode_(wal_mode) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::UserVersion() {
  Statement st(db_, "PRAGMA user_version;");
  return st.Step() == SQLITE_ROW ? st.Int(0) : 0;
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // ":memory:" databases ignore WAL.
  if (wal_mode_) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // Request rows are small and rewritten on every transition.
  Exec("PRAGMA synchronous=NORMAL;");
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace waveq::db::sqlite

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace waveq::db::sqlite {

/*
  RAII prepared statement. Finalized on destruction, so a row decoder that
  throws halfway through a result set does not leak the statement.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) noexcept        = default;
  Statement& operator=(Statement&&) noexcept = default;

  void BindText(int idx, const std::string& value);
  void BindInt(int idx, int value);
  void BindInt64(int idx, uint64_t value);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  std::string Text(int col) const;
  int         Int(int col) const;
  uint64_t    Int64(int col) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* st) const {
      sqlite3_finalize(st);
    }
  };

  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

/*
  Owns the sqlite3 connection for the request database.

  The connection is opened in serialized mode and shared between the
  repository and its transactions.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema statements)
  void Exec(const std::string& sql);

  // PRAGMA user_version, used as the schema version.
  int  UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_;
};

} // namespace waveq::db::sqlite

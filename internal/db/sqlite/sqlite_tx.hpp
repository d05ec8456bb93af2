#pragma once

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace waveq::db::sqlite {

/*
  BEGIN IMMEDIATE transaction over the shared connection.

  The write lock is taken up front: every request-store operation that opens
  a transaction may write, and a deferred upgrade would surface as SQLITE_BUSY
  in the middle of a state transition.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_.Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  SqliteDB& db_;
  State     state_ = State::kOpen;
};

}

#pragma once

namespace waveq::db {

/*
  Unit of work against the request repository.

  Every backend guarantees:
  - writes are invisible to other transactions until Commit()
  - Rollback() discards the writes; the destructor rolls back when neither
    Commit() nor Rollback() ran
  - Commit() on a finished transaction throws std::logic_error

  SQLite: BEGIN IMMEDIATE on the shared connection
  Memory: immutable snapshot, cloned on first write
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
  virtual bool IsCommitted() const = 0;
};

}

#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace waveq::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    WAVEQ_LOG_WARN("sqlite rollback failed", {waveq::observability::StringField("db", db_.Path()),
                                             waveq::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("sqlite transaction already finished");
  db_.Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  db_.Exec("ROLLBACK;");
}

} // namespace waveq::db::sqlite

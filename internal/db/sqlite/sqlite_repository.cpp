#include "sqlite_repository.hpp"

#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "waveq/engine/v1/types.pb.h"

namespace waveq::db::sqlite {

using waveq::db::ErrorCode;
using waveq::db::Result;
using namespace waveq::engine::v1;

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSelectColumns =
    "SELECT id,seq,client_id,payload_json,priority,status,created_at_ms,updated_at_ms,result_ref,error_json,"
    "instruction,description,processing_ms FROM edit_request";

// sources + operations travel as one EditRequest JSON document.
std::string EncodePayload(const model::RequestRecord& r) {
  EditRequest doc;
  for (const auto& source : r.sources) doc.add_sources(source);
  for (const auto& op : r.operations) *doc.add_operations() = op;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(doc, &json);
  if (!status.ok()) throw std::runtime_error("encode request payload: " + std::string(status.message()));
  return json;
}

void DecodePayload(const std::string& json, model::RequestRecord* r) {
  EditRequest doc;
  auto        status = google::protobuf::util::JsonStringToMessage(json, &doc);
  if (!status.ok()) throw std::runtime_error("decode request payload: " + std::string(status.message()));
  r->sources.assign(doc.sources().begin(), doc.sources().end());
  r->operations.assign(doc.operations().begin(), doc.operations().end());
}

std::string EncodeError(const std::optional<RequestError>& error) {
  if (!error) return {};
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(*error, &json);
  if (!status.ok()) throw std::runtime_error("encode request error: " + std::string(status.message()));
  return json;
}

std::optional<RequestError> DecodeError(const std::string& json) {
  if (json.empty()) return std::nullopt;
  RequestError error;
  auto         status = google::protobuf::util::JsonStringToMessage(json, &error);
  if (!status.ok()) throw std::runtime_error("decode request error: " + std::string(status.message()));
  return error;
}

model::RequestRecord ReadRow(const Statement& st) {
  model::RequestRecord r;
  r.id        = st.Text(0);
  r.sequence  = st.Int64(1);
  r.client_id = st.Text(2);
  DecodePayload(st.Text(3), &r);
  r.priority      = st.Int(4);
  r.status        = static_cast<RequestStatus>(st.Int(5));
  r.created_at_ms = st.Int64(6);
  r.updated_at_ms = st.Int64(7);
  r.result_ref    = st.Text(8);
  r.error         = DecodeError(st.Text(9));
  r.instruction   = st.Text(10);
  r.description   = st.Text(11);
  r.processing_ms = st.Int64(12);
  return r;
}

// Columns 3..12 of an INSERT, 2..11 of an UPDATE; the caller binds the rest.
int BindMutableColumns(Statement& st, int idx, const model::RequestRecord& r) {
  st.BindText(idx++, r.client_id);
  st.BindText(idx++, EncodePayload(r));
  st.BindInt(idx++, r.priority);
  st.BindInt(idx++, static_cast<int>(r.status));
  st.BindInt64(idx++, r.created_at_ms);
  st.BindInt64(idx++, r.updated_at_ms);
  st.BindText(idx++, r.result_ref);
  st.BindText(idx++, EncodeError(r.error));
  st.BindText(idx++, r.instruction);
  st.BindText(idx++, r.description);
  st.BindInt64(idx++, r.processing_ms);
  return idx;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  if (db.UserVersion() >= kSchemaVersion) return;

  static const std::vector<std::string> kSchemaV1 = {
      "CREATE TABLE IF NOT EXISTS edit_request (id TEXT PRIMARY KEY, seq INTEGER NOT NULL UNIQUE, client_id TEXT NOT NULL, "
      "payload_json TEXT NOT NULL, priority INTEGER NOT NULL, status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL, result_ref TEXT, error_json TEXT, instruction TEXT, description TEXT, "
      "processing_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS edit_request_client_status ON edit_request(client_id, status);",
      "CREATE TABLE IF NOT EXISTS request_sequence (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO request_sequence(name, value) VALUES('edit_request', 1);"};

  SqliteTransaction tx(db);
  for (const auto& sql : kSchemaV1) {
    db.Exec(sql);
  }
  db.SetUserVersion(kSchemaVersion);
  tx.Commit();
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(*db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

uint64_t SqliteRepository::NextSequence(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement read(db, "SELECT value FROM request_sequence WHERE name='edit_request';");
  if (read.Step() != SQLITE_ROW) throw std::runtime_error("request_sequence row missing; schema not bootstrapped");
  const uint64_t value = read.Int64(0);

  Statement advance(db, "UPDATE request_sequence SET value=? WHERE name='edit_request';");
  advance.BindInt64(1, value + 1);
  auto result = Translate(db, advance.Step());
  if (!result) throw std::runtime_error("advance request sequence: " + result.message);
  return value;
}

Result SqliteRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO edit_request(id,seq,client_id,payload_json,priority,status,created_at_ms,updated_at_ms,result_ref,"
               "error_json,instruction,description,processing_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");
  st.BindText(1, r.id);
  st.BindInt64(2, r.sequence);
  BindMutableColumns(st, 3, r);

  const int rc = st.Step();
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "request " + r.id + " already exists");
  return Translate(db, rc);
}

std::optional<model::RequestRecord> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), std::string(kSelectColumns) + " WHERE id=?;");
  st.BindText(1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadRow(st);
}

std::vector<model::RequestRecord> SqliteRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  std::string sql = kSelectColumns;
  std::string where;
  if (filter.client_id) where += " client_id=?";
  if (filter.status) where += std::string(where.empty() ? "" : " AND") + " status=?";
  if (!where.empty()) sql += " WHERE" + where;
  sql += " ORDER BY seq DESC";
  if (filter.limit > 0) sql += " LIMIT " + std::to_string(filter.limit);
  sql += ";";

  Statement st(TX(t).Handle(), sql);
  int       idx = 1;
  if (filter.client_id) st.BindText(idx++, *filter.client_id);
  if (filter.status) st.BindInt(idx++, static_cast<int>(*filter.status));

  std::vector<model::RequestRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadRow(st));
  }
  return out;
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto* db = TX(t).Handle();

  // created_at_ms is rewritten unchanged.
  Statement st(db,
               "UPDATE edit_request SET client_id=?,payload_json=?,priority=?,status=?,created_at_ms=?,updated_at_ms=?,"
               "result_ref=?,error_json=?,instruction=?,description=?,processing_ms=? WHERE id=?;");
  const int next = BindMutableColumns(st, 1, r);
  st.BindText(next, r.id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "request " + r.id + " not found");
  return Translate(db, rc);
}

Result SqliteRepository::DeleteRequest(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM edit_request WHERE id=?;");
  st.BindText(1, id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "request " + id + " not found");
  return Translate(db, rc);
}

uint64_t SqliteRepository::CountActiveForClient(Transaction& t, const std::string& client_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM edit_request WHERE client_id=? AND status IN (?,?);");
  st.BindText(1, client_id);
  st.BindInt(2, static_cast<int>(REQUEST_STATUS_QUEUED));
  st.BindInt(3, static_cast<int>(REQUEST_STATUS_PROCESSING));
  return st.Step() == SQLITE_ROW ? st.Int64(0) : 0;
}

} // namespace waveq::db::sqlite

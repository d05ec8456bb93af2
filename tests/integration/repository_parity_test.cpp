#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/request_record.hpp"

#if WAVEQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using waveq::db::ErrorCode;
using waveq::db::Repository;
using waveq::db::RequestFilter;
using waveq::db::memory::MemoryRepository;
using waveq::db::model::RequestRecord;
using namespace waveq::engine::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RequestRecord MakeRecord(Repository& repo, waveq::db::Transaction& tx, const std::string& id, const std::string& client) {
  RequestRecord record;
  record.id            = id;
  record.client_id     = client;
  record.sources       = {"source-a", "source-b"};
  record.priority      = 2;
  record.status        = REQUEST_STATUS_QUEUED;
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;
  record.instruction   = "trim then normalize";
  record.description   = "parity";
  record.sequence      = repo.NextSequence(tx);

  OperationSpec trim;
  trim.set_kind(OPERATION_KIND_TRIM);
  (*trim.mutable_parameters()->mutable_fields())["start_ms"].set_number_value(0);
  (*trim.mutable_parameters()->mutable_fields())["end_ms"].set_number_value(1500);
  record.operations.push_back(trim);

  OperationSpec eq;
  eq.set_kind(OPERATION_KIND_EQUALIZE);
  auto* bands = (*eq.mutable_parameters()->mutable_fields())["bands"].mutable_struct_value();
  (*bands->mutable_fields())["100"].set_number_value(-3);
  record.operations.push_back(eq);
  return record;
}

void VerifyInsertGetRoundTrip(Repository& repo, const std::string& id) {
  auto tx     = repo.Begin();
  auto record = MakeRecord(repo, *tx, id, "client-rt");
  assert(repo.InsertRequest(*tx, record));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto loaded  = repo.GetRequest(*read_tx, id);
  read_tx->Commit();

  assert(loaded.has_value());
  assert(loaded->client_id == "client-rt");
  assert(loaded->sources == record.sources);
  assert(loaded->priority == 2);
  assert(loaded->status == REQUEST_STATUS_QUEUED);
  assert(loaded->created_at_ms == record.created_at_ms);
  assert(loaded->sequence == record.sequence);
  assert(loaded->instruction == "trim then normalize");
  assert(loaded->operations.size() == 2);
  assert(loaded->operations[0].parameters().fields().at("end_ms").number_value() == 1500);
  assert(loaded->operations[1].parameters().fields().at("bands").struct_value().fields().at("100").number_value() == -3);
  assert(!loaded->error.has_value());

  auto dup_tx = repo.Begin();
  auto dup    = repo.InsertRequest(*dup_tx, record);
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
}

void VerifyUpdateAndDelete(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRecord(repo, *tx, id, "client-upd")));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto record = *repo.GetRequest(*tx, id);
    record.status        = REQUEST_STATUS_ERROR;
    record.updated_at_ms = record.created_at_ms + 5;
    record.processing_ms = 42;

    RequestError error;
    error.set_kind(ERROR_KIND_EXECUTION);
    error.set_message("trim start past the end");
    error.set_operation_index(0);
    error.set_operation_kind(OPERATION_KIND_TRIM);
    record.error = error;

    assert(repo.UpdateRequest(*tx, record));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto record = repo.GetRequest(*tx, id);
    assert(record->status == REQUEST_STATUS_ERROR);
    assert(record->processing_ms == 42);
    assert(record->error.has_value());
    assert(record->error->operation_kind() == OPERATION_KIND_TRIM);
    assert(record->error->message() == "trim start past the end");

    RequestRecord ghost = *record;
    ghost.id            = id + "-ghost";
    assert(repo.UpdateRequest(*tx, ghost).code == ErrorCode::NotFound);

    assert(repo.DeleteRequest(*tx, id));
    assert(repo.DeleteRequest(*tx, id).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, id).has_value());
  tx->Commit();
}

void VerifyListAndCount(Repository& repo, const std::string& prefix) {
  const std::string client = prefix + "-client";
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 3; ++i) {
      auto record = MakeRecord(repo, *tx, prefix + "-" + std::to_string(i), client);
      if (i == 0) {
        record.status = REQUEST_STATUS_COMPLETED;
      } else if (i == 1) {
        record.status = REQUEST_STATUS_PROCESSING;
      }
      assert(repo.InsertRequest(*tx, record));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  RequestFilter by_client;
  by_client.client_id = client;
  by_client.limit     = 0;
  auto all            = repo.ListRequests(*tx, by_client);
  assert(all.size() == 3);
  assert(all[0].id == prefix + "-2");
  assert(all[2].id == prefix + "-0");

  RequestFilter completed = by_client;
  completed.status        = REQUEST_STATUS_COMPLETED;
  auto done               = repo.ListRequests(*tx, completed);
  assert(done.size() == 1 && done[0].id == prefix + "-0");

  RequestFilter limited = by_client;
  limited.limit         = 2;
  assert(repo.ListRequests(*tx, limited).size() == 2);

  assert(repo.CountActiveForClient(*tx, client) == 2);
  assert(repo.CountActiveForClient(*tx, client + "-nobody") == 0);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRecord(repo, *tx, id, "client-rb")));
    tx->Rollback();
  }
  {
    // destructor without commit also rolls back
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRecord(repo, *tx, id, "client-rb")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, id).has_value());
  tx->Commit();
}

void VerifySequenceIsMonotonic(Repository& repo) {
  uint64_t last = 0;
  for (int i = 0; i < 5; ++i) {
    auto       tx   = repo.Begin();
    const auto next = repo.NextSequence(*tx);
    tx->Commit();
    assert(next > last);
    last = next;
  }
}

void VerifyFinishedTransactionRejectsCommit(Repository& repo) {
  auto tx = repo.Begin();
  (void)repo.NextSequence(*tx);
  tx->Commit();
  assert(tx->IsCommitted());

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw && "second commit must be rejected");
}

// Memory only: sqlite shares one connection, so transactions cannot overlap there.
void VerifySnapshotIsolation(MemoryRepository& repo, const std::string& id) {
  auto reader = repo.Begin();
  auto writer = repo.Begin();
  assert(repo.InsertRequest(*writer, MakeRecord(repo, *writer, id, "client-iso")));
  writer->Commit();

  // the reader's snapshot predates the insert and a read-only commit never conflicts
  assert(!repo.GetRequest(*reader, id).has_value());
  reader->Commit();

  auto stale  = repo.Begin();
  auto winner = repo.Begin();
  (void)repo.NextSequence(*winner);
  winner->Commit();
  (void)repo.NextSequence(*stale);
  bool conflicted = false;
  try {
    stale->Commit();
  } catch (const std::runtime_error&) {
    conflicted = true;
  }
  assert(conflicted && "writer on a stale snapshot must fail to commit");
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo     = backend.make_repository();
  uint64_t sequence = 0;
  {
    auto tx     = repo->Begin();
    auto record = MakeRecord(*repo, *tx, id, "client-durable");
    sequence    = record.sequence;
    assert(repo->InsertRequest(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto record = repo->GetRequest(*tx, id);
  assert(record.has_value());
  assert(record->operations.size() == 2);
  assert(repo->NextSequence(*tx) > sequence);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if WAVEQ_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("waveq_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<waveq::db::sqlite::SqliteDB>(db_path);
    waveq::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<waveq::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertGetRoundTrip(*repo, backend.name + "-round-trip");
  VerifyUpdateAndDelete(*repo, backend.name + "-update");
  VerifyListAndCount(*repo, backend.name + "-list");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifySequenceIsMonotonic(*repo);
  VerifyFinishedTransactionRejectsCommit(*repo);
  if (auto* memory = dynamic_cast<MemoryRepository*>(repo.get())) {
    VerifySnapshotIsolation(*memory, backend.name + "-isolation");
  }

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if WAVEQ_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "waveq_integration_repository_parity: pass\n";
  return 0;
}

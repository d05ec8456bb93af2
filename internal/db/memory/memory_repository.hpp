#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace waveq::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  uint64_t NextSequence(Transaction&) override;

  Result InsertRequest(Transaction&, const model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string&) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&) override;
  Result DeleteRequest(Transaction&, const std::string&) override;
  uint64_t CountActiveForClient(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RequestRecord> requests;
    uint64_t next_sequence = 1;
  };

  // Published snapshots are immutable; a transaction copies one only when it
  // first writes.
  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t committed_version_ = 0;
};

}

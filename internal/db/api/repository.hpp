#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/request_record.hpp"

namespace waveq::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Sequence allocation is atomic with the transaction that uses it

  The DB is the source of truth for request state. Transition rules are
  enforced one level up, in store::RequestStore.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Edit requests
  // ---------------------------------------------------------------------

  // Next value of the monotonic request counter (REQ-000123 ids).
  virtual uint64_t NextSequence(Transaction&) = 0;

  virtual Result InsertRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string& id) = 0;

  // Newest first (descending sequence).
  virtual std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter& filter) = 0;

  virtual Result UpdateRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual Result DeleteRequest(Transaction&, const std::string& id) = 0;

  // queued + processing requests owned by client_id.
  virtual uint64_t CountActiveForClient(Transaction&, const std::string& client_id) = 0;
};

} // namespace waveq::db

#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace waveq::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

uint64_t MemoryRepository::NextSequence(Transaction& t) {
  return TX(t).Mutable().next_sequence++;
}

Result MemoryRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "request " + r.id + " already exists");
  s.requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  const auto&                        s = TX(t).View();
  std::vector<model::RequestRecord> records;
  for (const auto& [_, record] : s.requests) {
    if (filter.client_id && record.client_id != *filter.client_id) continue;
    if (filter.status && record.status != *filter.status) continue;
    records.push_back(record);
  }

  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.sequence > b.sequence; });
  if (filter.limit > 0 && records.size() > filter.limit) {
    records.resize(filter.limit);
  }
  return records;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.requests.contains(r.id)) return Result::Err(ErrorCode::NotFound, "request " + r.id + " not found");
  s.requests[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRequest(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.requests.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "request " + id + " not found");
  return Result::Ok();
}

uint64_t MemoryRepository::CountActiveForClient(Transaction& t, const std::string& client_id) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.requests.begin(), s.requests.end(), [&](const auto& entry) {
    return entry.second.client_id == client_id && waveq::model::IsActive(entry.second.status);
  }));
}

} // namespace waveq::db::memory

#include "memory_tx.hpp"

#include <stdexcept>

namespace waveq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) throw std::logic_error("memory transaction already finished");
  if (!working_) working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  if (finished_) throw std::logic_error("memory transaction already finished");
  finished_ = true;
  if (working_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != snapshot_version_) {
      throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
    }
    repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
    repo_.committed_version_++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  working_.reset();
}

} // namespace waveq::db::memory

#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace trajectory::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (state_ == TxState::kOpen) {
    state_ = TxState::kRolledBack;
  }
}

void MemoryTransaction::RequireOpen(const char* operation) const {
  if (state_ != TxState::kOpen) {
    throw std::logic_error(std::string(operation) + " on " + std::string(ToString(state_)) + " transaction");
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  RequireOpen("write");
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  RequireOpen("read");
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  RequireOpen("commit");
  if (!working_) {
    state_ = TxState::kCommitted;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    state_ = TxState::kRolledBack;
    working_.reset();
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
  repo_.committed_version_++;
  state_ = TxState::kCommitted;
}

void MemoryTransaction::Rollback() {
  RequireOpen("rollback");
  working_.reset();
  state_ = TxState::kRolledBack;
}

} // namespace trajectory::db::memory

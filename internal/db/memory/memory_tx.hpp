#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace trajectory::db::memory {

/*
  Optimistic snapshot transaction.

  Begin() pins the committed state without copying it. The first write
  clones the snapshot into a private working copy; reads see the working
  copy once it exists. Read-only transactions always commit.

  A writing transaction fails to commit (std::runtime_error, rolled back)
  when another writer committed after this one began.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  TxState state() const override {
    return state_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  void RequireOpen(const char* operation) const;

  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  std::uint64_t                                  snapshot_version_ = 0;
  TxState                                        state_            = TxState::kOpen;
};

} // namespace trajectory::db::memory

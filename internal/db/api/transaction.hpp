#pragma once

#include <cstdint>
#include <string_view>

namespace trajectory::db {

enum class TxState : std::uint8_t {
  kOpen       = 0,
  kCommitted  = 1,
  kRolledBack = 2,
};

constexpr std::string_view ToString(TxState state) {
  switch (state) {
    case TxState::kOpen:
      return "open";
    case TxState::kCommitted:
      return "committed";
    case TxState::kRolledBack:
      return "rolled back";
  }
  return "unknown";
}

/*
  Unit of work against one repository.

  Writes become visible to other transactions only on Commit(). A
  transaction destroyed while still open is rolled back. Commit() and
  Rollback() on a finished transaction throw std::logic_error.

  A failed Commit() leaves the transaction rolled back and rethrows:
  - sqlite:  the COMMIT error (e.g. SQLITE_BUSY past the busy timeout)
  - memory:  a conflict when another writer committed after this one began
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual TxState state() const = 0;

  bool open() const {
    return state() == TxState::kOpen;
  }
};

} // namespace trajectory::db

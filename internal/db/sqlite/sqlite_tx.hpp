#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace trajectory::db::sqlite {

/*
  BEGIN IMMEDIATE transaction: the write lock is taken up front, so a
  conflicting writer waits for busy_timeout instead of failing at COMMIT.

  A connection holds at most one open transaction; a nested Begin()
  throws. Callers sharing a SqliteDB across threads serialize
  Begin()..Commit() themselves.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

  TxState state() const override {
    return state_;
  }

 private:
  void RequireOpen(const char* operation) const;
  void RollbackQuietly() noexcept;

  std::shared_ptr<SqliteDB> db_;
  TxState                   state_ = TxState::kOpen;
};

} // namespace trajectory::db::sqlite

#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace trajectory::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ == TxState::kOpen) {
    RollbackQuietly();
  }
}

void SqliteTransaction::RequireOpen(const char* operation) const {
  if (state_ != TxState::kOpen) {
    throw std::logic_error(std::string(operation) + " on " + std::string(ToString(state_)) + " transaction");
  }
}

// Errors are logged; the connection is left in autocommit mode either way.
void SqliteTransaction::RollbackQuietly() noexcept {
  state_ = TxState::kRolledBack;
  if (sqlite3_get_autocommit(db_->Handle()) != 0) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    TRAJECTORY_LOG_ERROR("sqlite rollback failed", {observability::StringField("db", db_->Path()),
                                                    observability::StringField("error", err ? err : sqlite3_errmsg(db_->Handle()))});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    TRAJECTORY_LOG_WARN("sqlite commit failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
    RollbackQuietly();
    throw;
  }
  state_ = TxState::kCommitted;
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  state_ = TxState::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace trajectory::db::sqlite

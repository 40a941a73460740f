#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace trajectory::db::sqlite {

/*
  Write operations report failures as Result codes; read operations throw
  std::runtime_error when a statement cannot be prepared or a stored blob
  is malformed.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRun(Transaction&, const model::Run&) override;
  Result UpdateRunOutcome(Transaction&, const model::Run&) override;
  std::optional<model::Run> GetRun(Transaction&, const std::string& id) override;
  std::vector<model::Run> ListRuns(Transaction&) override;

  Result InsertInvocation(Transaction&, const model::Invocation&) override;
  std::vector<model::Invocation> ListInvocations(Transaction&, const std::string& run_id) override;
  std::uint64_t CountInvocations(Transaction&, const std::string& run_id) override;

  Result InsertEmbedding(Transaction&, const model::Embedding&) override;
  std::vector<model::Embedding> ListEmbeddings(Transaction&, const std::string& run_id) override;

  Result UpsertPersistenceDiagram(Transaction&, const model::PersistenceDiagram&) override;
  std::vector<model::PersistenceDiagram> ListPersistenceDiagrams(Transaction&, const std::string& run_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}

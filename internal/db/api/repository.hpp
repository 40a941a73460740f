#pragma once

#include <cstdint>
#include <memory>
#include <type_traits>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/embedding.hpp"
#include "internal/model/persistence_diagram.hpp"
#include "internal/model/run.hpp"

namespace trajectory::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Invocations are unique per (run, sequence_number)
  - Embeddings are unique per (invocation, embedding_model)
  - At most one persistence diagram per (run, embedding_model)

  Write failures come back as Result codes: AlreadyExists for a duplicate
  key, ConstraintViolation for a dangling reference, NotFound when the
  row to update does not exist.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  // Stores the run header; run.invocations is ignored.
  virtual Result InsertRun(Transaction&, const model::Run&) = 0;

  // Updates state, stop reason and error of an existing run.
  virtual Result UpdateRunOutcome(Transaction&, const model::Run&) = 0;

  // Header plus invocations in sequence order.
  virtual std::optional<model::Run> GetRun(Transaction&, const std::string& id) = 0;

  // Headers only, ordered by id (ids are time ordered).
  virtual std::vector<model::Run> ListRuns(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Invocations
  // ---------------------------------------------------------------------

  virtual Result InsertInvocation(Transaction&, const model::Invocation&) = 0;

  virtual std::vector<model::Invocation> ListInvocations(Transaction&, const std::string& run_id) = 0;

  virtual std::uint64_t CountInvocations(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Embeddings
  // ---------------------------------------------------------------------

  virtual Result InsertEmbedding(Transaction&, const model::Embedding&) = 0;

  // All embeddings of a run's invocations, by sequence number then model.
  virtual std::vector<model::Embedding> ListEmbeddings(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Persistence diagrams
  // ---------------------------------------------------------------------

  // Replaces any diagram already stored for (run_id, embedding_model).
  virtual Result UpsertPersistenceDiagram(Transaction&, const model::PersistenceDiagram&) = 0;

  // Ordered by embedding model.
  virtual std::vector<model::PersistenceDiagram> ListPersistenceDiagrams(Transaction&, const std::string& run_id) = 0;
};

/*
  Begins a transaction, runs fn(tx) and commits, returning whatever fn
  returns. An exception from fn leaves the transaction to roll back on
  destruction and propagates.
*/
template <typename Fn>
auto InTransaction(Repository& repository, Fn&& fn) -> std::invoke_result_t<Fn&, Transaction&> {
  auto tx = repository.Begin();
  if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
    fn(*tx);
    tx->Commit();
  } else {
    auto result = fn(*tx);
    tx->Commit();
    return result;
  }
}

} // namespace trajectory::db

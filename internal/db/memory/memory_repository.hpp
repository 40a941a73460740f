#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace trajectory::db::memory {

class MemoryTransaction;

/*
  In-process repository. Committed state is an immutable snapshot that is
  replaced wholesale on every successful writing commit, so readers never
  block writers. Contents are lost with the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // runs carry no invocations here
    std::map<std::string, model::Run> runs;

    std::unordered_map<std::string, model::Invocation> invocations;
    // run id -> sequence number -> invocation id
    std::unordered_map<std::string, std::map<std::uint32_t, std::string>> run_invocations;

    std::unordered_map<std::string, model::Embedding> embeddings;
    // invocation id -> embedding model -> embedding id
    std::unordered_map<std::string, std::map<std::string, std::string>> invocation_embeddings;

    // run id -> embedding model -> diagram
    std::unordered_map<std::string, std::map<std::string, model::PersistenceDiagram>> diagrams;
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  std::uint64_t                committed_version_ = 0;
};

} // namespace trajectory::db::memory

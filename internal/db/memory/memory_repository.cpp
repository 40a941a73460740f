#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace trajectory::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::Run& r) {
  auto& s = TX(t).Mutable();
  if (s.runs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "run " + r.id);

  auto header = r;
  header.invocations.clear();
  s.runs.emplace(r.id, std::move(header));
  return Result::Ok();
}

Result MemoryRepository::UpdateRunOutcome(Transaction& t, const model::Run& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.runs.find(r.id);
  if (it == s.runs.end()) return Result::Err(ErrorCode::NotFound, "run " + r.id);

  it->second.state       = r.state;
  it->second.stop_reason = r.stop_reason;
  it->second.error       = r.error;
  return Result::Ok();
}

std::optional<model::Run> MemoryRepository::GetRun(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(id);
  if (it == s.runs.end()) return std::nullopt;

  auto run        = it->second;
  run.invocations = ListInvocations(t, id);
  return run;
}

std::vector<model::Run> MemoryRepository::ListRuns(Transaction& t) {
  const auto&             s = TX(t).View();
  std::vector<model::Run> runs;
  runs.reserve(s.runs.size());
  for (const auto& [_, run] : s.runs) {
    runs.push_back(run);
  }
  return runs;
}

// ------------------------------------------------------------------
// Invocations
// ------------------------------------------------------------------

Result MemoryRepository::InsertInvocation(Transaction& t, const model::Invocation& r) {
  auto& s = TX(t).Mutable();
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "invocation references unknown run " + r.run_id);
  if (s.invocations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "invocation " + r.id);

  auto& by_sequence = s.run_invocations[r.run_id];
  if (by_sequence.contains(r.sequence_number)) {
    return Result::Err(ErrorCode::AlreadyExists, "run " + r.run_id + " already has sequence number " + std::to_string(r.sequence_number));
  }

  by_sequence.emplace(r.sequence_number, r.id);
  s.invocations.emplace(r.id, r);
  return Result::Ok();
}

std::vector<model::Invocation> MemoryRepository::ListInvocations(Transaction& t, const std::string& run_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::Invocation> out;

  auto it = s.run_invocations.find(run_id);
  if (it == s.run_invocations.end()) return out;

  for (const auto& [_, invocation_id] : it->second) {
    out.push_back(s.invocations.at(invocation_id));
  }
  return out;
}

std::uint64_t MemoryRepository::CountInvocations(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.run_invocations.find(run_id);
  return it == s.run_invocations.end() ? 0 : it->second.size();
}

// ------------------------------------------------------------------
// Embeddings
// ------------------------------------------------------------------

Result MemoryRepository::InsertEmbedding(Transaction& t, const model::Embedding& r) {
  auto& s = TX(t).Mutable();
  if (!s.invocations.contains(r.invocation_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "embedding references unknown invocation " + r.invocation_id);
  }
  if (s.embeddings.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "embedding " + r.id);

  auto& by_model = s.invocation_embeddings[r.invocation_id];
  if (by_model.contains(r.embedding_model)) {
    return Result::Err(ErrorCode::AlreadyExists, "invocation " + r.invocation_id + " already embedded with " + r.embedding_model);
  }

  by_model.emplace(r.embedding_model, r.id);
  s.embeddings.emplace(r.id, r);
  return Result::Ok();
}

std::vector<model::Embedding> MemoryRepository::ListEmbeddings(Transaction& t, const std::string& run_id) {
  const auto&                   s = TX(t).View();
  std::vector<model::Embedding> out;

  auto it = s.run_invocations.find(run_id);
  if (it == s.run_invocations.end()) return out;

  for (const auto& [_, invocation_id] : it->second) {
    auto eit = s.invocation_embeddings.find(invocation_id);
    if (eit == s.invocation_embeddings.end()) continue;
    for (const auto& entry : eit->second) {
      out.push_back(s.embeddings.at(entry.second));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Persistence diagrams
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPersistenceDiagram(Transaction& t, const model::PersistenceDiagram& r) {
  auto& s = TX(t).Mutable();
  if (!s.runs.contains(r.run_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "diagram references unknown run " + r.run_id);
  }
  s.diagrams[r.run_id].insert_or_assign(r.embedding_model, r);
  return Result::Ok();
}

std::vector<model::PersistenceDiagram> MemoryRepository::ListPersistenceDiagrams(Transaction& t, const std::string& run_id) {
  const auto&                            s = TX(t).View();
  std::vector<model::PersistenceDiagram> out;

  auto it = s.diagrams.find(run_id);
  if (it == s.diagrams.end()) return out;

  for (const auto& [_, diagram] : it->second) {
    out.push_back(diagram);
  }
  return out;
}

} // namespace trajectory::db::memory

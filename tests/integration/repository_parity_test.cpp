#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using trajectory::db::ErrorCode;
using trajectory::db::Repository;
using trajectory::db::memory::MemoryRepository;
using trajectory::model::Embedding;
using trajectory::model::Image;
using trajectory::model::Invocation;
using trajectory::model::Modality;
using trajectory::model::PersistenceDiagram;
using trajectory::model::Run;
using trajectory::model::RunState;
using trajectory::model::StopReason;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// Stored timestamps have microsecond resolution.
trajectory::util::TimePoint Micros(std::int64_t us) {
  return trajectory::util::FromUnixMicros(us);
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

Run MakeRun(const std::string& id) {
  Run run;
  run.id             = id;
  run.experiment_id  = "exp-" + id;
  run.network        = {"DummyT2I", "DummyI2T"};
  run.seed           = -7;
  run.initial_prompt = "a red balloon";
  run.max_length     = 6;
  return run;
}

Invocation MakeTextInvocation(const std::string& run_id, std::uint32_t seq, const std::string& text) {
  Invocation invocation;
  invocation.id              = run_id + "-inv-" + std::to_string(seq);
  invocation.run_id          = run_id;
  invocation.sequence_number = seq;
  invocation.model           = "DummyI2T";
  invocation.modality        = Modality::kText;
  invocation.seed            = -7;
  if (seq > 0) invocation.input_invocation_id = run_id + "-inv-" + std::to_string(seq - 1);
  invocation.output       = text;
  invocation.started_at   = Micros(1'700'000'000'000'000 + seq * 1000);
  invocation.completed_at = Micros(1'700'000'000'000'500 + seq * 1000);
  return invocation;
}

Invocation MakeImageInvocation(const std::string& run_id, std::uint32_t seq) {
  Invocation invocation = MakeTextInvocation(run_id, seq, "");
  invocation.model      = "DummyT2I";
  invocation.modality   = Modality::kImage;

  Image image;
  image.width    = 2;
  image.height   = 2;
  image.channels = 3;
  image.pixels   = {255, 0, 0, 0, 255, 0, 0, 0, 255, 10, 20, 30};
  invocation.output = image;
  return invocation;
}

Embedding MakeEmbedding(const std::string& invocation_id, const std::string& model, std::vector<float> vector) {
  Embedding embedding;
  embedding.id              = invocation_id + "-" + model;
  embedding.invocation_id   = invocation_id;
  embedding.embedding_model = model;
  embedding.vector          = std::move(vector);
  embedding.started_at      = Micros(1'700'000'000'100'000);
  embedding.completed_at    = Micros(1'700'000'000'100'250);
  return embedding;
}

PersistenceDiagram MakeDiagram(const std::string& run_id, const std::string& model, double death) {
  PersistenceDiagram diagram;
  diagram.id              = run_id + "-pd-" + model + "-" + std::to_string(death);
  diagram.run_id          = run_id;
  diagram.embedding_model = model;
  diagram.dimensions.push_back({0, {{0.0, death}, {0.0, std::numeric_limits<double>::infinity()}}, 0.0});
  diagram.dimensions.push_back({1, {}, std::nullopt});
  diagram.started_at   = Micros(1'700'000'000'200'000);
  diagram.completed_at = Micros(1'700'000'000'200'900);
  return diagram;
}

void VerifyRunLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto run = MakeRun(id);
  assert(repo.InsertRun(*tx, run));

  auto duplicate = repo.InsertRun(*tx, run);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetRun(*tx, id);
  assert(read.has_value());
  assert(read->network == run.network);
  assert(read->seed == -7);
  assert(read->initial_prompt == "a red balloon");
  assert(read->max_length == 6);
  assert(read->state == RunState::kPending);
  assert(!read->stop_reason.has_value());
  assert(read->invocations.empty());

  run.state       = RunState::kCompleted;
  run.stop_reason = StopReason::Duplicate(2);
  assert(repo.UpdateRunOutcome(*tx, run));

  auto updated = repo.GetRun(*tx, id);
  assert(updated.has_value());
  assert(updated->state == RunState::kCompleted);
  assert(updated->stop_reason == StopReason::Duplicate(2));
  assert(!updated->error.has_value());

  auto missing = MakeRun(id + "-missing");
  auto result  = repo.UpdateRunOutcome(*tx, missing);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
  assert(!repo.GetRun(*tx, id + "-missing").has_value());

  tx->Commit();
}

void VerifyInvocationsRoundTrip(Repository& repo, const std::string& run_id) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(run_id)));

  // Inserted out of order; reads come back in sequence order.
  assert(repo.InsertInvocation(*tx, MakeTextInvocation(run_id, 1, "a balloon over a field")));
  assert(repo.InsertInvocation(*tx, MakeImageInvocation(run_id, 0)));

  auto same_seq = MakeTextInvocation(run_id, 1, "other");
  same_seq.id   = run_id + "-other";
  auto clash    = repo.InsertInvocation(*tx, same_seq);
  assert(!clash);
  assert(clash.code == ErrorCode::AlreadyExists);

  auto orphan = repo.InsertInvocation(*tx, MakeTextInvocation(run_id + "-nope", 0, "x"));
  assert(!orphan);
  assert(orphan.code == ErrorCode::ConstraintViolation);

  assert(repo.CountInvocations(*tx, run_id) == 2);

  auto invocations = repo.ListInvocations(*tx, run_id);
  assert(invocations.size() == 2);
  assert(invocations[0].sequence_number == 0);
  assert(invocations[0].modality == Modality::kImage);
  assert(invocations[0].input_invocation_id.empty());
  assert(std::get<Image>(*invocations[0].output) == std::get<Image>(*MakeImageInvocation(run_id, 0).output));

  assert(invocations[1].sequence_number == 1);
  assert(std::get<std::string>(*invocations[1].output) == "a balloon over a field");
  assert(invocations[1].input_invocation_id == invocations[0].id);
  assert(trajectory::util::ToUnixMicros(invocations[1].started_at) == 1'700'000'000'001'000);
  assert(trajectory::util::ToUnixMicros(invocations[1].completed_at) == 1'700'000'000'001'500);

  auto run = repo.GetRun(*tx, run_id);
  assert(run.has_value());
  assert(run->invocations.size() == 2);
  assert(run->invocations[1].id == invocations[1].id);

  tx->Commit();
}

void VerifyEmbeddingsAndDiagrams(Repository& repo, const std::string& run_id) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(run_id)));
  assert(repo.InsertInvocation(*tx, MakeImageInvocation(run_id, 0)));
  assert(repo.InsertInvocation(*tx, MakeTextInvocation(run_id, 1, "one")));
  assert(repo.InsertInvocation(*tx, MakeTextInvocation(run_id, 3, "three")));

  const auto first = run_id + "-inv-1";
  const auto third = run_id + "-inv-3";

  assert(repo.InsertEmbedding(*tx, MakeEmbedding(third, "Dummy", {0.5f, -1.25f, 3.0f})));
  assert(repo.InsertEmbedding(*tx, MakeEmbedding(first, "Dummy2", {1.0f, 2.0f})));
  assert(repo.InsertEmbedding(*tx, MakeEmbedding(first, "Dummy", {0.0f, 0.25f, 1e-7f})));

  auto twice = MakeEmbedding(first, "Dummy", {9.0f});
  twice.id   = "other-id";
  auto dup   = repo.InsertEmbedding(*tx, twice);
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto orphan = repo.InsertEmbedding(*tx, MakeEmbedding("no-such-invocation", "Dummy", {1.0f}));
  assert(!orphan);
  assert(orphan.code == ErrorCode::ConstraintViolation);

  auto embeddings = repo.ListEmbeddings(*tx, run_id);
  assert(embeddings.size() == 3);
  assert(embeddings[0].invocation_id == first && embeddings[0].embedding_model == "Dummy");
  assert(embeddings[1].invocation_id == first && embeddings[1].embedding_model == "Dummy2");
  assert(embeddings[2].invocation_id == third);
  assert((embeddings[0].vector == std::vector<float>{0.0f, 0.25f, 1e-7f}));
  assert((embeddings[2].vector == std::vector<float>{0.5f, -1.25f, 3.0f}));
  assert(trajectory::util::ToUnixMicros(embeddings[2].completed_at) == 1'700'000'000'100'250);

  assert(repo.UpsertPersistenceDiagram(*tx, MakeDiagram(run_id, "Dummy2", 0.75)));
  assert(repo.UpsertPersistenceDiagram(*tx, MakeDiagram(run_id, "Dummy", 0.5)));
  assert(repo.UpsertPersistenceDiagram(*tx, MakeDiagram(run_id, "Dummy", 1.5)));

  auto orphan_diagram = repo.UpsertPersistenceDiagram(*tx, MakeDiagram(run_id + "-nope", "Dummy", 1.0));
  assert(!orphan_diagram);
  assert(orphan_diagram.code == ErrorCode::ConstraintViolation);

  auto diagrams = repo.ListPersistenceDiagrams(*tx, run_id);
  assert(diagrams.size() == 2);
  assert(diagrams[0].embedding_model == "Dummy");
  assert(diagrams[1].embedding_model == "Dummy2");

  const auto& replaced = diagrams[0];
  assert(replaced.dimensions.size() == 2);
  assert(replaced.dimensions[0].dimension == 0);
  assert(replaced.dimensions[0].generators.size() == 2);
  assert(replaced.dimensions[0].generators[0].death == 1.5);
  assert(std::isinf(replaced.dimensions[0].generators[1].death));
  assert(replaced.dimensions[0].entropy == 0.0);
  assert(replaced.dimensions[1].generators.empty());
  assert(!replaced.dimensions[1].entropy.has_value());

  tx->Commit();
}

void VerifyListRuns(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.InsertRun(*tx, MakeRun(prefix + "-b")));
  assert(repo.InsertRun(*tx, MakeRun(prefix + "-a")));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto runs    = repo.ListRuns(*read_tx);
  read_tx->Commit();

  std::vector<std::string> ours;
  for (const auto& run : runs) {
    assert(run.invocations.empty());
    if (run.id.rfind(prefix, 0) == 0) ours.push_back(run.id);
  }
  assert(ours.size() == 2);
  assert(ours[0] == prefix + "-a");
  assert(ours[1] == prefix + "-b");
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id + "-dropped")));
    // destroyed without commit
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetRun(*check_tx, id).has_value());
  assert(!repo.GetRun(*check_tx, id + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, MakeRun(id)));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetRun(*tx1, id);
  auto r2 = repo.GetRun(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->state = RunState::kRunning;
  r2->state = RunState::kFailed;

  assert(repo.UpdateRunOutcome(*tx1, *r1));
  tx1->Commit();

  // tx2 read a snapshot that tx1 has since replaced.
  assert(repo.UpdateRunOutcome(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    conflicted = true;
  }
  assert(conflicted);
  assert(tx2->state() == trajectory::db::TxState::kRolledBack);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetRun(*verify_tx, id);
  assert(final.has_value());
  assert(final->state == RunState::kRunning);
  verify_tx->Commit();
}

void VerifyTransactionStates(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(tx->open());
  assert(repo.InsertRun(*tx, MakeRun(id)));
  tx->Commit();
  assert(tx->state() == trajectory::db::TxState::kCommitted);

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw && "second commit must be rejected");

  auto rolled = repo.Begin();
  rolled->Rollback();
  assert(rolled->state() == trajectory::db::TxState::kRolledBack);
  threw = false;
  try {
    rolled->Rollback();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  rolled.reset();

  // InTransaction commits what the callback wrote and returns its value.
  auto count = trajectory::db::InTransaction(repo, [&](trajectory::db::Transaction& t) {
    assert(repo.InsertInvocation(t, MakeTextInvocation(id, 0, "first")));
    return repo.CountInvocations(t, id);
  });
  assert(count == 1);

  // A throwing callback leaves nothing behind.
  threw = false;
  try {
    trajectory::db::InTransaction(repo, [&](trajectory::db::Transaction& t) {
      assert(repo.InsertInvocation(t, MakeTextInvocation(id, 1, "second")));
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  trajectory::db::InTransaction(repo, [&](trajectory::db::Transaction& t) { assert(repo.CountInvocations(t, id) == 1); });

  // Duplicate keys surface as AlreadyExists and map to InvalidState.
  auto dup = repo.Begin();
  auto result = repo.InsertRun(*dup, MakeRun(id));
  assert(!result && result.code == ErrorCode::AlreadyExists);
  dup->Rollback();

  threw = false;
  try {
    trajectory::db::ThrowIfError(result, "insert run");
  } catch (const trajectory::util::InvalidState& e) {
    threw = std::string(e.what()).find("insert run") != std::string::npos;
  }
  assert(threw);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto run = MakeRun(id);
    assert(repo->InsertRun(*tx, run));
    assert(repo->InsertInvocation(*tx, MakeTextInvocation(id, 0, "persisted")));
    assert(repo->InsertEmbedding(*tx, MakeEmbedding(id + "-inv-0", "Dummy", {0.125f})));

    run.state = RunState::kFailed;
    run.error = "generator exploded";
    assert(repo->UpdateRunOutcome(*tx, run));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto run = repo->GetRun(*tx, id);
  assert(run.has_value());
  assert(run->state == RunState::kFailed);
  assert(run->error == std::optional<std::string>("generator exploded"));
  assert(run->invocations.size() == 1);
  assert(std::get<std::string>(*run->invocations[0].output) == "persisted");

  auto embeddings = repo->ListEmbeddings(*tx, id);
  assert(embeddings.size() == 1);
  assert(embeddings[0].vector == std::vector<float>{0.125f});
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("trajectory_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<trajectory::db::sqlite::SqliteDB>(trajectory::db::sqlite::SqliteOptions{db_path});
    trajectory::db::sqlite::BootstrapSchema(db);
    return std::make_shared<trajectory::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyRunLifecycle(*repo, backend.name + "-run-life");
    VerifyInvocationsRoundTrip(*repo, backend.name + "-invocations");
    VerifyEmbeddingsAndDiagrams(*repo, backend.name + "-embeddings");
    VerifyListRuns(*repo, backend.name + "-list");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentTransactions(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);
    VerifyTransactionStates(*repo, backend.name + "-tx-states");

    VerifyRestartDurability(backend, backend.name + "-durable");
  }

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "trajectory_integration_repository_parity: pass\n";
  return 0;
}

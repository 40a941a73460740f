#include "internal/analysis/embedding_collector.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/analysis/semantic_drift.hpp"

namespace {

using trajectory::model::Embedding;
using trajectory::model::Image;
using trajectory::model::Invocation;
using trajectory::model::Modality;
using trajectory::model::Run;

Invocation TextInvocation(std::uint32_t sequence_number, std::string text) {
  Invocation invocation;
  invocation.id              = "inv-" + std::to_string(sequence_number);
  invocation.sequence_number = sequence_number;
  invocation.modality        = Modality::kText;
  invocation.output          = std::move(text);
  return invocation;
}

Invocation ImageInvocation(std::uint32_t sequence_number) {
  Invocation invocation;
  invocation.id              = "inv-" + std::to_string(sequence_number);
  invocation.sequence_number = sequence_number;
  invocation.modality        = Modality::kImage;
  invocation.output          = Image{1, 1, 1, {9}};
  return invocation;
}

Embedding EmbeddingOf(const std::string& invocation_id, const std::string& model, std::vector<float> vector) {
  Embedding embedding;
  embedding.id              = invocation_id + "/" + model;
  embedding.invocation_id   = invocation_id;
  embedding.embedding_model = model;
  embedding.vector          = std::move(vector);
  return embedding;
}

void TestCollectorOrdersTextEmbeddingsBySequence() {
  Run run;
  run.id          = "run";
  run.invocations = {TextInvocation(3, "d"), ImageInvocation(0), TextInvocation(1, "b"), ImageInvocation(2)};

  std::vector<Embedding> embeddings = {
      EmbeddingOf("inv-3", "Dummy", {3.0F}),
      EmbeddingOf("inv-1", "Dummy", {1.0F}),
      EmbeddingOf("inv-1", "Dummy2", {100.0F}),
      // image embeddings are ignored even when stored
      EmbeddingOf("inv-0", "Dummy", {0.0F}),
  };

  auto points = trajectory::analysis::CollectTrajectory(run, embeddings, "Dummy");
  assert((points == trajectory::analysis::Trajectory{{1.0F}, {3.0F}}));

  auto other = trajectory::analysis::CollectTrajectory(run, embeddings, "Dummy2");
  assert((other == trajectory::analysis::Trajectory{{100.0F}}));

  assert(trajectory::analysis::CollectTrajectory(run, embeddings, "Missing").empty());
}

void TestMissingEmbeddingIsAGap() {
  Run run;
  run.invocations = {TextInvocation(0, "a"), TextInvocation(1, "b"), TextInvocation(2, "c")};

  std::vector<Embedding> embeddings = {EmbeddingOf("inv-0", "Dummy", {0.0F}), EmbeddingOf("inv-2", "Dummy", {2.0F})};

  auto points = trajectory::analysis::CollectTrajectory(run, embeddings, "Dummy");
  assert((points == trajectory::analysis::Trajectory{{0.0F}, {2.0F}}));
}

void TestCosineDistance() {
  using trajectory::analysis::CosineDistance;

  assert(std::fabs(CosineDistance({1.0F, 0.0F}, {2.0F, 0.0F})) < 1e-12);
  assert(std::fabs(CosineDistance({1.0F, 0.0F}, {0.0F, 1.0F}) - 1.0) < 1e-12);
  assert(std::fabs(CosineDistance({1.0F, 0.0F}, {-1.0F, 0.0F}) - 2.0) < 1e-12);
  assert(CosineDistance({0.0F, 0.0F}, {0.0F, 0.0F}) == 0.0);
  assert(CosineDistance({0.0F, 0.0F}, {1.0F, 0.0F}) == 1.0);

  bool threw = false;
  try {
    (void)CosineDistance({1.0F}, {1.0F, 2.0F});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSemanticDriftFromFirstPoint() {
  auto drift = trajectory::analysis::SemanticDrift({{1.0F, 0.0F}, {1.0F, 0.0F}, {0.0F, 1.0F}});
  assert(drift.size() == 3);
  assert(drift[0] == 0.0);
  assert(std::fabs(drift[1]) < 1e-12);
  assert(std::fabs(drift[2] - 1.0) < 1e-12);

  assert(trajectory::analysis::SemanticDrift({}).empty());
}

} // namespace

int main() {
  TestCollectorOrdersTextEmbeddingsBySequence();
  TestMissingEmbeddingIsAGap();
  TestCosineDistance();
  TestSemanticDriftFromFirstPoint();

  std::cout << "trajectory_unit_analysis: pass\n";
  return 0;
}

#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using trajectory::util::IdCreatedAt;
using trajectory::util::IsValidId;
using trajectory::util::NewId;

void TestIdsAreCanonicalVersion7() {
  const auto id = NewId();
  assert(id.size() == 36);
  assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
  assert(id[14] == '7');
  assert(IsValidId(id));

  assert(!IsValidId(""));
  assert(!IsValidId("not-an-id"));
  assert(!IsValidId("0190a1b2-c3d4-4e5f-8a6b-7c8d9e0f1a2b")); // version 4
  assert(!IsValidId("0190A1B2-C3D4-7E5F-8A6B-7C8D9E0F1A2B")); // uppercase
  assert(!IsValidId("0190a1b2-c3d4-7e5f-ca6b-7c8d9e0f1a2b")); // wrong variant
}

void TestIdsSortInCreationOrder() {
  std::vector<std::string> ids;
  for (int i = 0; i < 5000; ++i) {
    ids.push_back(NewId());
  }
  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(ids[i - 1] < ids[i]);
  }
}

void TestIdsAreUniqueAcrossThreads() {
  std::vector<std::vector<std::string>> per_thread(4);
  std::vector<std::thread>              threads;
  for (auto& bucket : per_thread) {
    threads.emplace_back([&bucket] {
      for (int i = 0; i < 2000; ++i) bucket.push_back(NewId());
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<std::string> all;
  for (const auto& bucket : per_thread) all.insert(bucket.begin(), bucket.end());
  assert(all.size() == 8000);
}

void TestCreationTimeRoundTrips() {
  const auto before = trajectory::util::Now() - std::chrono::milliseconds(1);
  const auto id     = NewId();
  const auto after  = trajectory::util::Now() + std::chrono::milliseconds(5);

  auto created = IdCreatedAt(id);
  assert(created.has_value());
  assert(*created >= before && *created <= after);

  // 0x0190a1b2c3d4 ms = 1720699765716
  auto fixed = IdCreatedAt("0190a1b2-c3d4-7e5f-8a6b-7c8d9e0f1a2b");
  assert(fixed.has_value());
  assert(trajectory::util::FormatUtc(*fixed) == "2024-07-11T12:09:25.716Z");

  assert(!IdCreatedAt("garbage").has_value());
}

void TestTimeHelpers() {
  using trajectory::util::FromUnixMicros;
  using trajectory::util::TimePoint;
  using trajectory::util::ToUnixMicros;

  assert(trajectory::util::FormatUtc(TimePoint{}) == "1970-01-01T00:00:00.000Z");
  assert(ToUnixMicros(FromUnixMicros(1234567890123456)) == 1234567890123456);

  const auto start = FromUnixMicros(1'000'000);
  assert(trajectory::util::DurationSeconds(start, FromUnixMicros(3'500'000)) == 2.5);
  assert(trajectory::util::DurationSeconds(TimePoint{}, start) == 0.0);
  assert(trajectory::util::DurationSeconds(start, TimePoint{}) == 0.0);
}

void TestGenerationErrorMessage() {
  trajectory::util::GenerationError error("boom", "run-1", 4, "DummyT2I");
  assert(std::string(error.what()) == "boom (run=run-1 seq=4 model=DummyT2I)");
  assert(error.run_id() == "run-1");
  assert(error.sequence_number() == 4);
  assert(error.model() == "DummyT2I");
}

} // namespace

int main() {
  TestIdsAreCanonicalVersion7();
  TestIdsSortInCreationOrder();
  TestIdsAreUniqueAcrossThreads();
  TestCreationTimeRoundTrips();
  TestTimeHelpers();
  TestGenerationErrorMessage();

  std::cout << "trajectory_unit_util: pass\n";
  return 0;
}

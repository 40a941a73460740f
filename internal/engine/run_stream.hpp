#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/engine/invocation_channel.hpp"
#include "internal/engine/run_driver.hpp"

namespace trajectory::engine {

struct RunOutcome {
  model::Run                 run;
  model::RunState            state = model::RunState::kPending;
  std::optional<std::string> error;
};

/*
  Incremental view of one run in progress.

  The driver advances on a dedicated producer thread; Next() yields
  invocations in sequence order as they complete. Cancel() stops the
  producer before its next step; invocations already produced stay valid
  and a cancelled run is left in Running.

  Finish() discards anything not yet consumed, waits for the producer and
  hands back the run. The destructor cancels and joins.
*/
class RunStream {
 public:
  explicit RunStream(RunDriver driver, std::size_t buffer = 16);
  ~RunStream();

  RunStream(const RunStream&)            = delete;
  RunStream& operator=(const RunStream&) = delete;

  std::optional<model::Invocation> Next();

  void Cancel();

  // Rethrows anything the producer thread failed with. Call at most once.
  RunOutcome Finish();

 private:
  void Join();

  std::unique_ptr<RunDriver> driver_;
  InvocationChannel          channel_;
  std::thread                producer_;
  std::exception_ptr         failure_;
  bool                       finished_ = false;
};

} // namespace trajectory::engine

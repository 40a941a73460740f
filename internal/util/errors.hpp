#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace trajectory::util {

/*
  Central error types.

  GenerationError is fatal to the enclosing run, EmbeddingError to a single
  embedding, HomologyError to a single persistence diagram. None of them are
  retried by the engine.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GenerationError : public std::runtime_error {
 public:
  GenerationError(const std::string& msg, std::string run_id, std::uint32_t sequence_number, std::string model)
      : std::runtime_error(msg + " (run=" + run_id + " seq=" + std::to_string(sequence_number) + " model=" + model + ")"),
        run_id_(std::move(run_id)),
        sequence_number_(sequence_number),
        model_(std::move(model)) {
  }

  const std::string& run_id() const {
    return run_id_;
  }
  std::uint32_t sequence_number() const {
    return sequence_number_;
  }
  const std::string& model() const {
    return model_;
  }

 private:
  std::string   run_id_;
  std::uint32_t sequence_number_ = 0;
  std::string   model_;
};

class EmbeddingError : public std::runtime_error {
 public:
  EmbeddingError(const std::string& msg, std::string invocation_id, std::string model)
      : std::runtime_error(msg + " (invocation=" + invocation_id + " model=" + model + ")"),
        invocation_id_(std::move(invocation_id)),
        model_(std::move(model)) {
  }

  const std::string& invocation_id() const {
    return invocation_id_;
  }
  const std::string& model() const {
    return model_;
  }

 private:
  std::string invocation_id_;
  std::string model_;
};

class HomologyError : public std::runtime_error {
 public:
  explicit HomologyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace trajectory::util

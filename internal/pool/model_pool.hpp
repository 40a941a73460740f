#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/pool/work_queue.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::pool {

/*
  Fixed set of long-lived workers bound to one model.

  Every worker loads its own Model instance once, on its own thread, and
  reuses it for every task it pulls. Capacity therefore bounds both the
  number of concurrent calls and the number of loaded instances.

  A worker whose load failed stays alive and fails each task routed to it
  with the load exception, so callers see the error through the future
  instead of hanging.
*/
template <typename Model>
class ModelPool {
 public:
  using Factory = std::function<std::unique_ptr<Model>()>;

  ModelPool(std::string name, std::uint32_t capacity, Factory factory)
      : name_(std::move(name)),
        capacity_(capacity == 0 ? 1 : capacity),
        factory_(std::move(factory)) {
  }

  ~ModelPool() {
    Stop();
  }

  ModelPool(const ModelPool&)            = delete;
  ModelPool& operator=(const ModelPool&) = delete;

  void Start() {
    if (!workers_.empty()) return;

    workers_.reserve(capacity_);
    for (std::uint32_t i = 0; i < capacity_; ++i) {
      workers_.emplace_back(&ModelPool::Work, this, i);
    }
  }

  // Remaining queued tasks still run before the workers exit.
  void Stop() {
    queue_.Shutdown();
    for (auto& worker : workers_) {
      if (worker.joinable()) worker.join();
    }
    workers_.clear();
  }

  template <typename Fn>
  auto Submit(Fn fn) -> std::future<std::invoke_result_t<Fn&, Model&>> {
    using Result = std::invoke_result_t<Fn&, Model&>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future  = promise->get_future();

    Task task = [promise, fn = std::move(fn)](Model* model, const std::exception_ptr& load_error) mutable {
      if (!model) {
        promise->set_exception(load_error);
        return;
      }
      try {
        if constexpr (std::is_void_v<Result>) {
          fn(*model);
          promise->set_value();
        } else {
          promise->set_value(fn(*model));
        }
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    };

    if (!queue_.Push(std::move(task))) {
      throw util::InvalidState("model pool " + name_ + " is stopped");
    }
    return future;
  }

  const std::string& name() const {
    return name_;
  }
  std::uint32_t capacity() const {
    return capacity_;
  }

 private:
  using Task = std::function<void(Model*, const std::exception_ptr&)>;

  void Work(std::uint32_t index) {
    std::unique_ptr<Model> model;
    std::exception_ptr     load_error;
    try {
      model = factory_();
      if (!model) {
        throw std::runtime_error("factory returned no instance");
      }
      TRAJECTORY_LOG_DEBUG("model loaded", {observability::StringField("model", name_), observability::IntField("worker", index)});
    } catch (const std::exception& e) {
      load_error = std::current_exception();
      TRAJECTORY_LOG_ERROR("model load failed",
                           {observability::StringField("model", name_), observability::IntField("worker", index), observability::StringField("error", e.what())});
    }

    while (auto task = queue_.Pop()) {
      (*task)(model.get(), load_error);
    }
  }

  std::string   name_;
  std::uint32_t capacity_;
  Factory       factory_;

  WorkQueue<Task>          queue_;
  std::vector<std::thread> workers_;
};

} // namespace trajectory::pool

#pragma once

#include "log.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace gatehouse {

/// Single worker thread draining a bounded task queue in FIFO order.
/// `post` never blocks: when the queue is full the task is dropped.
class serial_dispatcher {
public:
  using task = std::function<void()>;

  explicit serial_dispatcher(std::string name, size_t capacity = 1024)
      : name_(std::move(name)), capacity_(capacity), log_("Dispatcher") {
    worker_ = std::thread([this]() { run(); });
  }

  ~serial_dispatcher() { stop(); }

  serial_dispatcher(const serial_dispatcher &) = delete;
  serial_dispatcher &operator=(const serial_dispatcher &) = delete;

  bool post(task fn) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_) {
        return false;
      }
      if (queue_.size() >= capacity_) {
        ++dropped_;
        return false;
      }
      queue_.push_back(std::move(fn));
    }
    cv_.notify_one();
    return true;
  }

  /// Block until every task posted so far has run.
  void drain() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this]() { return (queue_.empty() && !busy_) || stopped_; });
  }

  /// Run what is queued, then join the worker.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_ && !worker_.joinable()) {
        return;
      }
      stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    } else if (worker_.joinable()) {
      worker_.detach();
    }
  }

  size_t dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
  }

  const std::string &name() const { return name_; }

private:
  void run() {
    while (true) {
      task fn;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
          stopped_ = true;
          idle_cv_.notify_all();
          return;
        }
        fn = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
      }

      try {
        fn();
      } catch (const std::exception &e) {
        log_.error("Dispatched task failed", {{"queue", name_}, {"error", e.what()}});
      } catch (...) {
        log_.error("Dispatched task failed", {{"queue", name_}, {"error", "unknown"}});
      }

      {
        std::lock_guard<std::mutex> lock(mu_);
        busy_ = false;
        if (queue_.empty()) {
          idle_cv_.notify_all();
        }
      }
    }
  }

  std::string name_;
  size_t capacity_;
  logger log_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<task> queue_;
  bool busy_ = false;
  bool stopping_ = false;
  bool stopped_ = false;
  size_t dropped_ = 0;
  std::thread worker_;
};

} // namespace gatehouse

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "agd/async/task.h"
#include "agd/async/waker.h"
#include "agd/core/error.h"

namespace agd {
namespace async {

namespace detail {
// One pending resumption. Cleared by whoever gets there first: the executor
// resuming it or the awaiter being destroyed.
struct ResumeToken {
  explicit ResumeToken(std::coroutine_handle<> h) noexcept : handle(h) {}
  std::coroutine_handle<> handle;
  std::atomic<bool> live{true};
};
} // namespace detail

// Single-thread cooperative scheduler. Coroutines run only on the thread
// inside block_on(); wakers may fire from any thread and only enqueue.
class LocalExecutor {
 public:
  LocalExecutor();
  ~LocalExecutor();

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;

  // Executor driving the calling thread, or nullptr outside block_on().
  static LocalExecutor* current() noexcept;

  // A waker that resumes `h` here. It holds the queue weakly, so firing it
  // after the executor is gone does nothing. `token_out` receives the
  // resumption token so the caller can cancel it.
  Waker waker_for(std::coroutine_handle<> h,
                  std::shared_ptr<detail::ResumeToken>* token_out = nullptr);

  void schedule(std::coroutine_handle<> h);
  std::size_t queued() const;

  // Runs `task` to completion on this thread and returns its result. Throws
  // DeadlineExceeded if `timeout` expires first; the task is then destroyed.
  template <class T>
  T block_on(Task<T> task, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    if (!task.valid()) {
      throw validation_error(ErrorCode::InvalidArgument, "block_on: empty task");
    }
    CurrentGuard guard(this);
    schedule(task.handle());
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) deadline = std::chrono::steady_clock::now() + *timeout;
    if (!run_until_([&task] { return task.done(); }, deadline)) {
      throw validation_error(ErrorCode::DeadlineExceeded,
                             "block_on: timed out after " + std::to_string(timeout->count()) + " ms");
    }
    return task.result();
  }

 private:
  struct Queue {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::shared_ptr<detail::ResumeToken>> ready;
  };

  class CurrentGuard {
   public:
    explicit CurrentGuard(LocalExecutor* ex) noexcept;
    ~CurrentGuard();
   private:
    LocalExecutor* prev_;
  };

  static void push_(Queue& q, std::shared_ptr<detail::ResumeToken> tok);
  // Drains ready work first; gives up only when idle past `deadline`.
  bool run_until_(const std::function<bool()>& done,
                  std::optional<std::chrono::steady_clock::time_point> deadline);

  std::shared_ptr<Queue> queue_;
};

} // namespace async
} // namespace agd

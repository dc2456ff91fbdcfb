// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <memory>
#include <optional>

#include "agd/async/completion_signal.h"
#include "agd/async/executor.h"
#include "agd/async/waker.h"
#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace runtime {
class Runtime;
} // namespace runtime

namespace async {

namespace detail {

// Handed to event_on_ready as user_arg. Exactly one of the native callback or
// the failed-registration path reclaims it.
struct OnReadyContext {
  OnReadyContext(std::shared_ptr<CompletionSignal> s, std::shared_ptr<const runtime::Runtime> r);
  ~OnReadyContext();
  OnReadyContext(const OnReadyContext&) = delete;
  OnReadyContext& operator=(const OnReadyContext&) = delete;

  std::shared_ptr<CompletionSignal> signal;
  std::shared_ptr<const runtime::Runtime> runtime;
};

// Completes `signal` with an Internal error describing a host-side fault.
void complete_with_fault(CompletionSignal& signal, const char* context, const char* what) noexcept;

// agd_event_callback_fn; never lets an exception reach the caller.
void on_ready_trampoline(agd_error* error, void* user_arg) noexcept;

// Number of OnReadyContext objects currently alive (test diagnostics).
std::int64_t live_callback_contexts() noexcept;

} // namespace detail

class EventAwaiter;

// Host-side owner of one native agd_event. Completion is observed through a
// CompletionSignal registered with the plugin on first use. Destroying the
// Event destroys the native handle but never cancels the operation.
class Event {
 public:
  Event() = default;
  // Takes ownership of `event`. A null event means the operation already
  // finished successfully.
  Event(std::shared_ptr<const runtime::Runtime> rt, agd_event* event);
  ~Event();

  Event(const Event&) = delete;
  Event& operator=(const Event&) = delete;
  Event(Event&& other) noexcept;
  Event& operator=(Event&& other) noexcept;

  // Already-terminal event with no native handle.
  static Event ready(std::optional<Error> error = std::nullopt);
  // A pending native event created by the host and completed with set().
  // Unimplemented when the plugin has no host events.
  static Event create(std::shared_ptr<const runtime::Runtime> rt);

  // Completes a host-created event through the plugin: successfully, or with
  // `error`'s code and message. The completion is then observed like any other.
  void set(const std::optional<Error>& error = std::nullopt);

  // Starts observing the native event without a waiter. Idempotent.
  void arm();

  // Terminal: the result. Pending: stores `waker` as the sole waiter (each
  // call replaces the previous one) and returns nullopt.
  std::optional<SignalResult> poll(Waker waker);
  bool is_ready();

  // Blocks with Config::default_wait_timeout_ms (0 = unbounded). Throws the
  // completion error, or DeadlineExceeded when the bound expires.
  void wait();
  // False on timeout; throws the completion error.
  bool wait_for(std::chrono::milliseconds timeout);

  const std::shared_ptr<CompletionSignal>& signal() const noexcept { return signal_; }
  agd_event* native_handle() const noexcept { return event_; }
  bool valid() const noexcept { return static_cast<bool>(signal_); }

  EventAwaiter operator co_await() noexcept;

 private:
  void release_() noexcept;
  void swap_(Event& other) noexcept;
  // Completes the signal with `err`; a fault while reading it becomes Internal.
  void complete_from_native_(agd_error* err, const char* function) noexcept;

  std::shared_ptr<const runtime::Runtime> rt_;
  agd_event* event_{nullptr};
  std::shared_ptr<CompletionSignal> signal_;
  bool armed_{false};
};

// Awaits an Event inside a coroutine driven by a LocalExecutor. If the
// coroutine frame is destroyed while suspended, the waiter is detached and
// the pending resumption cancelled.
class EventAwaiter {
 public:
  explicit EventAwaiter(Event& ev) noexcept : ev_(ev) {}
  ~EventAwaiter();

  EventAwaiter(const EventAwaiter&) = delete;
  EventAwaiter& operator=(const EventAwaiter&) = delete;

  bool await_ready();
  bool await_suspend(std::coroutine_handle<> h);
  void await_resume();

 private:
  Event& ev_;
  std::optional<SignalResult> result_;
  std::uint64_t waker_id_{0};
  std::shared_ptr<detail::ResumeToken> token_;
};

inline EventAwaiter Event::operator co_await() noexcept { return EventAwaiter(*this); }

} // namespace async
} // namespace agd

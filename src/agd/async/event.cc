// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/async/event.h"

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

#include "agd/core/config.h"
#include "agd/logging/logging.h"
#include "agd/runtime/runtime.h"

namespace agd {
namespace async {

namespace detail {

namespace {
std::atomic<std::int64_t> g_live_contexts{0};
} // namespace

OnReadyContext::OnReadyContext(std::shared_ptr<CompletionSignal> s,
                               std::shared_ptr<const runtime::Runtime> r)
    : signal(std::move(s)), runtime(std::move(r)) {
  g_live_contexts.fetch_add(1, std::memory_order_relaxed);
}

OnReadyContext::~OnReadyContext() { g_live_contexts.fetch_sub(1, std::memory_order_relaxed); }

std::int64_t live_callback_contexts() noexcept {
  return g_live_contexts.load(std::memory_order_relaxed);
}

namespace {

// Prebuilt so reporting a fault never depends on a fresh allocation.
const Error kCallbackFault = internal_error("fault in completion callback");

} // namespace

void complete_with_fault(CompletionSignal& signal, const char* context, const char* what) noexcept {
  AGD_LOG(ERROR) << context << ": " << what;
  try {
    signal.complete(internal_error(std::string(context) + ": " + what));
    return;
  } catch (const std::exception& ex) {
    AGD_LOG(ERROR) << "could not describe fault: " << ex.what();
  }
  try {
    signal.complete(kCallbackFault);
  } catch (const std::exception& ex) {
    AGD_LOG(ERROR) << "completion dropped after fault: " << ex.what();
  }
}

void on_ready_trampoline(agd_error* error, void* user_arg) noexcept {
  std::unique_ptr<OnReadyContext> ctx(static_cast<OnReadyContext*>(user_arg));
  if (!ctx) {
    AGD_LOG(ERROR) << "completion callback invoked without a context; notification dropped";
    return;
  }
  try {
    std::optional<Error> err;
    if (error) err = ctx->runtime->translate(error, "event_on_ready");
    ctx->signal->complete(std::move(err));
  } catch (const std::exception& ex) {
    complete_with_fault(*ctx->signal, "fault in completion callback", ex.what());
  } catch (...) {
    complete_with_fault(*ctx->signal, "fault in completion callback", "non-std exception");
  }
}

} // namespace detail

namespace {

[[noreturn]] void throw_empty_() {
  throw validation_error(ErrorCode::FailedPrecondition, "Event: empty (moved-from or default) event");
}

} // namespace

Event::Event(std::shared_ptr<const runtime::Runtime> rt, agd_event* event)
    : rt_(std::move(rt)), event_(event), signal_(CompletionSignal::create()) {
  if (!event_) {
    signal_->complete(std::nullopt);
    armed_ = true;
  }
}

Event::~Event() { release_(); }

Event::Event(Event&& other) noexcept { swap_(other); }

Event& Event::operator=(Event&& other) noexcept {
  if (this != &other) {
    release_();
    swap_(other);
  }
  return *this;
}

void Event::swap_(Event& other) noexcept {
  std::swap(rt_, other.rt_);
  std::swap(event_, other.event_);
  std::swap(signal_, other.signal_);
  std::swap(armed_, other.armed_);
}

void Event::release_() noexcept {
  agd_event* ev = std::exchange(event_, nullptr);
  if (ev && rt_) {
    rt_->log_and_drop(rt_->api().event_destroy(ev), "event_destroy");
  }
  rt_.reset();
  // The native callback may still hold the signal; nobody is left to wake.
  if (signal_) signal_->clear_waiter();
  signal_.reset();
  armed_ = false;
}

Event Event::ready(std::optional<Error> error) {
  Event ev;
  ev.signal_ = CompletionSignal::create();
  ev.signal_->complete(std::move(error));
  ev.armed_ = true;
  return ev;
}

Event Event::create(std::shared_ptr<const runtime::Runtime> rt) {
  if (!rt) throw validation_error(ErrorCode::InvalidArgument, "Event::create: null runtime");
  if (!rt->api().has_host_events()) {
    throw validation_error(ErrorCode::Unimplemented,
                           "Event::create: plugin " + rt->name() + " has no host-created events");
  }
  agd_event* raw = nullptr;
  rt->check(rt->api().event_create(&raw), "event_create");
  if (!raw) throw internal_error("event_create succeeded without an event");
  return Event(std::move(rt), raw);
}

void Event::set(const std::optional<Error>& error) {
  if (!signal_) throw_empty_();
  if (!event_ || !rt_ || !rt_->api().has_host_events()) {
    throw validation_error(ErrorCode::FailedPrecondition, "Event::set: not a host-created native event");
  }
  if (!error) {
    rt_->check(rt_->api().event_set(event_, AGD_ERROR_CODE_OK, nullptr, 0), "event_set");
    return;
  }
  const std::string_view msg = error->what();
  rt_->check(rt_->api().event_set(event_, static_cast<agd_error_code>(error->code()), msg.data(), msg.size()),
             "event_set");
}

void Event::arm() {
  if (!signal_) throw_empty_();
  if (armed_) return;
  armed_ = true;
  if (signal_->state() != SignalState::Pending) return;

  const runtime::NativeApi& api = rt_->api();
  int is_ready = 0;
  if (agd_error* err = api.event_is_ready(event_, &is_ready)) {
    complete_from_native_(err, "event_is_ready");
    return;
  }
  if (is_ready) {
    if (agd_error* err = api.event_error(event_)) {
      complete_from_native_(err, "event_error");
    } else {
      signal_->complete(std::nullopt);
    }
    return;
  }

  // Released before the call: the plugin may invoke the callback inline,
  // and the callback owns the context from then on.
  void* arg = new detail::OnReadyContext(signal_, rt_);
  if (agd_error* err = api.event_on_ready(event_, &detail::on_ready_trampoline, arg)) {
    // Not retained by the plugin, so the callback never runs; reclaim here.
    std::unique_ptr<detail::OnReadyContext> reclaimed(static_cast<detail::OnReadyContext*>(arg));
    complete_from_native_(err, "event_on_ready");
  }
}

void Event::complete_from_native_(agd_error* err, const char* function) noexcept {
  try {
    signal_->complete(rt_->translate(err, function));
  } catch (const std::exception& ex) {
    detail::complete_with_fault(*signal_, "fault while reading native error", ex.what());
  } catch (...) {
    detail::complete_with_fault(*signal_, "fault while reading native error", "non-std exception");
  }
}

std::optional<SignalResult> Event::poll(Waker waker) {
  if (!signal_) throw_empty_();
  if (auto r = signal_->peek()) return r;
  arm();
  return signal_->poll(std::move(waker));
}

bool Event::is_ready() {
  if (!signal_) throw_empty_();
  arm();
  return signal_->state() != SignalState::Pending;
}

bool Event::wait_for(std::chrono::milliseconds timeout) {
  if (!signal_) throw_empty_();
  arm();
  auto r = signal_->block_until_ready(timeout);
  if (!r) return false;
  r->get();
  return true;
}

void Event::wait() {
  if (!signal_) throw_empty_();
  arm();
  const std::uint64_t ms = Config::get().default_wait_timeout_ms;
  std::optional<std::chrono::milliseconds> bound;
  if (ms != 0) bound = std::chrono::milliseconds(ms);
  auto r = signal_->block_until_ready(bound);
  if (!r) {
    throw validation_error(ErrorCode::DeadlineExceeded,
                           "Event::wait: not ready after " + std::to_string(ms) + " ms");
  }
  r->get();
}

// ---- EventAwaiter ----

EventAwaiter::~EventAwaiter() {
  if (token_) token_->live.store(false, std::memory_order_release);
  if (waker_id_ && ev_.signal()) ev_.signal()->detach(waker_id_);
}

bool EventAwaiter::await_ready() {
  if (!ev_.valid()) throw_empty_();
  ev_.arm();
  result_ = ev_.signal()->peek();
  return result_.has_value();
}

bool EventAwaiter::await_suspend(std::coroutine_handle<> h) {
  LocalExecutor* ex = LocalExecutor::current();
  if (!ex) {
    throw validation_error(ErrorCode::FailedPrecondition,
                           "co_await on Event outside LocalExecutor::block_on");
  }
  Waker w = ex->waker_for(h, &token_);
  waker_id_ = w.id();
  result_ = ev_.poll(std::move(w));
  // Completed between await_ready and here: keep running.
  return !result_.has_value();
}

void EventAwaiter::await_resume() {
  if (!result_) result_ = ev_.signal()->peek();
  if (!result_) {
    throw internal_error("Event resumed before its completion signal was terminal");
  }
  result_->get();
}

} // namespace async
} // namespace agd

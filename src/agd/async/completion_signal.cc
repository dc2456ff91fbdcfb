// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/async/completion_signal.h"

#include <atomic>
#include <utility>

#include "agd/logging/logging.h"

namespace agd {
namespace async {

std::uint64_t Waker::next_id() noexcept {
  static std::atomic<std::uint64_t> next{1};
  return next.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<CompletionSignal> CompletionSignal::create() {
  return std::shared_ptr<CompletionSignal>(new CompletionSignal());
}

std::optional<SignalResult> CompletionSignal::poll(Waker waker) {
  std::lock_guard<std::mutex> lg(mu_);
  if (state_ != SignalState::Pending) return result_locked_();
  waker_ = std::move(waker);
  return std::nullopt;
}

std::optional<SignalResult> CompletionSignal::peek() const {
  std::lock_guard<std::mutex> lg(mu_);
  if (state_ == SignalState::Pending) return std::nullopt;
  return result_locked_();
}

bool CompletionSignal::complete(std::optional<Error> error) noexcept {
  Waker to_wake;
  std::vector<Observer> observers;
  {
    std::lock_guard<std::mutex> lg(mu_);
    if (state_ != SignalState::Pending) return false;
    state_ = error ? SignalState::SatisfiedWithError : SignalState::Satisfied;
    result_.error = std::move(error);
    to_wake = std::exchange(waker_, Waker());
    observers.swap(observers_);
  }
  cv_.notify_all();

  // result_ no longer changes, so observers read it in place.
  for (auto& obs : observers) {
    try {
      obs(result_);
    } catch (const std::exception& ex) {
      AGD_LOG(ERROR) << "completion observer threw: " << ex.what();
    } catch (...) {
      AGD_LOG(ERROR) << "completion observer threw a non-std exception";
    }
  }
  try {
    to_wake.wake();
  } catch (const std::exception& ex) {
    AGD_LOG(ERROR) << "waker threw: " << ex.what();
  } catch (...) {
    AGD_LOG(ERROR) << "waker threw a non-std exception";
  }
  return true;
}

std::optional<SignalResult> CompletionSignal::block_until_ready(
    std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  auto done = [&] { return state_ != SignalState::Pending; };
  if (timeout) {
    if (!cv_.wait_for(lk, *timeout, done)) return std::nullopt;
  } else {
    cv_.wait(lk, done);
  }
  return result_locked_();
}

void CompletionSignal::detach(std::uint64_t waker_id) noexcept {
  std::lock_guard<std::mutex> lg(mu_);
  if (waker_ && waker_.id() == waker_id) waker_ = Waker();
}

void CompletionSignal::clear_waiter() noexcept {
  std::lock_guard<std::mutex> lg(mu_);
  waker_ = Waker();
}

void CompletionSignal::on_terminal(Observer observer) {
  std::optional<SignalResult> now;
  {
    std::lock_guard<std::mutex> lg(mu_);
    if (state_ == SignalState::Pending) {
      observers_.push_back(std::move(observer));
      return;
    }
    now = result_locked_();
  }
  observer(*now);
}

SignalState CompletionSignal::state() const {
  std::lock_guard<std::mutex> lg(mu_);
  return state_;
}

bool CompletionSignal::has_waiter() const {
  std::lock_guard<std::mutex> lg(mu_);
  return static_cast<bool>(waker_);
}

} // namespace async
} // namespace agd

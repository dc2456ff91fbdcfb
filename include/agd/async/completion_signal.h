// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "agd/async/waker.h"
#include "agd/core/error.h"

namespace agd {
namespace async {

enum class SignalState : std::uint8_t {
  Pending = 0,
  Satisfied = 1,
  SatisfiedWithError = 2,
};

// Terminal outcome of a signal.
struct SignalResult {
  std::optional<Error> error;

  bool ok() const noexcept { return !error.has_value(); }
  // Throws the attached error, if any.
  void get() const {
    if (error) throw *error;
  }
};

// One-shot completion shared between a native callback and a waiting task.
// State and the waiter slot are guarded by one mutex. Terminal states never
// revert.
class CompletionSignal {
 public:
  using Observer = std::function<void(const SignalResult&)>;

  static std::shared_ptr<CompletionSignal> create();

  CompletionSignal(const CompletionSignal&) = delete;
  CompletionSignal& operator=(const CompletionSignal&) = delete;

  // Terminal: returns the result (repeatable). Pending: replaces the stored
  // waker with `waker` and returns nullopt. Only the most recent waker is woken.
  std::optional<SignalResult> poll(Waker waker);
  // Like poll but never registers anything.
  std::optional<SignalResult> peek() const;

  // First call wins and returns true; later calls return false and change
  // nothing. Observers then the waker run after the lock is dropped; a
  // throwing waker or observer is logged and contained.
  bool complete(std::optional<Error> error) noexcept;

  // Parks the calling thread until terminal. nullopt on timeout; an unset
  // timeout waits indefinitely. Do not mix with poll on the same signal.
  std::optional<SignalResult> block_until_ready(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Clears the waiter slot if it still holds `waker_id`. A later completion
  // then finds nobody to wake.
  void detach(std::uint64_t waker_id) noexcept;
  // Clears the waiter slot whatever it holds.
  void clear_waiter() noexcept;

  // Runs `observer` once after the terminal transition, immediately if the
  // signal is already terminal.
  void on_terminal(Observer observer);

  SignalState state() const;
  bool has_waiter() const;

 private:
  CompletionSignal() = default;

  SignalResult result_locked_() const { return result_; }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  SignalState state_{SignalState::Pending};
  Waker waker_;
  // Written once under mu_ by the terminal transition, read-only afterwards.
  SignalResult result_;
  std::vector<Observer> observers_;
};

} // namespace async
} // namespace agd

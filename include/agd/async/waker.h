// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <utility>

namespace agd {
namespace async {

// Notification target for a pending signal. Copies share the same id; a fresh
// Waker always gets a new one.
class Waker {
 public:
  Waker() noexcept = default;
  explicit Waker(std::function<void()> fn) : fn_(std::move(fn)), id_(next_id()) {}

  void wake() const {
    if (fn_) fn_();
  }

  std::uint64_t id() const noexcept { return id_; }
  explicit operator bool() const noexcept { return static_cast<bool>(fn_); }

  static std::uint64_t next_id() noexcept;

 private:
  std::function<void()> fn_;
  std::uint64_t id_{0};
};

} // namespace async
} // namespace agd

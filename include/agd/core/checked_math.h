// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace agd {
namespace core {

[[nodiscard]] inline bool checked_add_size(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (b > std::numeric_limits<std::size_t>::max() - a) return false;
  out = a + b;
  return true;
}

[[nodiscard]] inline bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a > std::numeric_limits<std::size_t>::max() / b) return false;
  out = a * b;
  return true;
}

[[nodiscard]] inline bool checked_mul_i64(int64_t a, int64_t b, int64_t& out) noexcept {
  // Fast paths
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a == 1) { out = b; return true; }
  if (b == 1) { out = a; return true; }
  if (a == -1) {
    if (b == std::numeric_limits<int64_t>::min()) return false; // overflow
    out = -b; return true;
  }
  if (b == -1) {
    if (a == std::numeric_limits<int64_t>::min()) return false; // overflow
    out = -a; return true;
  }
  // General bound check: |a| <= max/|b|
  auto max = std::numeric_limits<int64_t>::max();
  if (a > 0) {
    if (b > 0) {
      if (a > max / b) return false;
    } else { // b < 0
      if (b < std::numeric_limits<int64_t>::min() / a) return false;
    }
  } else { // a < 0
    if (b > 0) {
      if (a < std::numeric_limits<int64_t>::min() / b) return false;
    } else { // b < 0
      if (a != 0 && b < max / a) return false;
    }
  }
  out = static_cast<int64_t>(a * b);
  return true;
}

// Product of non-negative dims; false on a negative dim or overflow.
[[nodiscard]] inline bool checked_numel(const int64_t* dims, std::size_t ndim, int64_t& out) noexcept {
  int64_t acc = 1;
  for (std::size_t i = 0; i < ndim; ++i) {
    if (dims[i] < 0) return false;
    if (!checked_mul_i64(acc, dims[i], acc)) return false;
  }
  out = acc;
  return true;
}

[[nodiscard]] inline bool is_pow2(std::size_t v) noexcept {
  return v != 0 && (v & (v - 1)) == 0;
}

} // namespace core
} // namespace agd

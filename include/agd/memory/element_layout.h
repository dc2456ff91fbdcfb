// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include "agd/core/checked_math.h"

namespace agd {
namespace memory {

// Which side's allocator created a region.
enum class Origin : std::uint8_t {
  Host = 0,
  Native = 1,
};

// Size and alignment of one element. A region is only ever viewed as the
// element type it was allocated for.
struct ElementLayout {
  std::size_t size{1};
  std::size_t alignment{1};

  template <class T>
  static constexpr ElementLayout of() noexcept {
    return ElementLayout{sizeof(T), alignof(T)};
  }

  static constexpr ElementLayout bytes() noexcept { return ElementLayout{1, 1}; }

  bool valid() const noexcept { return size > 0 && core::is_pow2(alignment); }

  friend constexpr bool operator==(const ElementLayout&, const ElementLayout&) = default;
};

} // namespace memory
} // namespace agd

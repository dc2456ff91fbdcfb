// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace agd {

// Runtime knobs read from AGD_CONF="key=value,key=value".
// Unknown keys and malformed values are ignored.
struct Config {
  std::size_t default_chunk_bytes{1u << 20};
  std::uint64_t default_wait_timeout_ms{0};  // 0 = unbounded
  std::size_t max_extension_chain{256};
  std::size_t host_alignment_bytes{64};      // normalized to pow2 >= alignof(max_align_t)
  bool poison_on_free{false};
  std::optional<int> min_log_level;

  // Parsed once from the environment on first use.
  static const Config& get();
};

Config parse_config(std::string_view conf);

} // namespace agd

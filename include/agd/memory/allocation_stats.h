// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace agd {
namespace memory {

// Process-wide ledger of allocations that may cross the boundary.
struct AllocationStats {
  std::uint64_t host_allocations{0};
  std::uint64_t host_frees{0};
  std::uint64_t live_host_bytes{0};
  std::uint64_t max_live_host_bytes{0};

  // Deleter contexts created by transfer_out and not yet reclaimed.
  std::uint64_t live_deleter_contexts{0};
  // Native deleters invoked on regions received through transfer_in.
  std::uint64_t native_deleter_calls{0};
};

AllocationStats allocation_stats() noexcept;

namespace detail {
void note_host_alloc(std::size_t bytes) noexcept;
void note_host_free(std::size_t bytes) noexcept;
void note_context_created() noexcept;
void note_context_freed() noexcept;
void note_native_deleter_call() noexcept;
} // namespace detail

} // namespace memory
} // namespace agd

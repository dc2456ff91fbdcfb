// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/memory/allocation_stats.h"

#include <atomic>

namespace agd {
namespace memory {

namespace {
std::atomic<std::uint64_t> g_host_allocs{0};
std::atomic<std::uint64_t> g_host_frees{0};
std::atomic<std::uint64_t> g_live_bytes{0};
std::atomic<std::uint64_t> g_max_live_bytes{0};
std::atomic<std::uint64_t> g_live_contexts{0};
std::atomic<std::uint64_t> g_native_deleter_calls{0};
} // namespace

AllocationStats allocation_stats() noexcept {
  AllocationStats s;
  s.host_allocations = g_host_allocs.load(std::memory_order_relaxed);
  s.host_frees = g_host_frees.load(std::memory_order_relaxed);
  s.live_host_bytes = g_live_bytes.load(std::memory_order_relaxed);
  s.max_live_host_bytes = g_max_live_bytes.load(std::memory_order_relaxed);
  s.live_deleter_contexts = g_live_contexts.load(std::memory_order_relaxed);
  s.native_deleter_calls = g_native_deleter_calls.load(std::memory_order_relaxed);
  return s;
}

namespace detail {

void note_host_alloc(std::size_t bytes) noexcept {
  g_host_allocs.fetch_add(1, std::memory_order_relaxed);
  const std::uint64_t now = g_live_bytes.fetch_add(bytes, std::memory_order_relaxed) + bytes;
  std::uint64_t prev = g_max_live_bytes.load(std::memory_order_relaxed);
  while (now > prev && !g_max_live_bytes.compare_exchange_weak(prev, now, std::memory_order_relaxed)) {
  }
}

void note_host_free(std::size_t bytes) noexcept {
  g_host_frees.fetch_add(1, std::memory_order_relaxed);
  g_live_bytes.fetch_sub(bytes, std::memory_order_relaxed);
}

void note_context_created() noexcept { g_live_contexts.fetch_add(1, std::memory_order_relaxed); }
void note_context_freed() noexcept { g_live_contexts.fetch_sub(1, std::memory_order_relaxed); }
void note_native_deleter_call() noexcept { g_native_deleter_calls.fetch_add(1, std::memory_order_relaxed); }

} // namespace detail

} // namespace memory
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <span>

#include "agd/memory/allocation.h"
#include "agd/memory/element_layout.h"
#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace memory {

// Everything host_deleter needs to release a handed-off block. Captured at
// hand-off time; the deleter never infers anything from the data pointer.
struct DeleterContext {
  std::size_t length{0};
  std::size_t capacity{0};
  ElementLayout layout{};
};

// agd_deleter_fn for blocks produced by transfer_out. `deleter_arg` is the
// DeleterContext; it is reclaimed here exactly once. Never throws.
void host_deleter(void* data, void* deleter_arg) noexcept;

// A host block on its way to the native side. Until release() is called the
// hand-off still owns the block and frees it on destruction.
class HandOff {
 public:
  HandOff() noexcept = default;
  ~HandOff();

  HandOff(const HandOff&) = delete;
  HandOff& operator=(const HandOff&) = delete;
  HandOff(HandOff&& other) noexcept;
  HandOff& operator=(HandOff&& other) noexcept;

  void* data() const noexcept { return chunk_.data; }
  std::size_t size_bytes() const noexcept { return chunk_.size; }
  agd_deleter_fn deleter() const noexcept { return chunk_.deleter; }
  void* deleter_arg() const noexcept { return chunk_.deleter_arg; }
  bool owns() const noexcept { return chunk_.deleter != nullptr; }

  // Gives the chunk to native code. From here on the receiver must call
  // chunk.deleter(chunk.data, chunk.deleter_arg) exactly once.
  [[nodiscard]] agd_chunk release() noexcept;

 private:
  friend HandOff transfer_out(HostAllocation&& alloc);
  explicit HandOff(agd_chunk chunk) noexcept : chunk_(chunk) {}

  agd_chunk chunk_{nullptr, 0, nullptr, nullptr};
};

// Consumes `alloc`. An empty allocation becomes (nullptr, 0, ctx) and its
// reserved capacity is released here.
HandOff transfer_out(HostAllocation&& alloc);

// A native-allocated region received by the host. The host never frees the
// bytes itself; the native deleter runs exactly once on reset or destruction.
class NativeRegion {
 public:
  NativeRegion() noexcept = default;
  ~NativeRegion();

  NativeRegion(const NativeRegion&) = delete;
  NativeRegion& operator=(const NativeRegion&) = delete;
  NativeRegion(NativeRegion&& other) noexcept;
  NativeRegion& operator=(NativeRegion&& other) noexcept;

  void* data() noexcept { return data_; }
  const void* data() const noexcept { return data_; }
  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  bool owns() const noexcept { return deleter_ != nullptr; }
  Origin origin() const noexcept { return Origin::Native; }

  std::span<const std::byte> bytes() const noexcept {
    return {static_cast<const std::byte*>(data_), size_};
  }

  // Allocate-then-copy into a host allocation of `layout`.
  HostAllocation copy_to_host(ElementLayout layout = ElementLayout::bytes()) const;

  void reset() noexcept;

 private:
  friend NativeRegion transfer_in(void*, std::size_t, agd_deleter_fn, void*);

  NativeRegion(void* data, std::size_t size, agd_deleter_fn deleter, void* arg) noexcept
      : data_(data), size_(size), deleter_(deleter), deleter_arg_(arg) {}

  void swap_(NativeRegion& other) noexcept;

  void* data_{nullptr};
  std::size_t size_{0};
  agd_deleter_fn deleter_{nullptr};
  void* deleter_arg_{nullptr};
};

// Takes ownership of a native region. Malformed input (null data with a
// non-zero size, or data without a deleter) is a validation error; a supplied
// deleter is still invoked once before the error is thrown.
NativeRegion transfer_in(void* data, std::size_t size, agd_deleter_fn deleter, void* deleter_arg);

inline NativeRegion transfer_in(const agd_chunk& chunk) {
  return transfer_in(chunk.data, chunk.size, chunk.deleter, chunk.deleter_arg);
}

// Releases a region a failed native call left behind, without validating it.
void discard_native(const agd_chunk& chunk) noexcept;

} // namespace memory
} // namespace agd

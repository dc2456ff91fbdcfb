// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "agd/async/event.h"
#include "agd/memory/allocation.h"
#include "agd/memory/ownership.h"
#include "agd/transfer/device_buffer.h"

namespace agd {
namespace runtime {
class Runtime;
} // namespace runtime

namespace transfer {

struct PendingUpload {
  DeviceBuffer buffer;
  async::Event done;
};

struct PendingDownload {
  memory::NativeRegion region;  // contents valid once `done` resolves
  async::Event done;
};

// Byte size of one element of `dtype`; throws for sub-byte or zero-width types.
std::size_t dtype_element_bytes(const DLDataType& dtype);

// Hands `host` to the plugin as a new device buffer of `dtype` and `dims`.
// The byte count must equal prod(dims) * element size; checked locally.
PendingUpload upload(const std::shared_ptr<const runtime::Runtime>& rt,
                     memory::HostAllocation&& host,
                     DLDataType dtype,
                     std::span<const std::int64_t> dims);

// The plugin allocates the host region and fills it asynchronously.
PendingDownload download(const DeviceBuffer& buffer);

// An offset copy through the raw-buffer capability. The host staging memory
// lives here until the copy resolves. Destroying a pending copy waits for it
// up to the drain timeout; past that the staging block is kept alive by the
// completion signal and freed when the copy finally resolves.
class PendingRawCopy {
 public:
  PendingRawCopy() = default;
  PendingRawCopy(memory::HostAllocation staging, async::Event done);
  ~PendingRawCopy();

  PendingRawCopy(PendingRawCopy&&) noexcept = default;
  PendingRawCopy& operator=(PendingRawCopy&& other) noexcept;

  async::Event& done() noexcept { return done_; }
  void wait() { done_.wait(); }
  // Waits, then gives up the staging allocation (the read result for
  // raw_copy_to_host).
  memory::HostAllocation take();

  // Defaults to Config::default_wait_timeout_ms; nullopt waits indefinitely.
  void set_drain_timeout(std::optional<std::chrono::milliseconds> timeout) noexcept {
    drain_timeout_ = timeout;
  }

 private:
  void drain_() noexcept;

  memory::HostAllocation staging_;
  async::Event done_;
  std::optional<std::chrono::milliseconds> drain_timeout_;
};

PendingRawCopy raw_copy_to_device(const DeviceBuffer& dst,
                                  std::span<const std::byte> bytes,
                                  std::int64_t offset);

PendingRawCopy raw_copy_to_host(const DeviceBuffer& src, std::int64_t offset, std::size_t size);

// Host address of a device buffer when the plugin supports it (raw-buffer
// revision 2); nullptr when the capability or the field is absent.
void* raw_host_pointer(const DeviceBuffer& buffer);

// Copies `bytes` into memory from the plugin's host allocator. The returned
// region is released with the plugin's free.
memory::NativeRegion stage_in_native_host(const std::shared_ptr<const runtime::Runtime>& rt,
                                          std::span<const std::byte> bytes);

} // namespace transfer
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace runtime {
class Runtime;
} // namespace runtime

namespace transfer {

// Move-only owner of a native agd_buffer; destroyed through buffer_destroy.
class DeviceBuffer {
 public:
  DeviceBuffer() noexcept = default;
  DeviceBuffer(std::shared_ptr<const runtime::Runtime> rt, agd_buffer* buffer) noexcept
      : rt_(std::move(rt)), buffer_(buffer) {}
  ~DeviceBuffer() { reset(); }

  DeviceBuffer(const DeviceBuffer&) = delete;
  DeviceBuffer& operator=(const DeviceBuffer&) = delete;
  DeviceBuffer(DeviceBuffer&& other) noexcept
      : rt_(std::move(other.rt_)), buffer_(std::exchange(other.buffer_, nullptr)) {}
  DeviceBuffer& operator=(DeviceBuffer&& other) noexcept {
    if (this != &other) {
      reset();
      rt_ = std::move(other.rt_);
      buffer_ = std::exchange(other.buffer_, nullptr);
    }
    return *this;
  }

  agd_buffer* get() const noexcept { return buffer_; }
  explicit operator bool() const noexcept { return buffer_ != nullptr; }
  const std::shared_ptr<const runtime::Runtime>& runtime() const noexcept { return rt_; }

  std::size_t size_in_bytes() const;
  void reset() noexcept;

 private:
  std::shared_ptr<const runtime::Runtime> rt_;
  agd_buffer* buffer_{nullptr};
};

} // namespace transfer
} // namespace agd

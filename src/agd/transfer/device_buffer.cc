// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/transfer/device_buffer.h"

#include "agd/core/error.h"
#include "agd/runtime/runtime.h"

namespace agd {
namespace transfer {

std::size_t DeviceBuffer::size_in_bytes() const {
  if (!buffer_) {
    throw validation_error(ErrorCode::FailedPrecondition, "DeviceBuffer: empty buffer");
  }
  std::size_t n = 0;
  rt_->check(rt_->api().buffer_size_in_bytes(buffer_, &n), "buffer_size_in_bytes");
  return n;
}

void DeviceBuffer::reset() noexcept {
  agd_buffer* b = std::exchange(buffer_, nullptr);
  if (b && rt_) {
    rt_->log_and_drop(rt_->api().buffer_destroy(b), "buffer_destroy");
  }
  rt_.reset();
}

} // namespace transfer
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/transfer/host_transfer.h"

#include <cstring>
#include <string>
#include <utility>

#include "agd/core/checked_math.h"
#include "agd/core/config.h"
#include "agd/extension/capabilities.h"
#include "agd/logging/logging.h"
#include "agd/runtime/runtime.h"

namespace agd {
namespace transfer {

namespace {

const std::shared_ptr<const runtime::Runtime>& require_buffer_(const DeviceBuffer& b, const char* who) {
  if (!b || !b.runtime()) {
    throw validation_error(ErrorCode::FailedPrecondition, std::string(who) + ": empty device buffer");
  }
  return b.runtime();
}

void check_range_(std::int64_t offset, std::size_t size, const char* who) {
  std::size_t end = 0;
  if (offset < 0 || !core::checked_add_size(static_cast<std::size_t>(offset), size, end) ||
      end > static_cast<std::size_t>(INT64_MAX)) {
    throw validation_error(ErrorCode::OutOfRange,
                           std::string(who) + ": invalid range offset=" + std::to_string(offset) +
                               " size=" + std::to_string(size));
  }
}

extension::CapabilityHandle<extension::RawBufferCapability> require_raw_(
    const runtime::Runtime& rt, const char* who) {
  auto cap = rt.extension<extension::RawBufferCapability>();
  if (!cap) {
    throw validation_error(ErrorCode::Unimplemented,
                           std::string(who) + ": plugin " + rt.name() + " has no raw-buffer extension");
  }
  return *cap;
}

} // namespace

std::size_t dtype_element_bytes(const DLDataType& dtype) {
  const std::size_t bits = static_cast<std::size_t>(dtype.bits) * static_cast<std::size_t>(dtype.lanes);
  if (bits == 0 || bits % 8 != 0) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "dtype with " + std::to_string(dtype.bits) + " bits x " +
                               std::to_string(dtype.lanes) + " lanes is not byte sized");
  }
  return bits / 8;
}

PendingUpload upload(const std::shared_ptr<const runtime::Runtime>& rt,
                     memory::HostAllocation&& host,
                     DLDataType dtype,
                     std::span<const std::int64_t> dims) {
  if (!rt) throw validation_error(ErrorCode::InvalidArgument, "upload: null runtime");
  memory::HostAllocation owned(std::move(host));
  const std::size_t elem = dtype_element_bytes(dtype);
  std::int64_t numel = 0;
  std::size_t expect = 0;
  if (!core::checked_numel(dims.data(), dims.size(), numel) ||
      !core::checked_mul_size(static_cast<std::size_t>(numel), elem, expect)) {
    throw validation_error(ErrorCode::InvalidArgument, "upload: invalid or overflowing dims");
  }
  if (expect != owned.size_bytes()) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "upload: shape needs " + std::to_string(expect) + " bytes, allocation has " +
                               std::to_string(owned.size_bytes()));
  }

  agd_chunk chunk = memory::transfer_out(std::move(owned)).release();
  agd_buffer* buf = nullptr;
  agd_event* ev = nullptr;
  // The chunk belongs to the plugin from here on, even on error.
  agd_error* err = rt->api().buffer_from_host_chunk(&chunk, dtype, dims.data(), dims.size(), &buf, &ev);
  if (err) {
    runtime::NativeLeftovers left{*rt, ev, buf};
    throw rt->translate(err, "buffer_from_host_chunk");
  }
  PendingUpload out{DeviceBuffer(rt, buf), async::Event(rt, ev)};
  if (!out.buffer) {
    throw internal_error("buffer_from_host_chunk succeeded without a buffer");
  }
  return out;
}

PendingDownload download(const DeviceBuffer& buffer) {
  const auto& rt = require_buffer_(buffer, "download");
  agd_chunk region{nullptr, 0, nullptr, nullptr};
  agd_event* ev = nullptr;
  agd_error* err = rt->api().buffer_to_host(buffer.get(), &region, &ev);
  if (err) {
    runtime::NativeLeftovers left{*rt, ev, nullptr, region};
    throw rt->translate(err, "buffer_to_host");
  }
  async::Event done(rt, ev);
  return PendingDownload{memory::transfer_in(region), std::move(done)};
}

// ---- PendingRawCopy ----

PendingRawCopy::~PendingRawCopy() { drain_(); }

PendingRawCopy::PendingRawCopy(memory::HostAllocation staging, async::Event done)
    : staging_(std::move(staging)), done_(std::move(done)) {
  const std::uint64_t ms = Config::get().default_wait_timeout_ms;
  if (ms != 0) drain_timeout_ = std::chrono::milliseconds(ms);
}

PendingRawCopy& PendingRawCopy::operator=(PendingRawCopy&& other) noexcept {
  if (this != &other) {
    drain_();
    staging_ = std::move(other.staging_);
    done_ = std::move(other.done_);
    drain_timeout_ = other.drain_timeout_;
  }
  return *this;
}

void PendingRawCopy::drain_() noexcept {
  if (!done_.valid() || staging_.capacity() == 0) return;
  // The plugin may still be reading or writing the staging block.
  try {
    done_.arm();
  } catch (const std::exception& ex) {
    AGD_LOG(WARNING) << "raw copy: could not observe completion: " << ex.what();
  }
  const std::shared_ptr<async::CompletionSignal> signal = done_.signal();
  if (signal->state() != async::SignalState::Pending) return;
  AGD_LOG(INFO) << "raw copy dropped before completion; waiting for the plugin";
  if (signal->block_until_ready(drain_timeout_)) return;

  AGD_LOG(WARNING) << "raw copy still pending after " << drain_timeout_->count()
                   << " ms; staging block kept until it completes";
  std::shared_ptr<memory::HostAllocation> keep;
  try {
    keep = std::make_shared<memory::HostAllocation>(std::move(staging_));
    signal->on_terminal([keep](const async::SignalResult&) {});
  } catch (const std::exception& ex) {
    AGD_LOG(ERROR) << "raw copy: could not defer staging release (" << ex.what() << "); leaking it";
    if (keep) (void)memory::detail::release_host_block(*keep);
    (void)memory::detail::release_host_block(staging_);
  }
}

memory::HostAllocation PendingRawCopy::take() {
  done_.wait();
  return std::move(staging_);
}

PendingRawCopy raw_copy_to_device(const DeviceBuffer& dst,
                                  std::span<const std::byte> bytes,
                                  std::int64_t offset) {
  const auto& rt = require_buffer_(dst, "raw_copy_to_device");
  check_range_(offset, bytes.size(), "raw_copy_to_device");
  auto cap = require_raw_(*rt, "raw_copy_to_device");

  memory::HostAllocation staging =
      memory::HostAllocation::copy_from_bytes(memory::ElementLayout::bytes(), bytes);
  agd_event* ev = nullptr;
  if (agd_error* err = cap->raw_copy_host_to_device(dst.get(), staging.data(), offset,
                                                    static_cast<std::int64_t>(bytes.size()), &ev)) {
    runtime::NativeLeftovers left{*rt, ev};
    throw rt->translate(err, "raw_copy_host_to_device");
  }
  return PendingRawCopy(std::move(staging), async::Event(rt, ev));
}

PendingRawCopy raw_copy_to_host(const DeviceBuffer& src, std::int64_t offset, std::size_t size) {
  const auto& rt = require_buffer_(src, "raw_copy_to_host");
  check_range_(offset, size, "raw_copy_to_host");
  auto cap = require_raw_(*rt, "raw_copy_to_host");

  memory::HostAllocation staging = memory::HostAllocation::zeros(memory::ElementLayout::bytes(), size);
  agd_event* ev = nullptr;
  if (agd_error* err = cap->raw_copy_device_to_host(src.get(), staging.data(), offset,
                                                    static_cast<std::int64_t>(size), &ev)) {
    runtime::NativeLeftovers left{*rt, ev};
    throw rt->translate(err, "raw_copy_device_to_host");
  }
  return PendingRawCopy(std::move(staging), async::Event(rt, ev));
}

void* raw_host_pointer(const DeviceBuffer& buffer) {
  const auto& rt = require_buffer_(buffer, "raw_host_pointer");
  auto cap = rt->extension<extension::RawBufferCapability>();
  if (!cap || !cap->provides(extension::RawBufferCapability::kHostPointerEnd) ||
      !(*cap)->raw_get_host_pointer) {
    return nullptr;
  }
  void* p = nullptr;
  rt->check((*cap)->raw_get_host_pointer(buffer.get(), &p), "raw_get_host_pointer");
  return p;
}

memory::NativeRegion stage_in_native_host(const std::shared_ptr<const runtime::Runtime>& rt,
                                          std::span<const std::byte> bytes) {
  if (!rt) throw validation_error(ErrorCode::InvalidArgument, "stage_in_native_host: null runtime");
  auto cap = rt->extension<extension::HostAllocatorCapability>();
  if (!cap) {
    throw validation_error(ErrorCode::Unimplemented,
                           "stage_in_native_host: plugin " + rt->name() + " has no host allocator");
  }
  if (bytes.empty()) return memory::NativeRegion();
  if (!(*cap)->host_allocate || !(*cap)->host_free) {
    throw internal_error("host allocator extension with null functions");
  }
  std::size_t align = (*cap)->preferred_alignment;
  if (!core::is_pow2(align)) align = alignof(std::max_align_t);

  void* p = nullptr;
  rt->check((*cap)->host_allocate(bytes.size(), align, &p), "host_allocate");
  memory::NativeRegion region = memory::transfer_in(p, bytes.size(), (*cap)->host_free, (*cap)->host_free_arg);
  std::memcpy(region.data(), bytes.data(), bytes.size());
  return region;
}

} // namespace transfer
} // namespace agd

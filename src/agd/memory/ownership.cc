// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/memory/ownership.h"

#include <memory>
#include <new>
#include <string>
#include <utility>

#include "agd/logging/logging.h"
#include "agd/memory/allocation_stats.h"

namespace agd {
namespace memory {

void host_deleter(void* data, void* deleter_arg) noexcept {
  if (!deleter_arg) {
    AGD_LOG(ERROR) << "host_deleter called without a deleter context; block leaked";
    return;
  }
  std::unique_ptr<DeleterContext> ctx(static_cast<DeleterContext*>(deleter_arg));
  if (data) {
    detail::free_host_block(data, ctx->layout, ctx->capacity);
  }
  detail::note_context_freed();
}

// ---- HandOff ----

HandOff::~HandOff() {
  if (chunk_.deleter) {
    chunk_.deleter(chunk_.data, chunk_.deleter_arg);
  }
}

HandOff::HandOff(HandOff&& other) noexcept
    : chunk_(std::exchange(other.chunk_, agd_chunk{nullptr, 0, nullptr, nullptr})) {}

HandOff& HandOff::operator=(HandOff&& other) noexcept {
  if (this != &other) {
    HandOff tmp(std::move(other));
    std::swap(chunk_, tmp.chunk_);
  }
  return *this;
}

agd_chunk HandOff::release() noexcept {
  return std::exchange(chunk_, agd_chunk{nullptr, 0, nullptr, nullptr});
}

HandOff transfer_out(HostAllocation&& alloc) {
  HostAllocation owned(std::move(alloc));
  // Context first: if this throws, `owned` still frees the block.
  auto ctx = std::make_unique<DeleterContext>();
  ctx->length = owned.length();
  ctx->capacity = owned.capacity();
  ctx->layout = owned.layout();

  agd_chunk chunk{nullptr, 0, &host_deleter, nullptr};
  if (owned.empty()) {
    ctx->length = 0;
    ctx->capacity = 0;
    owned.reset();
  } else {
    chunk.size = owned.size_bytes();
    chunk.data = detail::release_host_block(owned);
  }
  chunk.deleter_arg = ctx.release();
  detail::note_context_created();
  return HandOff(chunk);
}

// ---- NativeRegion ----

NativeRegion::~NativeRegion() { reset(); }

NativeRegion::NativeRegion(NativeRegion&& other) noexcept { swap_(other); }

NativeRegion& NativeRegion::operator=(NativeRegion&& other) noexcept {
  if (this != &other) {
    reset();
    swap_(other);
  }
  return *this;
}

void NativeRegion::swap_(NativeRegion& other) noexcept {
  std::swap(data_, other.data_);
  std::swap(size_, other.size_);
  std::swap(deleter_, other.deleter_);
  std::swap(deleter_arg_, other.deleter_arg_);
}

void NativeRegion::reset() noexcept {
  agd_deleter_fn d = std::exchange(deleter_, nullptr);
  void* p = std::exchange(data_, nullptr);
  void* arg = std::exchange(deleter_arg_, nullptr);
  size_ = 0;
  if (d) {
    d(p, arg);
    detail::note_native_deleter_call();
  }
}

HostAllocation NativeRegion::copy_to_host(ElementLayout layout) const {
  return HostAllocation::copy_from_bytes(layout, bytes());
}

NativeRegion transfer_in(void* data, std::size_t size, agd_deleter_fn deleter, void* deleter_arg) {
  auto reject = [&](const std::string& why) -> Error {
    if (deleter) {
      deleter(data, deleter_arg);
      detail::note_native_deleter_call();
    } else if (data) {
      AGD_LOG(ERROR) << "transfer_in: native region at " << data << " has no deleter; leaked";
    }
    return validation_error(ErrorCode::InvalidArgument, "transfer_in: " + why);
  };
  if (!data && size != 0) {
    throw reject("null data with size " + std::to_string(size));
  }
  if (data && !deleter) {
    throw reject("non-null data without a deleter");
  }
  return NativeRegion(data, size, deleter, deleter_arg);
}

void discard_native(const agd_chunk& chunk) noexcept {
  if (!chunk.deleter) {
    if (chunk.data) AGD_LOG(ERROR) << "discarded native region at " << chunk.data << " has no deleter; leaked";
    return;
  }
  chunk.deleter(chunk.data, chunk.deleter_arg);
  detail::note_native_deleter_call();
}

} // namespace memory
} // namespace agd

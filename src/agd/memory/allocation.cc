// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/memory/allocation.h"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

#include "agd/core/checked_math.h"
#include "agd/core/config.h"
#include "agd/memory/allocation_stats.h"

namespace agd {
namespace memory {

namespace detail {

std::size_t host_block_alignment(const ElementLayout& layout) noexcept {
  return std::max(layout.alignment, Config::get().host_alignment_bytes);
}

void free_host_block(void* p, const ElementLayout& layout, std::size_t capacity) noexcept {
  if (!p) return;
  const std::size_t bytes = capacity * layout.size;
  if (Config::get().poison_on_free) {
    std::memset(p, 0xDB, bytes);
  }
  ::operator delete(p, bytes, std::align_val_t(host_block_alignment(layout)));
  note_host_free(bytes);
}

void* release_host_block(HostAllocation& a) noexcept {
  void* p = std::exchange(a.data_, nullptr);
  a.length_ = 0;
  a.capacity_ = 0;
  return p;
}

} // namespace detail

namespace {

void* allocate_block_(const ElementLayout& layout, std::size_t capacity) {
  if (!layout.valid()) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "HostAllocation: element layout must have non-zero size and pow2 alignment");
  }
  if (capacity == 0) return nullptr;
  std::size_t bytes = 0;
  if (!core::checked_mul_size(capacity, layout.size, bytes)) {
    throw validation_error(ErrorCode::ResourceExhausted, "HostAllocation: size overflow");
  }
  void* p = ::operator new(bytes, std::align_val_t(detail::host_block_alignment(layout)));
  detail::note_host_alloc(bytes);
  return p;
}

} // namespace

HostAllocation::~HostAllocation() { reset(); }

HostAllocation::HostAllocation(HostAllocation&& other) noexcept { swap_(other); }

HostAllocation& HostAllocation::operator=(HostAllocation&& other) noexcept {
  if (this != &other) {
    reset();
    swap_(other);
  }
  return *this;
}

void HostAllocation::swap_(HostAllocation& other) noexcept {
  std::swap(data_, other.data_);
  std::swap(layout_, other.layout_);
  std::swap(length_, other.length_);
  std::swap(capacity_, other.capacity_);
}

HostAllocation HostAllocation::with_capacity(ElementLayout layout, std::size_t capacity) {
  void* p = allocate_block_(layout, capacity);
  return HostAllocation(p, layout, 0, capacity);
}

HostAllocation HostAllocation::zeros(ElementLayout layout, std::size_t length) {
  void* p = allocate_block_(layout, length);
  if (p) std::memset(p, 0, length * layout.size);
  return HostAllocation(p, layout, length, length);
}

HostAllocation HostAllocation::copy_from_bytes(ElementLayout layout, std::span<const std::byte> bytes) {
  if (!layout.valid()) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "HostAllocation: element layout must have non-zero size and pow2 alignment");
  }
  if (bytes.size() % layout.size != 0) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "HostAllocation: " + std::to_string(bytes.size()) +
                               " bytes is not a whole number of " + std::to_string(layout.size) +
                               "-byte elements");
  }
  const std::size_t n = bytes.size() / layout.size;
  void* p = allocate_block_(layout, n);
  if (n) std::memcpy(p, bytes.data(), bytes.size());
  return HostAllocation(p, layout, n, n);
}

void HostAllocation::check_view_(const ElementLayout& want) const {
  if (!(want == layout_)) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "HostAllocation: typed view of size " + std::to_string(want.size) +
                               "/align " + std::to_string(want.alignment) +
                               " does not match allocation layout " + std::to_string(layout_.size) +
                               "/" + std::to_string(layout_.alignment));
  }
}

void HostAllocation::resize(std::size_t length) {
  if (length > capacity_) {
    throw validation_error(ErrorCode::OutOfRange,
                           "HostAllocation::resize: length " + std::to_string(length) +
                               " exceeds capacity " + std::to_string(capacity_));
  }
  if (length > length_) {
    std::memset(static_cast<std::byte*>(data_) + length_ * layout_.size, 0,
                (length - length_) * layout_.size);
  }
  length_ = length;
}

void HostAllocation::reset() noexcept {
  if (data_) {
    detail::free_host_block(data_, layout_, capacity_);
  }
  data_ = nullptr;
  length_ = 0;
  capacity_ = 0;
}

} // namespace memory
} // namespace agd

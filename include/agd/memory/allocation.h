// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "agd/core/error.h"
#include "agd/memory/element_layout.h"

namespace agd {
namespace memory {

class HostAllocation;

namespace detail {
// Alignment actually used for a host block of `layout`. Deterministic for the
// life of the process, so a deleter can rebuild it from the layout alone.
std::size_t host_block_alignment(const ElementLayout& layout) noexcept;
// Releases a block created by HostAllocation with the matching aligned delete.
void free_host_block(void* p, const ElementLayout& layout, std::size_t capacity) noexcept;
// Hands the block out of `a`, leaving it empty. Used by transfer_out.
void* release_host_block(HostAllocation& a) noexcept;
} // namespace detail

// Contiguous host-allocated elements. Move-only; owns its block.
class HostAllocation {
 public:
  HostAllocation() noexcept = default;
  ~HostAllocation();

  HostAllocation(const HostAllocation&) = delete;
  HostAllocation& operator=(const HostAllocation&) = delete;
  HostAllocation(HostAllocation&& other) noexcept;
  HostAllocation& operator=(HostAllocation&& other) noexcept;

  // Reserves `capacity` elements; length starts at 0.
  static HostAllocation with_capacity(ElementLayout layout, std::size_t capacity);
  // `length` zero-filled elements.
  static HostAllocation zeros(ElementLayout layout, std::size_t length);
  // Allocates `layout` storage and copies `bytes` into it. The byte count must be
  // a whole number of elements; no in-place reinterpretation happens.
  static HostAllocation copy_from_bytes(ElementLayout layout, std::span<const std::byte> bytes);

  template <class T>
  static HostAllocation copy_from(std::span<const T> values) {
    return copy_from_bytes(ElementLayout::of<T>(), std::as_bytes(values));
  }

  void* data() noexcept { return data_; }
  const void* data() const noexcept { return data_; }
  std::size_t length() const noexcept { return length_; }
  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t size_bytes() const noexcept { return length_ * layout_.size; }
  const ElementLayout& layout() const noexcept { return layout_; }
  Origin origin() const noexcept { return Origin::Host; }
  bool empty() const noexcept { return length_ == 0; }

  std::span<std::byte> bytes() noexcept {
    return {static_cast<std::byte*>(data_), size_bytes()};
  }
  std::span<const std::byte> bytes() const noexcept {
    return {static_cast<const std::byte*>(data_), size_bytes()};
  }

  // Typed view; throws a validation error unless T matches the layout.
  template <class T>
  std::span<T> view() {
    check_view_(ElementLayout::of<T>());
    return {static_cast<T*>(data_), length_};
  }
  template <class T>
  std::span<const T> view() const {
    check_view_(ElementLayout::of<T>());
    return {static_cast<const T*>(data_), length_};
  }

  // Sets the element count within the reserved capacity. New elements are zeroed.
  void resize(std::size_t length);
  void reset() noexcept;

 private:
  friend void* detail::release_host_block(HostAllocation& a) noexcept;

  HostAllocation(void* data, ElementLayout layout, std::size_t length, std::size_t capacity) noexcept
      : data_(data), layout_(layout), length_(length), capacity_(capacity) {}

  void check_view_(const ElementLayout& want) const;
  void swap_(HostAllocation& other) noexcept;

  void* data_{nullptr};
  ElementLayout layout_{};
  std::size_t length_{0};
  std::size_t capacity_{0};
};

} // namespace memory
} // namespace agd

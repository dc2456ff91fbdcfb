// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace extension {

class ExtensionChain;

template <class Cap>
class CapabilityHandle;

// Finds the first record tagged Cap::kType. A record whose struct_size does not
// cover Cap::kRequiredSize is reported as absent. Absence is not an error.
// `owner` is kept alive by the returned handle.
template <class Cap>
std::optional<CapabilityHandle<Cap>> resolve(const ExtensionChain& chain,
                                             std::shared_ptr<const void> owner = {});

namespace detail {
// Logs the struct_size rejection; kept out of line so the template stays small.
void warn_struct_size(const char* cap_name, std::size_t have, std::size_t need);
} // namespace detail

// Read-only view of a plugin's extension list. Nodes are owned by the plugin;
// the head is only reachable through resolve().
class ExtensionChain {
 public:
  ExtensionChain() noexcept = default;
  ExtensionChain(const agd_extension_base* head, std::size_t max_walk) noexcept
      : head_(head), max_walk_(max_walk) {}

  bool contains(std::int32_t type) const noexcept { return find_(type) != nullptr; }
  bool empty() const noexcept { return head_ == nullptr; }
  // Number of nodes reachable within the walk bound.
  std::size_t length() const noexcept;

 private:
  template <class Cap>
  friend std::optional<CapabilityHandle<Cap>> resolve(const ExtensionChain& chain,
                                                      std::shared_ptr<const void> owner);

  const agd_extension_base* find_(std::int32_t type) const noexcept;

  const agd_extension_base* head_{nullptr};
  std::size_t max_walk_{256};
};

// Validated pointer to one capability record, co-owning whatever keeps the
// record alive (normally the Runtime).
template <class Cap>
class CapabilityHandle {
 public:
  using Record = typename Cap::Record;

  const Record& operator*() const noexcept { return *record_; }
  const Record* operator->() const noexcept { return record_; }
  const Record* get() const noexcept { return record_; }

  std::size_t struct_size() const noexcept { return record_->base.struct_size; }
  // Whether a trailing field ending at `field_end` is present; see
  // AGD_EXTENSION_FIELD_END.
  bool provides(std::size_t field_end) const noexcept { return struct_size() >= field_end; }

  friend bool operator==(const CapabilityHandle& a, const CapabilityHandle& b) noexcept {
    return a.record_ == b.record_;
  }

 private:
  template <class C>
  friend std::optional<CapabilityHandle<C>> resolve(const ExtensionChain& chain,
                                                    std::shared_ptr<const void> owner);

  CapabilityHandle(const Record* record, std::shared_ptr<const void> owner) noexcept
      : record_(record), owner_(std::move(owner)) {}

  const Record* record_;
  std::shared_ptr<const void> owner_;
};

template <class Cap>
std::optional<CapabilityHandle<Cap>> resolve(const ExtensionChain& chain,
                                             std::shared_ptr<const void> owner) {
  const agd_extension_base* node = chain.find_(Cap::kType);
  if (!node) return std::nullopt;
  if (node->struct_size < Cap::kRequiredSize) {
    detail::warn_struct_size(Cap::kName, node->struct_size, Cap::kRequiredSize);
    return std::nullopt;
  }
  // Every record starts with its agd_extension_base.
  const auto* record = reinterpret_cast<const typename Cap::Record*>(node);
  return CapabilityHandle<Cap>(record, std::move(owner));
}

} // namespace extension
} // namespace agd

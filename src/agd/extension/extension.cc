// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/extension/extension.h"

#include "agd/logging/logging.h"

namespace agd {
namespace extension {

namespace detail {

void warn_struct_size(const char* cap_name, std::size_t have, std::size_t need) {
  AGD_LOG(WARNING) << "extension '" << cap_name << "' record too small (struct_size=" << have
                   << ", need " << need << "); treating capability as absent";
}

} // namespace detail

const agd_extension_base* ExtensionChain::find_(std::int32_t type) const noexcept {
  const agd_extension_base* node = head_;
  std::size_t visited = 0;
  while (node) {
    if (visited == max_walk_) {
      AGD_LOG(WARNING) << "extension chain longer than " << max_walk_
                       << " nodes (or cyclic); stopping walk";
      return nullptr;
    }
    ++visited;
    if (node->type == type) return node;
    node = node->next;
  }
  return nullptr;
}

std::size_t ExtensionChain::length() const noexcept {
  std::size_t n = 0;
  for (const agd_extension_base* node = head_; node && n < max_walk_; node = node->next) ++n;
  return n;
}

} // namespace extension
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace extension {

// Capability tags. kRequiredSize is the end of the last field the host reads
// unconditionally; later optional fields are checked with provides().

struct StreamCapability {
  using Record = agd_stream_extension;
  static constexpr std::int32_t kType = AGD_EXTENSION_TYPE_STREAM;
  static constexpr std::size_t kRequiredSize =
      AGD_EXTENSION_FIELD_END(agd_stream_extension, copy_stream_take_buffer);
  static constexpr const char* kName = "stream";

  // Revision 2
  static constexpr std::size_t kSetErrorEnd =
      AGD_EXTENSION_FIELD_END(agd_stream_extension, copy_stream_set_error);
};

struct RawBufferCapability {
  using Record = agd_raw_buffer_extension;
  static constexpr std::int32_t kType = AGD_EXTENSION_TYPE_RAW_BUFFER;
  static constexpr std::size_t kRequiredSize =
      AGD_EXTENSION_FIELD_END(agd_raw_buffer_extension, raw_copy_device_to_host);
  static constexpr const char* kName = "raw_buffer";

  // Revision 2
  static constexpr std::size_t kHostPointerEnd =
      AGD_EXTENSION_FIELD_END(agd_raw_buffer_extension, raw_get_host_pointer);
};

struct HostAllocatorCapability {
  using Record = agd_host_allocator_extension;
  static constexpr std::int32_t kType = AGD_EXTENSION_TYPE_HOST_ALLOCATOR;
  static constexpr std::size_t kRequiredSize =
      AGD_EXTENSION_FIELD_END(agd_host_allocator_extension, preferred_alignment);
  static constexpr const char* kName = "host_allocator";
};

} // namespace extension
} // namespace agd

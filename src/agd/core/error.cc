// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/core/error.h"

namespace agd {

ErrorCode error_code_from_raw(std::int32_t raw) noexcept {
  if (raw < static_cast<std::int32_t>(ErrorCode::Cancelled) ||
      raw > static_cast<std::int32_t>(ErrorCode::Unauthenticated)) {
    return ErrorCode::Unknown;
  }
  return static_cast<ErrorCode>(raw);
}

const char* error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Native: return "native";
    case ErrorKind::Internal: return "internal";
  }
  return "unknown";
}

} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace agd {

// Mirrors agd_error_code; numeric values are stable.
enum class ErrorCode : std::int32_t {
  Cancelled = 1,
  Unknown = 2,
  InvalidArgument = 3,
  DeadlineExceeded = 4,
  NotFound = 5,
  AlreadyExists = 6,
  PermissionDenied = 7,
  ResourceExhausted = 8,
  FailedPrecondition = 9,
  Aborted = 10,
  OutOfRange = 11,
  Unimplemented = 12,
  Internal = 13,
  Unavailable = 14,
  DataLoss = 15,
  Unauthenticated = 16,
};

// Where an error originated.
//   Validation: rejected locally, nothing crossed the boundary.
//   Native:     reported by the plugin, synchronously or through an event.
//   Internal:   a fault inside host code reached from a native callback, or a
//               broken boundary contract.
enum class ErrorKind : std::uint8_t {
  Validation = 0,
  Native = 1,
  Internal = 2,
};

namespace detail {
inline constexpr std::size_t kMaxErrorWhatBytes = 1024;

inline std::string truncate_bytes(std::string s, std::size_t max) {
  if (s.size() <= max) return s;
  s.resize(max);
  return s;
}
} // namespace detail

// Codes outside the known range collapse to Unknown.
ErrorCode error_code_from_raw(std::int32_t raw) noexcept;
const char* error_kind_name(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, ErrorCode code, std::string message, std::string_view function = {})
      : std::runtime_error(detail::truncate_bytes(std::move(message), detail::kMaxErrorWhatBytes)),
        kind_(kind),
        code_(code),
        function_(function) {}

  ErrorKind kind() const noexcept { return kind_; }
  ErrorCode code() const noexcept { return code_; }
  // Native entry point the error came from; empty for host-side errors.
  std::string_view function() const noexcept { return function_; }

 private:
  ErrorKind kind_;
  ErrorCode code_;
  std::string function_;
};

inline Error validation_error(ErrorCode code, std::string message) {
  return Error(ErrorKind::Validation, code, std::move(message));
}

inline Error internal_error(std::string message) {
  return Error(ErrorKind::Internal, ErrorCode::Internal, std::move(message));
}

} // namespace agd

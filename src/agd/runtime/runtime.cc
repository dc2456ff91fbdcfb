// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/runtime/runtime.h"

#include <memory>
#include <utility>

#include "agd/core/config.h"
#include "agd/logging/logging.h"
#include "agd/memory/ownership.h"

namespace agd {
namespace runtime {

namespace {

// Last field of the version 1.0 table.
constexpr std::size_t kMinApiSize = AGD_EXTENSION_FIELD_END(agd_api, buffer_destroy);
constexpr std::size_t kHostEventsEnd = AGD_EXTENSION_FIELD_END(agd_api, event_set);

[[noreturn]] void reject_(const std::string& name, ErrorCode code, const std::string& why) {
  AGD_LOG(WARNING) << "rejecting plugin " << name << ": " << why;
  throw validation_error(code, "plugin " + name + ": " + why);
}

} // namespace

std::shared_ptr<Runtime> Runtime::wrap(const agd_api* api,
                                       std::shared_ptr<const void> keepalive,
                                       std::string name) {
  if (!api) reject_(name, ErrorCode::InvalidArgument, "null api table");
  if (api->struct_size < kMinApiSize) {
    reject_(name, ErrorCode::FailedPrecondition,
            "api struct_size " + std::to_string(api->struct_size) + " < " +
                std::to_string(kMinApiSize));
  }
  if (api->abi_major != AGD_PLUGIN_ABI_VERSION_MAJOR ||
      api->abi_minor > AGD_PLUGIN_ABI_VERSION_MINOR) {
    reject_(name, ErrorCode::FailedPrecondition,
            "ABI mismatch: host " + std::to_string(AGD_PLUGIN_ABI_VERSION_MAJOR) + "." +
                std::to_string(AGD_PLUGIN_ABI_VERSION_MINOR) + " vs table " +
                std::to_string(api->abi_major) + "." + std::to_string(api->abi_minor));
  }

  NativeApi a;
  a.abi_major = api->abi_major;
  a.abi_minor = api->abi_minor;
#define AGD_COPY_REQUIRED(field)                                                     \
  do {                                                                               \
    if (!api->field) reject_(name, ErrorCode::FailedPrecondition,                    \
                             "missing function pointer: " #field);                   \
    a.field = api->field;                                                            \
  } while (0)
  AGD_COPY_REQUIRED(error_destroy);
  AGD_COPY_REQUIRED(error_message);
  AGD_COPY_REQUIRED(error_get_code);
  AGD_COPY_REQUIRED(event_destroy);
  AGD_COPY_REQUIRED(event_is_ready);
  AGD_COPY_REQUIRED(event_error);
  AGD_COPY_REQUIRED(event_on_ready);
  AGD_COPY_REQUIRED(buffer_from_host_chunk);
  AGD_COPY_REQUIRED(buffer_to_host);
  AGD_COPY_REQUIRED(buffer_size_in_bytes);
  AGD_COPY_REQUIRED(buffer_destroy);
#undef AGD_COPY_REQUIRED
  a.event_await = api->event_await;
  if (api->struct_size >= kHostEventsEnd && api->event_create && api->event_set) {
    a.event_create = api->event_create;
    a.event_set = api->event_set;
  } else if (api->struct_size >= kHostEventsEnd && (api->event_create || api->event_set)) {
    AGD_LOG(WARNING) << "plugin " << name << " provides only one of event_create/event_set; host events disabled";
  }

  return std::shared_ptr<Runtime>(
      new Runtime(a, api->extension_start, std::move(keepalive), std::move(name)));
}

Runtime::Runtime(const NativeApi& api, const agd_extension_base* ext_head,
                 std::shared_ptr<const void> keepalive, std::string name)
    : api_(api),
      chain_(ext_head, Config::get().max_extension_chain),
      keepalive_(std::move(keepalive)),
      name_(std::move(name)) {}

Error Runtime::translate(agd_error* err, std::string_view function) const {
  if (!err) {
    return internal_error("translate called without an error from " + std::string(function));
  }
  // Destroyed on every path, including a throwing accessor.
  std::unique_ptr<agd_error, void (*)(agd_error*)> owned(err, api_.error_destroy);
  const char* msg = nullptr;
  std::size_t msg_size = 0;
  api_.error_message(owned.get(), &msg, &msg_size);
  const ErrorCode code = error_code_from_raw(static_cast<std::int32_t>(api_.error_get_code(owned.get())));
  std::string text = (msg && msg_size) ? std::string(msg, msg_size) : std::string("<no message>");
  return Error(ErrorKind::Native, code, std::string(function) + ": " + text, function);
}

void Runtime::log_and_drop(agd_error* err, std::string_view function) const noexcept {
  if (!err) return;
  try {
    Error e = translate(err, function);
    AGD_LOG(WARNING) << "ignoring native error in release path: " << e.what();
  } catch (const std::exception& ex) {
    AGD_LOG(ERROR) << "fault while reading native error from " << function << ": " << ex.what();
  }
}

NativeLeftovers::~NativeLeftovers() {
  if (event) rt.log_and_drop(rt.api().event_destroy(event), "event_destroy");
  if (buffer) rt.log_and_drop(rt.api().buffer_destroy(buffer), "buffer_destroy");
  // Not validated: the native error is what gets reported.
  memory::discard_native(region);
}

} // namespace runtime
} // namespace agd

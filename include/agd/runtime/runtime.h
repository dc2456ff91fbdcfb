// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "agd/core/error.h"
#include "agd/extension/extension.h"
#include "agd/plugin/agd_plugin.h"

namespace agd {
namespace runtime {

// Host copy of a plugin's function table. The extension list is deliberately
// not part of it; see Runtime::extensions().
struct NativeApi {
  std::uint32_t abi_major{0};
  std::uint32_t abi_minor{0};

  void (*error_destroy)(agd_error*){nullptr};
  void (*error_message)(const agd_error*, const char**, std::size_t*){nullptr};
  agd_error_code (*error_get_code)(const agd_error*){nullptr};

  agd_error* (*event_destroy)(agd_event*){nullptr};
  agd_error* (*event_is_ready)(agd_event*, int*){nullptr};
  agd_error* (*event_error)(agd_event*){nullptr};
  agd_error* (*event_await)(agd_event*){nullptr};  // optional
  agd_error* (*event_on_ready)(agd_event*, agd_event_callback_fn, void*){nullptr};

  agd_error* (*buffer_from_host_chunk)(agd_chunk*, DLDataType, const int64_t*, std::size_t,
                                       agd_buffer**, agd_event**){nullptr};
  agd_error* (*buffer_to_host)(agd_buffer*, agd_chunk*, agd_event**){nullptr};
  agd_error* (*buffer_size_in_bytes)(agd_buffer*, std::size_t*){nullptr};
  agd_error* (*buffer_destroy)(agd_buffer*){nullptr};

  // ABI 1.1, both or neither.
  agd_error* (*event_create)(agd_event**){nullptr};
  agd_error* (*event_set)(agd_event*, agd_error_code, const char*, std::size_t){nullptr};

  bool has_host_events() const noexcept { return event_create && event_set; }
};

// Root handle for one plugin. Everything that talks to the plugin co-owns it,
// so the function table and extension records outlive every handle, event
// and buffer created through it.
class Runtime : public std::enable_shared_from_this<Runtime> {
 public:
  // Validates and copies `api`. `keepalive` is held for the runtime's lifetime
  // (e.g. whatever owns the table's storage).
  static std::shared_ptr<Runtime> wrap(const agd_api* api,
                                       std::shared_ptr<const void> keepalive = {},
                                       std::string name = "<in-process>");

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  const NativeApi& api() const noexcept { return api_; }
  const extension::ExtensionChain& extensions() const noexcept { return chain_; }
  const std::string& name() const noexcept { return name_; }

  template <class Cap>
  std::optional<extension::CapabilityHandle<Cap>> extension() const {
    return extension::resolve<Cap>(chain_, shared_from_this());
  }

  // Converts a native error into an agd::Error and destroys the handle.
  Error translate(agd_error* err, std::string_view function) const;
  // Throws the translated error when `err` is non-null.
  void check(agd_error* err, std::string_view function) const {
    if (err) throw translate(err, function);
  }
  // For release paths that cannot throw: destroys `err` and logs it.
  void log_and_drop(agd_error* err, std::string_view function) const noexcept;

 private:
  Runtime(const NativeApi& api, const agd_extension_base* ext_head,
          std::shared_ptr<const void> keepalive, std::string name);

  NativeApi api_;
  extension::ExtensionChain chain_;
  std::shared_ptr<const void> keepalive_;
  std::string name_;
};

// Whatever a failed native call still returned through its out-parameters.
// Released on scope exit, so declare it before translating the error:
//
//   if (err) {
//     NativeLeftovers left{*rt, ev};
//     throw rt->translate(err, "...");
//   }
struct NativeLeftovers {
  const Runtime& rt;
  agd_event* event{nullptr};
  agd_buffer* buffer{nullptr};
  agd_chunk region{nullptr, 0, nullptr, nullptr};

  ~NativeLeftovers();
};

} // namespace runtime
} // namespace agd

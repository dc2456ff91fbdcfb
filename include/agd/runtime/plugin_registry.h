// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "agd/runtime/runtime.h"

namespace agd {
namespace runtime {

// Loads plugin shared objects by explicit path. Successfully loaded libraries
// are never unloaded: native threads may still be running plugin code when
// the host is done with it.
class PluginRegistry {
 public:
  PluginRegistry() = default;
  // Does not dlclose anything.
  ~PluginRegistry() = default;

  PluginRegistry(const PluginRegistry&) = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  // Throws agd::Error: NotFound for dlopen/dlsym failures, FailedPrecondition
  // for ABI mismatches or malformed tables. Loading the same library twice
  // returns the same runtime.
  std::shared_ptr<Runtime> load(const std::string& path);

  // Diagnostics helpers used by tests.
  std::vector<std::string> loaded_libraries() const;
  bool is_loaded(const std::string& path) const;

 private:
  struct Library {
    void* dl_handle{nullptr};
    std::shared_ptr<Runtime> runtime;
  };

  mutable std::mutex mu_;
  std::map<std::string, Library> libraries_;  // canonical path -> library
};

} // namespace runtime
} // namespace agd

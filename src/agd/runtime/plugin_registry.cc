// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/runtime/plugin_registry.h"

#include <dlfcn.h>
#include <limits.h>
#include <stdlib.h>

#include <utility>

#include "agd/logging/logging.h"

namespace agd {
namespace runtime {

namespace {

std::string canonical_path_(const std::string& path) {
  char buf[PATH_MAX];
  const char* canon = ::realpath(path.c_str(), buf);
  return canon ? std::string(canon) : path;
}

[[noreturn]] void fail_(void* handle, ErrorCode code, const std::string& msg) {
  if (handle) dlclose(handle);
  throw validation_error(code, "loader: " + msg);
}

} // namespace

std::shared_ptr<Runtime> PluginRegistry::load(const std::string& path) {
  if (path.empty()) {
    throw validation_error(ErrorCode::InvalidArgument, "loader: empty path");
  }
  const std::string canon = canonical_path_(path);
  {
    std::lock_guard<std::mutex> lg(mu_);
    auto it = libraries_.find(canon);
    if (it != libraries_.end()) return it->second.runtime;
  }

  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    const char* em = dlerror();
    fail_(nullptr, ErrorCode::NotFound, std::string(em ? em : "dlopen failed") + ": " + path);
  }

  auto sym_get_abi = reinterpret_cast<uint32_t (*)()>(dlsym(handle, "agd_plugin_get_abi_version"));
  if (!sym_get_abi) fail_(handle, ErrorCode::NotFound, "missing symbol: agd_plugin_get_abi_version");
  auto sym_get_api = reinterpret_cast<const agd_api* (*)()>(dlsym(handle, "agd_plugin_get_api"));
  if (!sym_get_api) fail_(handle, ErrorCode::NotFound, "missing symbol: agd_plugin_get_api");

  const uint32_t abi = sym_get_abi();
  const uint32_t host = AGD_PLUGIN_ABI_VERSION;
  const uint32_t pmaj = (abi >> 16) & 0xFFFFu, pmin = abi & 0xFFFFu;
  const uint32_t hmaj = (host >> 16) & 0xFFFFu, hmin = host & 0xFFFFu;
  if (pmaj != hmaj || pmin > hmin) {
    AGD_LOG(WARNING) << "rejecting plugin " << path << ": ABI " << pmaj << "." << pmin
                     << " vs host " << hmaj << "." << hmin;
    fail_(handle, ErrorCode::FailedPrecondition,
          "ABI mismatch: host " + std::to_string(hmaj) + "." + std::to_string(hmin) +
              " vs plugin " + std::to_string(pmaj) + "." + std::to_string(pmin));
  }

  const agd_api* api = sym_get_api();
  if (!api) fail_(handle, ErrorCode::FailedPrecondition, "agd_plugin_get_api returned null: " + path);

  std::shared_ptr<Runtime> rt;
  try {
    rt = Runtime::wrap(api, {}, canon);
  } catch (const Error&) {
    dlclose(handle);
    throw;
  }

  std::lock_guard<std::mutex> lg(mu_);
  auto [it, inserted] = libraries_.emplace(canon, Library{handle, rt});
  if (!inserted) {
    // Lost a race with another load of the same library; dlopen refcounts.
    dlclose(handle);
    return it->second.runtime;
  }
  AGD_LOG(INFO) << "loaded plugin " << canon << " (ABI " << pmaj << "." << pmin << ")";
  return rt;
}

std::vector<std::string> PluginRegistry::loaded_libraries() const {
  std::lock_guard<std::mutex> lg(mu_);
  std::vector<std::string> out;
  out.reserve(libraries_.size());
  for (const auto& kv : libraries_) out.push_back(kv.first);
  return out;
}

bool PluginRegistry::is_loaded(const std::string& path) const {
  const std::string canon = canonical_path_(path);
  std::lock_guard<std::mutex> lg(mu_);
  return libraries_.count(canon) != 0;
}

} // namespace runtime
} // namespace agd

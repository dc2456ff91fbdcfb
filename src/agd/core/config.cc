// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/core/config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <string>

#include "agd/core/checked_math.h"

namespace agd {

namespace {

std::size_t normalize_pow2_(std::size_t v) {
  if (v == 0) return 1;
  std::size_t p = 1;
  while (p < v && p <= (static_cast<std::size_t>(-1) >> 1)) p <<= 1;
  return p;
}

void normalize_(Config& cfg) {
  std::size_t a = normalize_pow2_(cfg.host_alignment_bytes);
  const std::size_t min_a = alignof(std::max_align_t);
  if (a < min_a) a = min_a;
  cfg.host_alignment_bytes = a;
  if (cfg.max_extension_chain == 0) cfg.max_extension_chain = 1;
  if (cfg.default_chunk_bytes == 0) cfg.default_chunk_bytes = 1u << 20;
}

} // namespace

Config parse_config(std::string_view conf) {
  Config cfg;
  if (conf.empty()) {
    normalize_(cfg);
    return cfg;
  }
  auto is_space = [](char c){ return c==' '||c=='\t'||c=='\n'||c=='\r'; };
  std::string s(conf);
  std::size_t i = 0;
  auto trim = [&](std::string& t){ std::size_t a=0; while (a<t.size() && is_space(t[a])) ++a; std::size_t b=t.size(); while (b>a && is_space(t[b-1])) --b; t = t.substr(a, b-a); };
  auto to_uint = [&](const std::string& t, std::uint64_t& out)->bool{
    if (t.empty() || t[0] == '-') return false; char* end=nullptr; errno=0; unsigned long long x = std::strtoull(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0')) return false; out = static_cast<std::uint64_t>(x); return true; };
  auto to_int = [&](const std::string& t, int& out)->bool{
    if (t.empty()) return false; char* end=nullptr; errno=0; long x = std::strtol(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0')) return false; out = static_cast<int>(x); return true; };
  auto to_bool = [&](const std::string& t, bool& out)->bool{
    std::string u=t; for (auto& c: u) c = (char)std::tolower(static_cast<unsigned char>(c));
    if (u=="1"||u=="true"||u=="yes") { out=true; return true; }
    if (u=="0"||u=="false"||u=="no") { out=false; return true; }
    return false; };
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i]==',')) ++i; if (i>=s.size()) break;
    std::size_t k0=i; while (i<s.size() && s[i] != '=' && s[i] != ',') ++i;
    if (i>=s.size()) break;
    if (s[i] != '=') continue;  // bare token without a value
    std::string key = s.substr(k0, i-k0); ++i;
    std::size_t v0=i; while (i<s.size() && s[i] != ',') ++i; std::string val = s.substr(v0, i-v0);
    trim(key); trim(val);
    if (key == "default_chunk_bytes") { std::uint64_t v=0; if (to_uint(val, v) && v > 0) cfg.default_chunk_bytes = static_cast<std::size_t>(v); }
    else if (key == "default_wait_timeout_ms") { std::uint64_t v=0; if (to_uint(val, v)) cfg.default_wait_timeout_ms = v; }
    else if (key == "max_extension_chain") { std::uint64_t v=0; if (to_uint(val, v) && v > 0) cfg.max_extension_chain = static_cast<std::size_t>(v); }
    else if (key == "host_alignment_bytes") { std::uint64_t v=0; if (to_uint(val, v) && core::is_pow2(static_cast<std::size_t>(v))) cfg.host_alignment_bytes = static_cast<std::size_t>(v); }
    else if (key == "poison_on_free") { bool b=false; if (to_bool(val, b)) cfg.poison_on_free = b; }
    else if (key == "min_log_level") { int v=0; if (to_int(val, v) && v >= 0 && v <= 3) cfg.min_log_level = v; }
  }
  normalize_(cfg);
  return cfg;
}

const Config& Config::get() {
  static Config* inst = nullptr;
  static std::once_flag once;
  std::call_once(once, [](){
    const char* env = std::getenv("AGD_CONF");
    inst = new Config(parse_config(env ? std::string_view(env) : std::string_view()));
  });
  return *inst;
}

} // namespace agd

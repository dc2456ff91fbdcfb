// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace agd {
// Initialize Abseil logging once; optionally set min log level (falls back
// to Config::min_log_level).
void InitLogging(std::optional<int> min_level);

// True once InitLogging has run in this process.
bool LoggingInitialized() noexcept;
}

// Shorthand macros; AGD_CHECK is for internal invariants, never boundary input.
#define AGD_LOG(level) LOG(level)
#define AGD_LOG_EVERY_N(level, n) LOG_EVERY_N(level, n)
#define AGD_CHECK(cond) CHECK(cond)

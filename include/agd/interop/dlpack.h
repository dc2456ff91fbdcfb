// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include <dlpack/dlpack.h>

#include "agd/memory/allocation.h"
#include "agd/memory/ownership.h"

namespace agd {
namespace interop {

using DlpackPtr = std::unique_ptr<DLManagedTensor, void (*)(DLManagedTensor*)>;

// Exports a host allocation as a contiguous CPU tensor. The capsule owns the
// allocation; its deleter is idempotent and releases it exactly once.
// prod(shape) * dtype bytes must equal the allocation's byte size.
DlpackPtr to_dlpack(memory::HostAllocation&& alloc, DLDataType dtype, std::span<const std::int64_t> shape);

// Takes a contiguous CPU capsule. One-shot: the capsule's deleter is taken out
// of it, so importing it again fails. The returned region calls the original
// deleter exactly once; on a rejected capsule it has already been called.
memory::NativeRegion from_dlpack(DLManagedTensor* managed);

} // namespace interop
} // namespace agd

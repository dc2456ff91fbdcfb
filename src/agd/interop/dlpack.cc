// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/interop/dlpack.h"

#include <atomic>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <utility>

#include "agd/core/checked_math.h"
#include "agd/core/error.h"
#include "agd/logging/logging.h"
#include "agd/transfer/host_transfer.h"

namespace agd {
namespace interop {

namespace {

struct ManagerCtx {
  memory::HostAllocation alloc;  // keepalive
  std::atomic<bool> freed{false};
};

struct ImportCtx {
  DLManagedTensor* mt{nullptr};
  void (*del)(DLManagedTensor*){nullptr};
};

struct DlpackDeleterGuard {
  DLManagedTensor* mt{nullptr};
  void (*del)(DLManagedTensor*){nullptr};
  bool active{false};

  DlpackDeleterGuard(DLManagedTensor* mt_, void (*del_)(DLManagedTensor*)) noexcept
      : mt(mt_), del(del_), active(true) {}

  DlpackDeleterGuard(const DlpackDeleterGuard&) = delete;
  DlpackDeleterGuard& operator=(const DlpackDeleterGuard&) = delete;

  ~DlpackDeleterGuard() noexcept {
    if (active && del && mt) del(mt);
  }

  void release() noexcept {
    active = false;
    mt = nullptr;
    del = nullptr;
  }
};

void idempotent_deleter(DLManagedTensor* mt) {
  if (!mt) return;
  auto* ctx = static_cast<ManagerCtx*>(mt->manager_ctx);
  if (ctx) {
    bool expected = false;
    if (ctx->freed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      delete[] mt->dl_tensor.shape;
      mt->dl_tensor.shape = nullptr;
      delete ctx;
      delete mt;
    }
    return; // already freed → no-op
  }
  delete mt;
}

// agd_deleter_fn over an imported capsule.
void import_deleter(void* /*data*/, void* arg) noexcept {
  std::unique_ptr<ImportCtx> ctx(static_cast<ImportCtx*>(arg));
  if (ctx && ctx->del) ctx->del(ctx->mt);
}

[[noreturn]] void reject(const std::string& msg) {
  throw validation_error(ErrorCode::InvalidArgument, msg);
}

} // namespace

DlpackPtr to_dlpack(memory::HostAllocation&& alloc, DLDataType dtype, std::span<const std::int64_t> shape) {
  memory::HostAllocation owned(std::move(alloc));
  if (dtype.lanes != 1) reject("to_dlpack: lanes must be 1");
  const std::size_t item_b = transfer::dtype_element_bytes(dtype);
  if (shape.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    reject("to_dlpack: too many dimensions");
  }
  std::int64_t numel = 0;
  std::size_t nbytes = 0;
  if (!core::checked_numel(shape.data(), shape.size(), numel) ||
      !core::checked_mul_size(static_cast<std::size_t>(numel), item_b, nbytes)) {
    reject("to_dlpack: invalid or overflowing shape");
  }
  if (nbytes != owned.size_bytes()) {
    reject("to_dlpack: shape needs " + std::to_string(nbytes) + " bytes, allocation has " +
           std::to_string(owned.size_bytes()));
  }

  auto* mt = new DLManagedTensor{};
  DlpackPtr out(mt, &idempotent_deleter);
  auto* ctx = new ManagerCtx{};
  mt->manager_ctx = ctx;
  mt->deleter = &idempotent_deleter;
  if (!shape.empty()) {
    mt->dl_tensor.shape = new int64_t[shape.size()];
    std::memcpy(mt->dl_tensor.shape, shape.data(), shape.size() * sizeof(int64_t));
  }
  mt->dl_tensor.strides = nullptr;  // compact row-major
  mt->dl_tensor.ndim = static_cast<int32_t>(shape.size());
  mt->dl_tensor.dtype = dtype;
  mt->dl_tensor.device = DLDevice{kDLCPU, 0};
  mt->dl_tensor.byte_offset = 0;
  mt->dl_tensor.data = owned.data();
  ctx->alloc = std::move(owned);
  return out;
}

memory::NativeRegion from_dlpack(DLManagedTensor* mt) {
  if (!mt) reject("from_dlpack: null capsule");

  // Enforce one-shot semantics and acquire the provider deleter up-front.
  auto* del = std::exchange(mt->deleter, nullptr);
  if (del == nullptr) {
    throw validation_error(ErrorCode::FailedPrecondition, "from_dlpack: capsule already consumed");
  }
  DlpackDeleterGuard guard(mt, del);

  const DLTensor& dl = mt->dl_tensor;
  if (dl.device.device_type != kDLCPU && dl.device.device_type != kDLCUDAHost) {
    reject("from_dlpack: unsupported device type (expected kDLCPU or kDLCUDAHost)");
  }
  if (dl.ndim < 0) reject("from_dlpack: invalid ndim");
  if (dl.ndim > 0 && dl.shape == nullptr) reject("from_dlpack: shape==NULL with ndim>0");
  const std::size_t item_b = transfer::dtype_element_bytes(dl.dtype);

  std::int64_t numel = 1;
  if (dl.ndim > 0 && !core::checked_numel(dl.shape, static_cast<std::size_t>(dl.ndim), numel)) {
    reject("from_dlpack: negative or overflowing shape");
  }
  if (dl.strides != nullptr && numel > 0) {
    std::int64_t expect = 1;
    for (int i = dl.ndim - 1; i >= 0; --i) {
      if (dl.shape[i] != 1 && dl.strides[i] != expect) reject("from_dlpack: non-contiguous tensor");
      expect *= dl.shape[i];
    }
  }
  std::size_t nbytes = 0;
  if (!core::checked_mul_size(static_cast<std::size_t>(numel), item_b, nbytes)) {
    reject("from_dlpack: byte size overflow");
  }
  if (nbytes > 0 && dl.data == nullptr) reject("from_dlpack: null data with non-zero size");

  void* data = nbytes ? static_cast<char*>(dl.data) + dl.byte_offset : nullptr;
  auto ctx = std::make_unique<ImportCtx>();
  ctx->mt = mt;
  ctx->del = del;
  guard.release();
  return memory::transfer_in(data, nbytes, &import_deleter, ctx.release());
}

} // namespace interop
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include "agd/async/event.h"
#include "agd/async/task.h"
#include "agd/core/error.h"
#include "agd/extension/capabilities.h"
#include "agd/extension/extension.h"
#include "agd/memory/allocation.h"
#include "agd/transfer/device_buffer.h"

namespace agd {
namespace runtime {
class Runtime;
} // namespace runtime

namespace transfer {

enum class TransferState : std::uint8_t {
  Created = 0,
  Streaming = 1,
  Completed = 2,
  Failed = 3,
};

const char* transfer_state_name(TransferState s) noexcept;

// A declared-size copy into a device buffer, fed as a sequence of host chunks
// through the plugin's stream extension.
//
// Chunks are offered in call order; callers serialize add_chunk on one
// transfer. The transfer is Completed once every declared byte was handed off
// and every chunk's completion succeeded; any chunk error makes it Failed for
// good. There is no retry at this level.
//
// The first failure is forwarded to the native stream (stream extension
// revision 2) from the host thread: immediately for synchronous failures and
// abort(), otherwise on the next add_chunk, abort or destruction. The plugin is
// never re-entered from its own completion callback.
class ChunkedTransfer {
 public:
  using ProgressFn = std::function<void(std::size_t transferred, std::size_t total)>;

  // Throws Unimplemented when the plugin has no stream extension.
  static ChunkedTransfer open(std::shared_ptr<const runtime::Runtime> rt, std::size_t total_bytes);

  ChunkedTransfer(ChunkedTransfer&&) noexcept = default;
  ChunkedTransfer& operator=(ChunkedTransfer&&) noexcept = default;
  ChunkedTransfer(const ChunkedTransfer&) = delete;
  ChunkedTransfer& operator=(const ChunkedTransfer&) = delete;
  ~ChunkedTransfer();

  // Validates locally, then hands `chunk` to the plugin. Rejections leave the
  // transfer unchanged. The returned event is already being observed; dropping
  // it does not affect accounting.
  async::Event add_chunk(memory::HostAllocation&& chunk);
  // Copies `bytes` into a fresh host allocation first.
  async::Event add_chunk(std::span<const std::byte> bytes);

  std::size_t current_progress() const;  // bytes handed off
  std::size_t confirmed_bytes() const;   // bytes whose chunk completed successfully
  std::size_t total_size() const noexcept { return total_; }
  std::size_t granule_size() const noexcept { return granule_; }
  TransferState state() const;
  std::optional<Error> failure() const;

  // Fails the transfer with `reason` unless it already failed (the first
  // failure is kept), then forwards the failure to the plugin. Throws
  // FailedPrecondition once Completed.
  void abort(Error reason);

  // Feeds `bytes` (the remaining size exactly) as granule-aligned chunks of
  // about `chunk_bytes` (0 = Config::default_chunk_bytes), awaiting each and
  // reporting (confirmed, total) after it. `bytes` and this transfer must
  // outlive the task.
  async::Task<void> stream_all(std::span<const std::byte> bytes,
                               std::size_t chunk_bytes = 0,
                               ProgressFn on_progress = {});

  // The filled device buffer; only once Completed, and only once.
  DeviceBuffer take_buffer();

 private:
  struct Inner {
    mutable std::mutex mu;
    std::size_t sent{0};
    std::size_t confirmed{0};
    std::size_t in_flight{0};
    TransferState state{TransferState::Created};
    std::optional<Error> failure;
    bool buffer_taken{false};
    bool failure_forwarded{false};

    void chunk_done_(std::size_t len, const async::SignalResult& r, std::size_t total);
    void fail_locked_(Error e);
  };

  ChunkedTransfer(std::shared_ptr<const runtime::Runtime> rt,
                  extension::CapabilityHandle<extension::StreamCapability> cap,
                  agd_copy_stream* stream,
                  std::size_t total,
                  std::size_t granule);

  // Tells the native stream about the recorded failure, once.
  void forward_failure_();
  void forward_failure_quietly_() noexcept;

  std::shared_ptr<const runtime::Runtime> rt_;
  std::optional<extension::CapabilityHandle<extension::StreamCapability>> cap_;
  struct StreamDeleter {
    std::shared_ptr<const runtime::Runtime> rt;
    const agd_stream_extension* ext{nullptr};
    void operator()(agd_copy_stream* s) const noexcept;
  };

  std::unique_ptr<agd_copy_stream, StreamDeleter> stream_;
  std::shared_ptr<Inner> inner_;
  std::size_t total_{0};
  std::size_t granule_{1};
};

} // namespace transfer
} // namespace agd

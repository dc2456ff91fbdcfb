// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/transfer/chunked_transfer.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "agd/core/checked_math.h"
#include "agd/core/config.h"
#include "agd/logging/logging.h"
#include "agd/memory/ownership.h"
#include "agd/runtime/runtime.h"

namespace agd {
namespace transfer {

const char* transfer_state_name(TransferState s) noexcept {
  switch (s) {
    case TransferState::Created: return "Created";
    case TransferState::Streaming: return "Streaming";
    case TransferState::Completed: return "Completed";
    case TransferState::Failed: return "Failed";
  }
  return "Unknown";
}

void ChunkedTransfer::StreamDeleter::operator()(agd_copy_stream* s) const noexcept {
  if (s && rt && ext) {
    rt->log_and_drop(ext->copy_stream_destroy(s), "copy_stream_destroy");
  }
}

void ChunkedTransfer::Inner::fail_locked_(Error e) {
  if (state == TransferState::Failed) return;  // first failure is kept
  state = TransferState::Failed;
  failure = std::move(e);
}

void ChunkedTransfer::Inner::chunk_done_(std::size_t len, const async::SignalResult& r, std::size_t total) {
  std::lock_guard<std::mutex> lg(mu);
  --in_flight;
  if (!r.ok()) {
    AGD_LOG(WARNING) << "chunk of " << len << " bytes failed: " << r.error->what();
    fail_locked_(*r.error);
    return;
  }
  confirmed += len;
  if (state == TransferState::Streaming && sent == total && in_flight == 0) {
    state = TransferState::Completed;
  }
}

ChunkedTransfer::ChunkedTransfer(std::shared_ptr<const runtime::Runtime> rt,
                                 extension::CapabilityHandle<extension::StreamCapability> cap,
                                 agd_copy_stream* stream,
                                 std::size_t total,
                                 std::size_t granule)
    : rt_(rt),
      cap_(cap),
      stream_(stream, StreamDeleter{rt, cap.get()}),
      inner_(std::make_shared<Inner>()),
      total_(total),
      granule_(granule) {}

ChunkedTransfer::~ChunkedTransfer() {
  if (inner_ && stream_) forward_failure_quietly_();
}

void ChunkedTransfer::forward_failure_() {
  std::optional<Error> failure;
  {
    std::lock_guard<std::mutex> lg(inner_->mu);
    if (inner_->state != TransferState::Failed || inner_->failure_forwarded) return;
    inner_->failure_forwarded = true;
    failure = inner_->failure;
  }
  if (!cap_->provides(extension::StreamCapability::kSetErrorEnd) || !(*cap_)->copy_stream_set_error) {
    AGD_LOG(INFO) << "plugin " << rt_->name() << " cannot abort copy streams; failure stays host-side";
    return;
  }
  const std::string_view msg = failure->what();
  rt_->check((*cap_)->copy_stream_set_error(stream_.get(), static_cast<agd_error_code>(failure->code()),
                                            msg.data(), msg.size()),
             "copy_stream_set_error");
}

void ChunkedTransfer::forward_failure_quietly_() noexcept {
  try {
    forward_failure_();
  } catch (const std::exception& ex) {
    AGD_LOG(WARNING) << "could not forward transfer failure to the plugin: " << ex.what();
  }
}

void ChunkedTransfer::abort(Error reason) {
  if (!inner_) {
    throw validation_error(ErrorCode::FailedPrecondition, "ChunkedTransfer: moved-from transfer");
  }
  {
    std::lock_guard<std::mutex> lg(inner_->mu);
    if (inner_->state == TransferState::Completed) {
      throw validation_error(ErrorCode::FailedPrecondition, "abort: transfer already completed");
    }
    inner_->fail_locked_(std::move(reason));
  }
  forward_failure_();
}

ChunkedTransfer ChunkedTransfer::open(std::shared_ptr<const runtime::Runtime> rt, std::size_t total_bytes) {
  if (!rt) throw validation_error(ErrorCode::InvalidArgument, "ChunkedTransfer::open: null runtime");
  if (total_bytes == 0) {
    throw validation_error(ErrorCode::InvalidArgument, "ChunkedTransfer::open: total size must be positive");
  }
  if (total_bytes > static_cast<std::size_t>(INT64_MAX)) {
    throw validation_error(ErrorCode::OutOfRange, "ChunkedTransfer::open: total size too large");
  }
  auto cap = rt->extension<extension::StreamCapability>();
  if (!cap) {
    throw validation_error(ErrorCode::Unimplemented,
                           "ChunkedTransfer::open: plugin " + rt->name() + " has no stream extension");
  }

  agd_copy_stream* raw = nullptr;
  rt->check((*cap)->copy_stream_create(static_cast<std::int64_t>(total_bytes), &raw), "copy_stream_create");
  if (!raw) throw internal_error("copy_stream_create succeeded without a stream");
  // Owned from here so every failure below destroys the stream.
  std::unique_ptr<agd_copy_stream, StreamDeleter> guard(raw, StreamDeleter{rt, cap->get()});

  std::int64_t native_total = 0;
  rt->check((*cap)->copy_stream_total_bytes(raw, &native_total), "copy_stream_total_bytes");
  if (native_total != static_cast<std::int64_t>(total_bytes)) {
    throw internal_error("copy stream reports " + std::to_string(native_total) +
                         " total bytes, declared " + std::to_string(total_bytes));
  }
  std::int64_t granule = 0;
  rt->check((*cap)->copy_stream_granule_size(raw, &granule), "copy_stream_granule_size");
  if (granule < 0) {
    throw internal_error("copy stream reports negative granule " + std::to_string(granule));
  }

  ChunkedTransfer t(rt, *cap, guard.release(), total_bytes,
                    granule == 0 ? 1 : static_cast<std::size_t>(granule));
  return t;
}

async::Event ChunkedTransfer::add_chunk(memory::HostAllocation&& chunk) {
  if (!inner_) {
    throw validation_error(ErrorCode::FailedPrecondition, "ChunkedTransfer: moved-from transfer");
  }
  memory::HostAllocation owned(std::move(chunk));
  const std::size_t len = owned.size_bytes();
  bool failed = false;
  {
    std::lock_guard<std::mutex> lg(inner_->mu);
    failed = inner_->state == TransferState::Failed;
  }
  if (failed) {
    forward_failure_quietly_();
    throw validation_error(ErrorCode::FailedPrecondition, "add_chunk: transfer has failed");
  }
  {
    std::lock_guard<std::mutex> lg(inner_->mu);
    if (inner_->state == TransferState::Failed) {
      throw validation_error(ErrorCode::FailedPrecondition, "add_chunk: transfer has failed");
    }
    if (len == 0) {
      throw validation_error(ErrorCode::InvalidArgument, "add_chunk: empty chunk");
    }
    std::size_t after = 0;
    if (!core::checked_add_size(inner_->sent, len, after) || after > total_) {
      throw validation_error(ErrorCode::OutOfRange,
                             "add_chunk: " + std::to_string(len) + " bytes at offset " +
                                 std::to_string(inner_->sent) + " exceeds total " + std::to_string(total_));
    }
    const bool is_final = after == total_;
    if (!is_final && len % granule_ != 0) {
      throw validation_error(ErrorCode::InvalidArgument,
                             "add_chunk: non-final chunk of " + std::to_string(len) +
                                 " bytes is not a multiple of granule " + std::to_string(granule_));
    }
    inner_->sent = after;
    inner_->in_flight += 1;
    inner_->state = TransferState::Streaming;
  }

  // The plugin owns the chunk from the call on, whatever it returns.
  agd_chunk c = memory::transfer_out(std::move(owned)).release();
  agd_event* ev = nullptr;
  agd_error* err = (*cap_)->copy_stream_add_chunk(stream_.get(), &c, &ev);
  if (err) {
    std::optional<Error> e;
    {
      runtime::NativeLeftovers left{*rt_, ev};
      e = rt_->translate(err, "copy_stream_add_chunk");
    }
    {
      std::lock_guard<std::mutex> lg(inner_->mu);
      inner_->in_flight -= 1;
      inner_->fail_locked_(*e);
    }
    forward_failure_quietly_();
    throw *e;
  }

  async::Event event(rt_, ev);
  std::weak_ptr<Inner> weak = inner_;
  const std::size_t total = total_;
  event.signal()->on_terminal([weak, len, total](const async::SignalResult& r) {
    if (auto in = weak.lock()) in->chunk_done_(len, r, total);
  });
  event.arm();
  return event;
}

async::Event ChunkedTransfer::add_chunk(std::span<const std::byte> bytes) {
  return add_chunk(memory::HostAllocation::copy_from_bytes(memory::ElementLayout::bytes(), bytes));
}

std::size_t ChunkedTransfer::current_progress() const {
  if (!inner_) return 0;
  std::lock_guard<std::mutex> lg(inner_->mu);
  return inner_->sent;
}

std::size_t ChunkedTransfer::confirmed_bytes() const {
  if (!inner_) return 0;
  std::lock_guard<std::mutex> lg(inner_->mu);
  return inner_->confirmed;
}

TransferState ChunkedTransfer::state() const {
  if (!inner_) return TransferState::Failed;
  std::lock_guard<std::mutex> lg(inner_->mu);
  return inner_->state;
}

std::optional<Error> ChunkedTransfer::failure() const {
  if (!inner_) return std::nullopt;
  std::lock_guard<std::mutex> lg(inner_->mu);
  return inner_->failure;
}

async::Task<void> ChunkedTransfer::stream_all(std::span<const std::byte> bytes,
                                              std::size_t chunk_bytes,
                                              ProgressFn on_progress) {
  const std::size_t remaining = total_ - current_progress();
  if (bytes.size() != remaining) {
    throw validation_error(ErrorCode::InvalidArgument,
                           "stream_all: got " + std::to_string(bytes.size()) + " bytes, " +
                               std::to_string(remaining) + " remain");
  }
  std::size_t step = chunk_bytes ? chunk_bytes : Config::get().default_chunk_bytes;
  if (step % granule_ != 0) step = (step / granule_ + 1) * granule_;

  std::size_t off = 0;
  while (off < bytes.size()) {
    const std::size_t n = std::min(step, bytes.size() - off);
    async::Event ev = add_chunk(bytes.subspan(off, n));
    off += n;
    try {
      co_await ev;
    } catch (const Error&) {
      forward_failure_quietly_();
      throw;
    }
    if (on_progress) on_progress(confirmed_bytes(), total_);
  }
}

DeviceBuffer ChunkedTransfer::take_buffer() {
  if (!inner_) {
    throw validation_error(ErrorCode::FailedPrecondition, "ChunkedTransfer: moved-from transfer");
  }
  {
    std::lock_guard<std::mutex> lg(inner_->mu);
    if (inner_->state != TransferState::Completed) {
      throw validation_error(ErrorCode::FailedPrecondition,
                             std::string("take_buffer: transfer is ") + transfer_state_name(inner_->state));
    }
    if (inner_->buffer_taken) {
      throw validation_error(ErrorCode::FailedPrecondition, "take_buffer: buffer already taken");
    }
    inner_->buffer_taken = true;
  }
  agd_buffer* buf = nullptr;
  rt_->check((*cap_)->copy_stream_take_buffer(stream_.get(), &buf), "copy_stream_take_buffer");
  if (!buf) throw internal_error("copy_stream_take_buffer succeeded without a buffer");
  return DeviceBuffer(rt_, buf);
}

} // namespace transfer
} // namespace agd

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <span>
#include <thread>
#include <vector>

#include "agd/async/executor.h"
#include "agd/memory/allocation_stats.h"
#include "agd/transfer/chunked_transfer.h"
#include "fake_plugin.h"

using agd::Error;
using agd::ErrorCode;
using agd::ErrorKind;
using agd::async::Event;
using agd::async::LocalExecutor;
using agd::memory::allocation_stats;
using agd::transfer::ChunkedTransfer;
using agd::transfer::TransferState;
using agd_test::FakePlugin;

namespace {

std::vector<std::byte> pattern(std::size_t n) {
  std::vector<std::byte> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::byte>(i % 251);
  return v;
}

std::span<const std::byte> slice(const std::vector<std::byte>& v, std::size_t off, std::size_t n) {
  return std::span<const std::byte>(v).subspan(off, n);
}

ErrorCode code_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected an agd::Error";
  return ErrorCode::Unknown;
}

// Completes pending plugin events on a background thread until stopped.
class Completer {
 public:
  explicit Completer(FakePlugin& p) : p_(p), t_([this] { run_(); }) {}
  ~Completer() {
    stop_.store(true);
    t_.join();
  }

 private:
  void run_() {
    while (!stop_.load()) {
      if (p_.pending_events() > 0) {
        p_.complete_next();
      } else {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }
  }

  FakePlugin& p_;
  std::atomic<bool> stop_{false};
  std::thread t_;
};

} // namespace

TEST(ChunkedTransfer, ThreeChunksReachCompleted) {
  FakePlugin plugin;
  const auto data = pattern(300);
  auto t = ChunkedTransfer::open(plugin.runtime(), 300);
  EXPECT_EQ(t.state(), TransferState::Created);
  EXPECT_EQ(t.total_size(), 300u);
  EXPECT_EQ(plugin.counters().streams_live.load(), 1);

  std::vector<Event> events;
  for (std::size_t i = 0; i < 3; ++i) {
    events.push_back(t.add_chunk(slice(data, i * 100, 100)));
    EXPECT_EQ(t.current_progress(), (i + 1) * 100);
    EXPECT_EQ(t.state(), TransferState::Streaming);
  }
  EXPECT_EQ(t.confirmed_bytes(), 0u);

  plugin.complete_next();
  EXPECT_EQ(t.confirmed_bytes(), 100u);
  EXPECT_EQ(t.state(), TransferState::Streaming);
  plugin.complete_all();
  for (auto& ev : events) EXPECT_NO_THROW(ev.wait());
  EXPECT_EQ(t.confirmed_bytes(), 300u);
  EXPECT_EQ(t.state(), TransferState::Completed);
  EXPECT_EQ(plugin.last_stream_bytes(), data);

  auto buf = t.take_buffer();
  EXPECT_EQ(buf.size_in_bytes(), 300u);
  EXPECT_EQ(code_of([&] { (void)t.take_buffer(); }), ErrorCode::FailedPrecondition);
}

TEST(ChunkedTransfer, OvershootRejectedWithoutSideEffects) {
  FakePlugin plugin;
  const auto data = pattern(120);
  auto t = ChunkedTransfer::open(plugin.runtime(), 100);
  Event first = t.add_chunk(slice(data, 0, 60));
  EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 60, 60)); }), ErrorCode::OutOfRange);
  EXPECT_EQ(t.current_progress(), 60u);
  EXPECT_EQ(t.state(), TransferState::Streaming);
  EXPECT_EQ(plugin.counters().chunks_received.load(), 1);

  // The transfer is still usable.
  Event last = t.add_chunk(slice(data, 60, 40));
  plugin.complete_all();
  EXPECT_EQ(t.state(), TransferState::Completed);
}

TEST(ChunkedTransfer, EmptyChunkRejected) {
  FakePlugin plugin;
  auto t = ChunkedTransfer::open(plugin.runtime(), 10);
  EXPECT_EQ(code_of([&] { (void)t.add_chunk(std::span<const std::byte>()); }), ErrorCode::InvalidArgument);
  EXPECT_EQ(t.state(), TransferState::Created);
}

TEST(ChunkedTransfer, GranuleAppliesToNonFinalChunks) {
  FakePlugin::Knobs k;
  k.granule = 4;
  FakePlugin plugin(k);
  const auto data = pattern(10);
  auto t = ChunkedTransfer::open(plugin.runtime(), 10);
  EXPECT_EQ(t.granule_size(), 4u);
  EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 0, 3)); }), ErrorCode::InvalidArgument);
  EXPECT_EQ(t.current_progress(), 0u);
  Event a = t.add_chunk(slice(data, 0, 8));
  Event b = t.add_chunk(slice(data, 8, 2));  // final chunk may be short
  plugin.complete_all();
  EXPECT_EQ(t.state(), TransferState::Completed);
}

TEST(ChunkedTransfer, ZeroGranuleMeansUnconstrained) {
  FakePlugin::Knobs k;
  k.granule = 0;
  FakePlugin plugin(k);
  auto t = ChunkedTransfer::open(plugin.runtime(), 7);
  EXPECT_EQ(t.granule_size(), 1u);
}

TEST(ChunkedTransfer, SynchronousFailureFailsTransfer) {
  const auto before = allocation_stats();
  {
    FakePlugin::Knobs k;
    k.fail_add_chunk = AGD_ERROR_CODE_RESOURCE_EXHAUSTED;
    FakePlugin plugin(k);
    const auto data = pattern(50);
    auto t = ChunkedTransfer::open(plugin.runtime(), 50);
    try {
      (void)t.add_chunk(slice(data, 0, 10));
      FAIL() << "expected an error";
    } catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Native);
      EXPECT_EQ(e.code(), ErrorCode::ResourceExhausted);
      EXPECT_EQ(e.function(), "copy_stream_add_chunk");
    }
    EXPECT_EQ(t.state(), TransferState::Failed);
    ASSERT_TRUE(t.failure().has_value());
    EXPECT_EQ(t.failure()->code(), ErrorCode::ResourceExhausted);
    // The consumed chunk was released by the plugin.
    EXPECT_EQ(plugin.counters().chunk_deleters_called.load(), 1);

    EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 10, 10)); }), ErrorCode::FailedPrecondition);
    EXPECT_EQ(plugin.counters().chunks_received.load(), 1);
  }
  const auto after = allocation_stats();
  EXPECT_EQ(after.live_host_bytes, before.live_host_bytes);
  EXPECT_EQ(after.live_deleter_contexts, before.live_deleter_contexts);
}

TEST(ChunkedTransfer, AsynchronousFailureIsSticky) {
  FakePlugin plugin;
  const auto data = pattern(40);
  auto t = ChunkedTransfer::open(plugin.runtime(), 40);
  Event a = t.add_chunk(slice(data, 0, 20));
  Event b = t.add_chunk(slice(data, 20, 20));
  plugin.complete_next(AGD_ERROR_CODE_DATA_LOSS, "link dropped");
  EXPECT_EQ(t.state(), TransferState::Failed);
  plugin.complete_next();
  EXPECT_EQ(t.state(), TransferState::Failed);
  EXPECT_EQ(t.confirmed_bytes(), 20u);
  ASSERT_TRUE(t.failure().has_value());
  EXPECT_EQ(t.failure()->code(), ErrorCode::DataLoss);
  EXPECT_THROW(a.wait(), Error);
  EXPECT_NO_THROW(b.wait());
  EXPECT_EQ(code_of([&] { (void)t.take_buffer(); }), ErrorCode::FailedPrecondition);
}

TEST(ChunkedTransfer, DroppedEventsStillCounted) {
  FakePlugin plugin;
  const auto data = pattern(30);
  auto t = ChunkedTransfer::open(plugin.runtime(), 30);
  (void)t.add_chunk(slice(data, 0, 15));
  (void)t.add_chunk(slice(data, 15, 15));
  plugin.complete_all_on_thread();
  EXPECT_EQ(t.confirmed_bytes(), 30u);
  EXPECT_EQ(t.state(), TransferState::Completed);
}

TEST(ChunkedTransfer, OpenValidation) {
  {
    FakePlugin plugin;
    EXPECT_EQ(code_of([&] { (void)ChunkedTransfer::open(plugin.runtime(), 0); }), ErrorCode::InvalidArgument);
  }
  {
    FakePlugin::Knobs k;
    k.with_stream = false;
    FakePlugin plugin(k);
    EXPECT_EQ(code_of([&] { (void)ChunkedTransfer::open(plugin.runtime(), 8); }), ErrorCode::Unimplemented);
  }
  {
    FakePlugin::Knobs k;
    k.total_skew = 1;
    FakePlugin plugin(k);
    try {
      (void)ChunkedTransfer::open(plugin.runtime(), 8);
      FAIL() << "expected an error";
    } catch (const Error& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Internal);
    }
    EXPECT_EQ(plugin.counters().streams_live.load(), 0);
  }
}

TEST(ChunkedTransfer, StreamAllReportsProgress) {
  FakePlugin plugin;
  const auto data = pattern(300);
  auto t = ChunkedTransfer::open(plugin.runtime(), 300);
  std::vector<std::size_t> progress;
  {
    Completer completer(plugin);
    LocalExecutor ex;
    ex.block_on(t.stream_all(data, 100,
                             [&](std::size_t done, std::size_t total) {
                               EXPECT_EQ(total, 300u);
                               progress.push_back(done);
                             }),
                std::chrono::seconds(10));
  }
  EXPECT_EQ(progress, (std::vector<std::size_t>{100, 200, 300}));
  EXPECT_EQ(t.state(), TransferState::Completed);
  EXPECT_EQ(plugin.last_stream_bytes(), data);
}

TEST(ChunkedTransfer, StreamAllRoundsStepToGranule) {
  FakePlugin::Knobs k;
  k.deferred = false;
  k.granule = 4;
  FakePlugin plugin(k);
  const auto data = pattern(18);
  auto t = ChunkedTransfer::open(plugin.runtime(), 18);
  std::vector<std::size_t> progress;
  LocalExecutor ex;
  ex.block_on(t.stream_all(data, 5, [&](std::size_t done, std::size_t) { progress.push_back(done); }));
  EXPECT_EQ(progress, (std::vector<std::size_t>{8, 16, 18}));
  EXPECT_EQ(plugin.counters().chunks_received.load(), 3);
}

TEST(ChunkedTransfer, StreamAllRejectsWrongSize) {
  FakePlugin plugin;
  const auto data = pattern(10);
  auto t = ChunkedTransfer::open(plugin.runtime(), 20);
  LocalExecutor ex;
  EXPECT_EQ(code_of([&] { ex.block_on(t.stream_all(data)); }), ErrorCode::InvalidArgument);
  EXPECT_EQ(t.current_progress(), 0u);
}

TEST(ChunkedTransfer, AbortStopsNativeStream) {
  FakePlugin plugin;
  const auto data = pattern(40);
  auto t = ChunkedTransfer::open(plugin.runtime(), 40);
  Event a = t.add_chunk(slice(data, 0, 20));

  t.abort(agd::validation_error(ErrorCode::Cancelled, "caller cancelled"));
  EXPECT_EQ(t.state(), TransferState::Failed);
  ASSERT_TRUE(t.failure().has_value());
  EXPECT_EQ(t.failure()->code(), ErrorCode::Cancelled);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 1);
  EXPECT_EQ(plugin.counters().last_stream_error_code.load(), AGD_ERROR_CODE_CANCELLED);

  // The plugin resolved the in-flight chunk with the forwarded code.
  try {
    a.wait();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::Cancelled);
  }
  EXPECT_EQ(plugin.counters().chunk_deleters_called.load(), 1);
  EXPECT_EQ(t.confirmed_bytes(), 0u);

  // Later aborts keep the first failure and do not reach the plugin again.
  t.abort(agd::internal_error("second"));
  EXPECT_EQ(t.failure()->code(), ErrorCode::Cancelled);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 1);
  EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 20, 20)); }), ErrorCode::FailedPrecondition);
}

TEST(ChunkedTransfer, AsynchronousFailureForwardedOnNextCall) {
  FakePlugin plugin;
  const auto data = pattern(40);
  auto t = ChunkedTransfer::open(plugin.runtime(), 40);
  Event a = t.add_chunk(slice(data, 0, 20));
  plugin.complete_next(AGD_ERROR_CODE_DATA_LOSS, "link dropped");
  // Learned inside the plugin's callback; not forwarded from there.
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 0);

  EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 20, 20)); }), ErrorCode::FailedPrecondition);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 1);
  EXPECT_EQ(plugin.counters().last_stream_error_code.load(), AGD_ERROR_CODE_DATA_LOSS);
  EXPECT_EQ(plugin.counters().chunks_received.load(), 1);
}

TEST(ChunkedTransfer, SynchronousFailureForwardedImmediately) {
  FakePlugin::Knobs k;
  k.fail_add_chunk = AGD_ERROR_CODE_RESOURCE_EXHAUSTED;
  FakePlugin plugin(k);
  const auto data = pattern(10);
  auto t = ChunkedTransfer::open(plugin.runtime(), 10);
  EXPECT_EQ(code_of([&] { (void)t.add_chunk(slice(data, 0, 10)); }), ErrorCode::ResourceExhausted);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 1);
  EXPECT_EQ(plugin.counters().last_stream_error_code.load(), AGD_ERROR_CODE_RESOURCE_EXHAUSTED);
}

TEST(ChunkedTransfer, DestructionForwardsPendingFailure) {
  FakePlugin plugin;
  const auto data = pattern(20);
  {
    auto t = ChunkedTransfer::open(plugin.runtime(), 20);
    (void)t.add_chunk(slice(data, 0, 10));
    plugin.complete_next(AGD_ERROR_CODE_ABORTED, "device reset");
    EXPECT_EQ(plugin.counters().stream_errors_set.load(), 0);
  }
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 1);
  EXPECT_EQ(plugin.counters().streams_live.load(), 0);
}

TEST(ChunkedTransfer, AbortWithoutNativeSupportStaysHostSide) {
  FakePlugin::Knobs k;
  k.stream_revision1 = true;
  FakePlugin plugin(k);
  const auto data = pattern(20);
  auto t = ChunkedTransfer::open(plugin.runtime(), 20);
  Event a = t.add_chunk(slice(data, 0, 10));
  EXPECT_NO_THROW(t.abort(agd::validation_error(ErrorCode::Cancelled, "stop")));
  EXPECT_EQ(t.state(), TransferState::Failed);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 0);
  // The chunk still completes on the plugin's schedule.
  plugin.complete_all();
  EXPECT_NO_THROW(a.wait());
  EXPECT_EQ(t.state(), TransferState::Failed);
}

TEST(ChunkedTransfer, AbortAfterCompletionRejected) {
  FakePlugin plugin;
  const auto data = pattern(8);
  auto t = ChunkedTransfer::open(plugin.runtime(), 8);
  (void)t.add_chunk(slice(data, 0, 8));
  plugin.complete_all();
  ASSERT_EQ(t.state(), TransferState::Completed);
  EXPECT_EQ(code_of([&] { t.abort(agd::internal_error("late")); }), ErrorCode::FailedPrecondition);
  EXPECT_EQ(t.state(), TransferState::Completed);
  EXPECT_EQ(plugin.counters().stream_errors_set.load(), 0);
}

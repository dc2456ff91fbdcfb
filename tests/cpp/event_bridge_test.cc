// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "agd/async/event.h"
#include "agd/async/executor.h"
#include "agd/async/task.h"
#include "agd/runtime/runtime.h"
#include "fake_plugin.h"

using agd::Error;
using agd::ErrorCode;
using agd::ErrorKind;
using agd::async::Event;
using agd::async::LocalExecutor;
using agd::async::SignalState;
using agd::async::Task;
using agd::async::Waker;
using agd::async::detail::live_callback_contexts;
using agd_test::FakePlugin;

namespace {

Event make_native_event(FakePlugin& p) {
  return Event(p.runtime(), p.make_event({}));
}

Task<void> await_event(Event& ev) { co_await ev; }

} // namespace

TEST(EventBridge, DeferredCompletion) {
  const auto base = live_callback_contexts();
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  EXPECT_FALSE(ev.is_ready());
  EXPECT_EQ(plugin.counters().callbacks_registered.load(), 1);
  EXPECT_EQ(live_callback_contexts(), base + 1);

  plugin.complete_next();
  EXPECT_TRUE(ev.is_ready());
  EXPECT_NO_THROW(ev.wait());
  EXPECT_EQ(plugin.counters().callbacks_fired.load(), 1);
  EXPECT_EQ(live_callback_contexts(), base);
}

TEST(EventBridge, AlreadyReadySkipsRegistration) {
  FakePlugin::Knobs k;
  k.deferred = false;
  FakePlugin plugin(k);
  Event ev = make_native_event(plugin);
  EXPECT_TRUE(ev.is_ready());
  EXPECT_EQ(plugin.counters().callbacks_registered.load(), 0);
  EXPECT_NO_THROW(ev.wait());
}

TEST(EventBridge, CallbackFiresInsideRegistration) {
  const auto base = live_callback_contexts();
  FakePlugin plugin;
  // Reports "not ready" even when it is, so the callback runs inline from
  // event_on_ready.
  agd_api table = *plugin.api();
  table.event_is_ready = [](agd_event*, int* out) -> agd_error* {
    *out = 0;
    return nullptr;
  };
  auto rt = agd::runtime::Runtime::wrap(&table, {}, "inline");
  agd_event* raw = plugin.make_event({});
  plugin.complete_next();

  Event ev(rt, raw);
  ev.arm();
  EXPECT_EQ(ev.signal()->state(), SignalState::Satisfied);
  EXPECT_EQ(plugin.counters().callbacks_fired.load(), 1);
  EXPECT_EQ(live_callback_contexts(), base);
}

TEST(EventBridge, CrossThreadCompletion) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  ev.arm();
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    plugin.complete_all();
  });
  EXPECT_TRUE(ev.wait_for(std::chrono::seconds(5)));
  t.join();
}

TEST(EventBridge, RegistrationFailureReclaimsContext) {
  const auto base = live_callback_contexts();
  FakePlugin::Knobs k;
  k.fail_on_ready = true;
  FakePlugin plugin(k);
  Event ev = make_native_event(plugin);

  int woke = 0;
  auto r = ev.poll(Waker([&] { ++woke; }));
  ASSERT_TRUE(r.has_value());
  ASSERT_FALSE(r->ok());
  EXPECT_EQ(r->error->kind(), ErrorKind::Native);
  EXPECT_EQ(r->error->code(), ErrorCode::FailedPrecondition);
  EXPECT_EQ(r->error->function(), "event_on_ready");
  EXPECT_EQ(plugin.counters().callbacks_registered.load(), 0);
  EXPECT_EQ(live_callback_contexts(), base);

  plugin.complete_next();
  EXPECT_EQ(plugin.counters().callbacks_fired.load(), 0);
  EXPECT_EQ(woke, 0);
  EXPECT_EQ(plugin.counters().errors_created.load(), plugin.counters().errors_destroyed.load());
}

TEST(EventBridge, NativeErrorIsTranslated) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  ev.arm();
  plugin.complete_next(AGD_ERROR_CODE_RESOURCE_EXHAUSTED, "out of device memory");
  try {
    ev.wait();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Native);
    EXPECT_EQ(e.code(), ErrorCode::ResourceExhausted);
    EXPECT_NE(std::string(e.what()).find("out of device memory"), std::string::npos);
  }
  EXPECT_EQ(plugin.counters().errors_created.load(), plugin.counters().errors_destroyed.load());
}

TEST(EventBridge, ReadyEventErrorIsTranslated) {
  FakePlugin plugin;
  agd_event* raw = plugin.make_event({});
  plugin.complete_next(AGD_ERROR_CODE_DATA_LOSS, "corrupt");
  Event ev(plugin.runtime(), raw);
  try {
    ev.wait();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::DataLoss);
    EXPECT_EQ(e.function(), "event_error");
  }
  EXPECT_EQ(plugin.counters().callbacks_registered.load(), 0);
}

TEST(EventBridge, FaultWhileReadingErrorBecomesInternal) {
  FakePlugin::Knobs k;
  k.throwing_error_code = true;
  FakePlugin plugin(k);
  Event ev = make_native_event(plugin);
  ev.arm();
  plugin.complete_next(AGD_ERROR_CODE_ABORTED, "aborted");
  auto r = ev.signal()->peek();
  ASSERT_TRUE(r.has_value());
  ASSERT_FALSE(r->ok());
  EXPECT_EQ(r->error->kind(), ErrorKind::Internal);
  EXPECT_EQ(r->error->code(), ErrorCode::Internal);
  // The native error was still destroyed.
  EXPECT_EQ(plugin.counters().errors_created.load(), plugin.counters().errors_destroyed.load());
}

TEST(EventBridge, WaitForTimesOut) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  EXPECT_FALSE(ev.wait_for(std::chrono::milliseconds(10)));
  plugin.complete_all();
  EXPECT_TRUE(ev.wait_for(std::chrono::milliseconds(10)));
}

TEST(EventBridge, DestroyBeforeCompletion) {
  const auto base = live_callback_contexts();
  FakePlugin plugin;
  {
    Event ev = make_native_event(plugin);
    ev.arm();
  }
  EXPECT_EQ(plugin.counters().events_destroyed.load(), 1);
  EXPECT_EQ(live_callback_contexts(), base + 1);
  // The registered callback still fires and finds its context.
  plugin.complete_next();
  EXPECT_EQ(plugin.counters().callbacks_fired.load(), 1);
  EXPECT_EQ(live_callback_contexts(), base);
}

TEST(EventBridge, DroppedEventForgetsItsWaiter) {
  FakePlugin plugin;
  auto woke = std::make_shared<int>(0);
  {
    Event ev = make_native_event(plugin);
    EXPECT_FALSE(ev.poll(Waker([woke] { ++*woke; })).has_value());
    EXPECT_TRUE(ev.signal()->has_waiter());
  }
  plugin.complete_next();
  EXPECT_EQ(plugin.counters().callbacks_fired.load(), 1);
  EXPECT_EQ(*woke, 0);
}

TEST(EventBridge, ReassignedEventForgetsItsWaiter) {
  FakePlugin plugin;
  auto woke = std::make_shared<int>(0);
  Event ev = make_native_event(plugin);
  auto first = ev.signal();
  EXPECT_FALSE(ev.poll(Waker([woke] { ++*woke; })).has_value());
  ev = Event::ready();
  EXPECT_FALSE(first->has_waiter());
  plugin.complete_next();
  EXPECT_EQ(first->state(), SignalState::Satisfied);
  EXPECT_EQ(*woke, 0);
}

TEST(EventBridge, NullAndPrecompletedEvents) {
  FakePlugin plugin;
  Event none(plugin.runtime(), nullptr);
  EXPECT_TRUE(none.is_ready());
  EXPECT_NO_THROW(none.wait());

  Event failed = Event::ready(agd::validation_error(ErrorCode::Cancelled, "cancelled"));
  EXPECT_TRUE(failed.is_ready());
  EXPECT_THROW(failed.wait(), Error);
}

TEST(EventBridge, MovedFromEventRejectsUse) {
  FakePlugin plugin;
  Event a = make_native_event(plugin);
  Event b = std::move(a);
  EXPECT_FALSE(a.valid());
  EXPECT_TRUE(b.valid());
  try {
    a.wait();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::FailedPrecondition);
  }
  EXPECT_EQ(plugin.counters().events_destroyed.load(), 0);
}

TEST(EventBridge, AwaitResumesOnCompletion) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  std::thread t([&] {
    while (!ev.signal()->has_waiter()) std::this_thread::yield();
    plugin.complete_all();
  });
  LocalExecutor ex;
  EXPECT_NO_THROW(ex.block_on(await_event(ev), std::chrono::seconds(5)));
  t.join();
}

TEST(EventBridge, AwaitPropagatesError) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  plugin.complete_next(AGD_ERROR_CODE_UNAVAILABLE, "device lost");
  LocalExecutor ex;
  try {
    ex.block_on(await_event(ev));
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::Unavailable);
  }
}

TEST(EventBridge, AwaitOutsideExecutorFails) {
  FakePlugin plugin;
  Event ev = make_native_event(plugin);
  Task<void> t = await_event(ev);
  t.handle().resume();
  ASSERT_TRUE(t.done());
  try {
    t.result();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::FailedPrecondition);
  }
}

TEST(EventBridge, FaultCompletesWithInternalError) {
  auto sig = agd::async::CompletionSignal::create();
  agd::async::detail::complete_with_fault(*sig, "fault in completion callback", "boom");
  auto r = sig->peek();
  ASSERT_TRUE(r.has_value());
  ASSERT_FALSE(r->ok());
  EXPECT_EQ(r->error->kind(), ErrorKind::Internal);
  EXPECT_NE(std::string(r->error->what()).find("boom"), std::string::npos);
  // A second fault does not replace the first outcome.
  agd::async::detail::complete_with_fault(*sig, "later", "ignored");
  EXPECT_NE(std::string(sig->peek()->error->what()).find("boom"), std::string::npos);
}

TEST(HostEvent, SetCompletesSuccessfully) {
  FakePlugin plugin;
  Event ev = Event::create(plugin.runtime());
  EXPECT_FALSE(ev.is_ready());
  EXPECT_EQ(plugin.counters().callbacks_registered.load(), 1);
  ev.set();
  EXPECT_TRUE(ev.is_ready());
  EXPECT_NO_THROW(ev.wait());
  EXPECT_EQ(plugin.counters().host_events_set.load(), 1);
  EXPECT_EQ(plugin.pending_events(), 0u);
}

TEST(HostEvent, SetWithErrorRoundTripsThroughPlugin) {
  FakePlugin plugin;
  Event ev = Event::create(plugin.runtime());
  int woke = 0;
  EXPECT_FALSE(ev.poll(Waker([&] { ++woke; })).has_value());
  ev.set(agd::validation_error(ErrorCode::Aborted, "host gave up"));
  EXPECT_EQ(woke, 1);
  try {
    ev.wait();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Native);
    EXPECT_EQ(e.code(), ErrorCode::Aborted);
    EXPECT_NE(std::string(e.what()).find("host gave up"), std::string::npos);
  }
  EXPECT_EQ(plugin.counters().errors_created.load(), plugin.counters().errors_destroyed.load());
}

TEST(HostEvent, SecondSetIsRejectedByPlugin) {
  FakePlugin plugin;
  Event ev = Event::create(plugin.runtime());
  ev.set();
  try {
    ev.set();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Native);
    EXPECT_EQ(e.code(), ErrorCode::FailedPrecondition);
    EXPECT_EQ(e.function(), "event_set");
  }
}

TEST(HostEvent, OnlyHostCreatedNativeEventsCanBeSet) {
  FakePlugin plugin;
  Event none = Event::ready();
  try {
    none.set();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Validation);
    EXPECT_EQ(e.code(), ErrorCode::FailedPrecondition);
  }
  Event op = make_native_event(plugin);
  try {
    op.set();
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Native);
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }
}

TEST(HostEvent, UnsupportedOnOlderPlugins) {
  FakePlugin::Knobs k;
  k.abi_1_0 = true;
  FakePlugin plugin(k);
  EXPECT_FALSE(plugin.runtime()->api().has_host_events());
  try {
    (void)Event::create(plugin.runtime());
    FAIL() << "expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::Unimplemented);
  }
}

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "agd/async/executor.h"

#include <utility>

namespace agd {
namespace async {

namespace {
thread_local LocalExecutor* tl_current = nullptr;
} // namespace

LocalExecutor::CurrentGuard::CurrentGuard(LocalExecutor* ex) noexcept : prev_(tl_current) {
  tl_current = ex;
}

LocalExecutor::CurrentGuard::~CurrentGuard() { tl_current = prev_; }

LocalExecutor::LocalExecutor() : queue_(std::make_shared<Queue>()) {}

LocalExecutor::~LocalExecutor() {
  std::lock_guard<std::mutex> lg(queue_->mu);
  queue_->ready.clear();
}

LocalExecutor* LocalExecutor::current() noexcept { return tl_current; }

void LocalExecutor::push_(Queue& q, std::shared_ptr<detail::ResumeToken> tok) {
  {
    std::lock_guard<std::mutex> lg(q.mu);
    q.ready.push_back(std::move(tok));
  }
  q.cv.notify_one();
}

Waker LocalExecutor::waker_for(std::coroutine_handle<> h,
                               std::shared_ptr<detail::ResumeToken>* token_out) {
  auto tok = std::make_shared<detail::ResumeToken>(h);
  if (token_out) *token_out = tok;
  std::weak_ptr<Queue> weak = queue_;
  return Waker([weak, tok]() {
    if (auto q = weak.lock()) push_(*q, tok);
  });
}

void LocalExecutor::schedule(std::coroutine_handle<> h) {
  push_(*queue_, std::make_shared<detail::ResumeToken>(h));
}

std::size_t LocalExecutor::queued() const {
  std::lock_guard<std::mutex> lg(queue_->mu);
  return queue_->ready.size();
}

bool LocalExecutor::run_until_(const std::function<bool()>& done,
                               std::optional<std::chrono::steady_clock::time_point> deadline) {
  Queue& q = *queue_;
  for (;;) {
    if (done()) return true;
    std::shared_ptr<detail::ResumeToken> tok;
    {
      std::unique_lock<std::mutex> lk(q.mu);
      auto has_work = [&q] { return !q.ready.empty(); };
      if (deadline) {
        if (!q.cv.wait_until(lk, *deadline, has_work)) return false;
      } else {
        q.cv.wait(lk, has_work);
      }
      tok = std::move(q.ready.front());
      q.ready.pop_front();
    }
    if (tok->live.exchange(false, std::memory_order_acq_rel)) {
      tok->handle.resume();
    }
  }
}

} // namespace async
} // namespace agd

// src/core/util/worker.cpp
#include "blast/core/util/worker.hpp"

#include <utility>

namespace blast {

void StopSignal::request() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
}

void StopSignal::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  stop_ = false;
}

bool StopSignal::requested() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stop_;
}

bool StopSignal::wait_for(std::chrono::nanoseconds d) {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, d, [this] { return stop_; });
}

Worker::Worker(std::string name) : name_(std::move(name)) {}

Worker::~Worker() { join(); }

void Worker::start(std::function<void()> body) {
  if (thread_.joinable()) return;

  auto state = std::make_shared<State>();
  state_ = state;
  thread_ = std::thread([state, body = std::move(body)]() {
    body();
    {
      std::lock_guard<std::mutex> lk(state->mu);
      state->done = true;
    }
    state->cv.notify_all();
  });
}

bool Worker::join_for(std::chrono::nanoseconds timeout) {
  if (!thread_.joinable()) return true;

  bool finished = false;
  {
    std::unique_lock<std::mutex> lk(state_->mu);
    finished = state_->cv.wait_for(lk, timeout, [this] { return state_->done; });
  }

  if (!finished) return false;
  thread_.join();
  return true;
}

void Worker::join() {
  if (thread_.joinable()) thread_.join();
}

bool Worker::running() const {
  if (!thread_.joinable() || !state_) return false;
  std::lock_guard<std::mutex> lk(state_->mu);
  return !state_->done;
}

}  // namespace blast

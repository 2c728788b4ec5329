// include/blast/core/util/worker.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace blast {

// Interruptible sleep shared between an owner and its background loop.
class StopSignal {
 public:
  void request();
  void reset();
  [[nodiscard]] bool requested() const;

  // Sleeps up to `d`; returns true as soon as a stop was requested.
  bool wait_for(std::chrono::nanoseconds d);

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_{false};
};

// One long-lived background thread with a bounded join.
// A timed-out join leaves the thread joinable so the caller can log it and keep going;
// the thread is never detached, and join() or the destructor waits it out before the
// state its body uses is destroyed.
class Worker {
 public:
  explicit Worker(std::string name);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start(std::function<void()> body);

  // Returns true when the thread finished within `timeout` (or was never started).
  bool join_for(std::chrono::nanoseconds timeout);

  // Unbounded. Owners call this from their destructor.
  void join();

  [[nodiscard]] bool running() const;
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

 private:
  struct State {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
  };

  std::string name_;
  std::shared_ptr<State> state_;
  std::thread thread_;
};

}  // namespace blast

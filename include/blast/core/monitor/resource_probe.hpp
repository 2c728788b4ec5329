// include/blast/core/monitor/resource_probe.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "blast/core/status.hpp"
#include "blast/core/util/time.hpp"

namespace blast {

struct ResourceSnapshot {
  double memory_mb = 0.0;    // resident set size
  double cpu_percent = 0.0;  // process CPU since the previous sample; 0 on the first
  int thread_count = 0;
};

struct ThreadInfo {
  int tid = 0;
  std::string name;
  std::string state;  // R, S, D ... as the kernel reports it
};

// Process resource readings. Selected once at construction; callers never probe
// for platform support per call.
class ResourceProbe {
 public:
  virtual ~ResourceProbe() = default;

  virtual const char* name() const = 0;
  virtual Result<ResourceSnapshot> sample() = 0;
  // Current memory and thread count with the cpu_percent of the last sample().
  // Does not move the CPU baseline.
  virtual Result<ResourceSnapshot> peek() = 0;
  virtual Result<std::vector<ThreadInfo>> threads() = 0;
};

// Linux /proc/self reader.
class ProcResourceProbe final : public ResourceProbe {
 public:
  const char* name() const override { return "proc"; }
  Result<ResourceSnapshot> sample() override;
  Result<ResourceSnapshot> peek() override;
  Result<std::vector<ThreadInfo>> threads() override;

 private:
  std::mutex mu_;
  double last_cpu_percent_{0.0};
  bool have_prev_{false};
  std::uint64_t prev_ticks_{0};
  SteadyClock::time_point prev_at_{};
};

// Platforms without /proc: every reading is kUnsupported.
class NullResourceProbe final : public ResourceProbe {
 public:
  const char* name() const override { return "null"; }
  Result<ResourceSnapshot> sample() override;
  Result<ResourceSnapshot> peek() override;
  Result<std::vector<ThreadInfo>> threads() override;
};

// Proc probe when /proc/self is readable, otherwise the null probe.
std::unique_ptr<ResourceProbe> make_resource_probe();

}  // namespace blast

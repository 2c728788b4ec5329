// tests/fake_probe.hpp
#pragma once

#include <mutex>
#include <vector>

#include "blast/core/monitor/resource_probe.hpp"

namespace blast::test {

class FakeProbe final : public ResourceProbe {
 public:
  explicit FakeProbe(ResourceSnapshot s = {}) : snapshot_(s) {}

  const char* name() const override { return "fake"; }

  Result<ResourceSnapshot> sample() override {
    std::lock_guard<std::mutex> lk(mu_);
    ++samples_;
    return Result<ResourceSnapshot>::ok(snapshot_);
  }

  Result<ResourceSnapshot> peek() override {
    std::lock_guard<std::mutex> lk(mu_);
    ++peeks_;
    return Result<ResourceSnapshot>::ok(snapshot_);
  }

  Result<std::vector<ThreadInfo>> threads() override {
    return Result<std::vector<ThreadInfo>>::ok({ThreadInfo{1, "main", "R"}, ThreadInfo{2, "writer", "S"}});
  }

  void set(ResourceSnapshot s) {
    std::lock_guard<std::mutex> lk(mu_);
    snapshot_ = s;
  }

  int samples() const {
    std::lock_guard<std::mutex> lk(mu_);
    return samples_;
  }

  int peeks() const {
    std::lock_guard<std::mutex> lk(mu_);
    return peeks_;
  }

 private:
  mutable std::mutex mu_;
  ResourceSnapshot snapshot_;
  int samples_{0};
  int peeks_{0};
};

}  // namespace blast::test

// src/core/monitor/resource_probe.cpp
#include "blast/core/monitor/resource_probe.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace blast {
namespace {

namespace fs = std::filesystem;

constexpr const char* kStatusPath = "/proc/self/status";
constexpr const char* kStatPath = "/proc/self/stat";
constexpr const char* kTaskDir = "/proc/self/task";

// "VmRSS:     123456 kB" -> 123456
bool read_status_field(const std::string& key, long long* out) {
  std::ifstream f(kStatusPath);
  if (!f.is_open()) return false;

  std::string line;
  while (std::getline(f, line)) {
    if (line.rfind(key, 0) != 0) continue;
    std::istringstream iss(line.substr(key.size()));
    long long v = 0;
    if (!(iss >> v)) return false;
    *out = v;
    return true;
  }
  return false;
}

// utime + stime from a stat line. The comm field may contain spaces, so parse after ')'.
bool parse_cpu_ticks(const std::string& stat_line, std::uint64_t* out) {
  const auto close = stat_line.rfind(')');
  if (close == std::string::npos) return false;

  std::istringstream iss(stat_line.substr(close + 1));
  std::string field;
  // Fields after comm start at 3 (state); utime is 14, stime is 15.
  for (int i = 3; i < 14; ++i) {
    if (!(iss >> field)) return false;
  }
  std::uint64_t utime = 0;
  std::uint64_t stime = 0;
  if (!(iss >> utime >> stime)) return false;
  *out = utime + stime;
  return true;
}

std::string read_first_line(const fs::path& p) {
  std::ifstream f(p);
  std::string line;
  if (f.is_open()) std::getline(f, line);
  return line;
}

// Memory and thread count; cpu_percent is left to the caller.
Status read_memory(ResourceSnapshot* s) {
  long long rss_kb = 0;
  if (!read_status_field("VmRSS:", &rss_kb)) {
    return Status::io_error("failed reading VmRSS from /proc/self/status");
  }
  s->memory_mb = static_cast<double>(rss_kb) / 1024.0;

  long long threads = 0;
  if (read_status_field("Threads:", &threads)) s->thread_count = static_cast<int>(threads);
  return Status{};
}

}  // namespace

Result<ResourceSnapshot> ProcResourceProbe::sample() {
  ResourceSnapshot s;
  const Status mem = read_memory(&s);
  if (!mem.ok()) return Result<ResourceSnapshot>::err(mem);

  std::uint64_t ticks = 0;
  if (!parse_cpu_ticks(read_first_line(kStatPath), &ticks)) {
    return Result<ResourceSnapshot>::err(Status::parse_error("failed parsing /proc/self/stat"));
  }

  const auto now = SteadyClock::now();
  std::lock_guard<std::mutex> lk(mu_);
  if (have_prev_) {
    const double wall_s = seconds_since(prev_at_, now);
    const double hz = static_cast<double>(sysconf(_SC_CLK_TCK));
    if (wall_s > 0.0 && hz > 0.0 && ticks >= prev_ticks_) {
      const double cpu_s = static_cast<double>(ticks - prev_ticks_) / hz;
      s.cpu_percent = 100.0 * cpu_s / wall_s;
    }
  }
  have_prev_ = true;
  prev_ticks_ = ticks;
  prev_at_ = now;
  last_cpu_percent_ = s.cpu_percent;

  return Result<ResourceSnapshot>::ok(s);
}

Result<ResourceSnapshot> ProcResourceProbe::peek() {
  ResourceSnapshot s;
  const Status mem = read_memory(&s);
  if (!mem.ok()) return Result<ResourceSnapshot>::err(mem);

  std::lock_guard<std::mutex> lk(mu_);
  s.cpu_percent = last_cpu_percent_;
  return Result<ResourceSnapshot>::ok(s);
}

Result<std::vector<ThreadInfo>> ProcResourceProbe::threads() {
  std::vector<ThreadInfo> out;

  std::error_code ec;
  for (const auto& it : fs::directory_iterator(kTaskDir, ec)) {
    if (ec) break;

    ThreadInfo t;
    try {
      t.tid = std::stoi(it.path().filename().string());
    } catch (const std::exception&) {
      continue;
    }
    t.name = read_first_line(it.path() / "comm");

    const std::string stat = read_first_line(it.path() / "stat");
    const auto close = stat.rfind(')');
    if (close != std::string::npos && close + 2 < stat.size()) t.state = stat.substr(close + 2, 1);

    out.push_back(std::move(t));
  }
  if (ec) {
    return Result<std::vector<ThreadInfo>>::err(
        Status::io_error("failed listing /proc/self/task: " + ec.message()));
  }

  std::sort(out.begin(), out.end(), [](const ThreadInfo& a, const ThreadInfo& b) { return a.tid < b.tid; });
  return Result<std::vector<ThreadInfo>>::ok(std::move(out));
}

Result<ResourceSnapshot> NullResourceProbe::sample() {
  return Result<ResourceSnapshot>::err(Status::unsupported("resource sampling not available"));
}

Result<ResourceSnapshot> NullResourceProbe::peek() { return sample(); }

Result<std::vector<ThreadInfo>> NullResourceProbe::threads() {
  return Result<std::vector<ThreadInfo>>::err(Status::unsupported("thread listing not available"));
}

std::unique_ptr<ResourceProbe> make_resource_probe() {
  std::ifstream f(kStatusPath);
  if (f.is_open()) return std::make_unique<ProcResourceProbe>();
  return std::make_unique<NullResourceProbe>();
}

}  // namespace blast

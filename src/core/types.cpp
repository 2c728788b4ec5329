// src/core/types.cpp
#include "blast/core/types.hpp"

#include <algorithm>
#include <cctype>

namespace blast {

const char* to_string(Level level) {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarning: return "WARNING";
    case Level::kError: return "ERROR";
    case Level::kCritical: return "CRITICAL";
  }
  return "INFO";
}

bool parse_level(const std::string& s, Level* out) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "debug") *out = Level::kDebug;
  else if (v == "info") *out = Level::kInfo;
  else if (v == "warning" || v == "warn") *out = Level::kWarning;
  else if (v == "error") *out = Level::kError;
  else if (v == "critical") *out = Level::kCritical;
  else return false;
  return true;
}

const char* to_string(Category category) {
  switch (category) {
    case Category::kEvents: return "events";
    case Category::kErrors: return "errors";
    case Category::kPerformance: return "performance";
    case Category::kSerial: return "serial";
    case Category::kSystem: return "system";
    case Category::kData: return "data";
    case Category::kArtifact: return "artifact";
  }
  return "system";
}

}  // namespace blast

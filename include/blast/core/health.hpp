// include/blast/core/health.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "blast/core/util/json.hpp"

namespace blast {

// Read-only health answer each service exposes to the supervisory layer.
struct HealthReport {
  std::string component;
  bool healthy = true;
  std::vector<std::string> issues;
  JsonObject details;

  void flag(std::string issue) {
    healthy = false;
    issues.push_back(std::move(issue));
  }

  std::string to_json() const {
    JsonArray arr;
    for (const auto& i : issues) arr.push(i);
    JsonObject o;
    o.add("component", component)
        .add("healthy", healthy)
        .add_raw("issues", arr.str())
        .add("details", details);
    return o.str();
  }
};

}  // namespace blast

// include/blast/core/logging/log_record.hpp
#pragma once

#include <string>

#include "blast/core/types.hpp"

namespace blast {

// One unit of work for the router's consumer.
//
// payload by category:
//   JSON categories: a single JSON object ("{...}"); router fields are prepended
//   kSystem:         free text, formatted into a text line by the consumer
//   kArtifact:       whole file content; `source` is the file name inside the run dir
struct LogRecord {
  Category category = Category::kSystem;
  TimestampNs t_wall;
  Level level = Level::kInfo;
  std::string source;
  std::string payload;
};

}  // namespace blast

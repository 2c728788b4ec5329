// src/core/status.cpp
#include "blast/core/status.hpp"

namespace blast {

const char* to_string(Status::Code code) {
  switch (code) {
    case Status::Code::kOk: return "ok";
    case Status::Code::kInvalidArgument: return "invalid_argument";
    case Status::Code::kOutOfRange: return "out_of_range";
    case Status::Code::kNotFound: return "not_found";
    case Status::Code::kIoError: return "io_error";
    case Status::Code::kPermissionDenied: return "permission_denied";
    case Status::Code::kParseError: return "parse_error";
    case Status::Code::kCorruptData: return "corrupt_data";
    case Status::Code::kResourceExhausted: return "resource_exhausted";
    case Status::Code::kUnavailable: return "unavailable";
    case Status::Code::kUnsupported: return "unsupported";
    case Status::Code::kInternal: return "internal";
  }
  return "unknown";
}

}  // namespace blast

// src/core/util/json.cpp
#include "blast/core/util/json.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace blast {

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  return out;
}

std::string json_number(double v) {
  if (!std::isfinite(v)) return "null";
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6) << v;
  return ss.str();
}

void JsonObject::key_(const std::string& key) {
  if (!body_.empty()) body_ += ',';
  body_ += '"';
  body_ += json_escape(key);
  body_ += "\":";
}

JsonObject& JsonObject::add(const std::string& key, const std::string& value) {
  key_(key);
  body_ += '"';
  body_ += json_escape(value);
  body_ += '"';
  return *this;
}

JsonObject& JsonObject::add(const std::string& key, const char* value) {
  if (value == nullptr) return add_null(key);
  return add(key, std::string(value));
}

JsonObject& JsonObject::add(const std::string& key, bool value) {
  return add_raw(key, value ? "true" : "false");
}

JsonObject& JsonObject::add(const std::string& key, double value) {
  return add_raw(key, json_number(value));
}

JsonObject& JsonObject::add_raw(const std::string& key, const std::string& json) {
  key_(key);
  body_ += json;
  return *this;
}

JsonObject& JsonObject::add_null(const std::string& key) { return add_raw(key, "null"); }

JsonArray& JsonArray::push(const std::string& value) {
  return push_raw("\"" + json_escape(value) + "\"");
}

JsonArray& JsonArray::push(double value) { return push_raw(json_number(value)); }

JsonArray& JsonArray::push_raw(const std::string& json) {
  if (!body_.empty()) body_ += ',';
  body_ += json;
  ++size_;
  return *this;
}

}  // namespace blast

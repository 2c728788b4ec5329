// include/blast/core/util/json.hpp
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

namespace blast {

// Minimal JSON writers for log records.
// Output is one line, keys in insertion order, no pretty printing.

std::string json_escape(const std::string& s);

// Fixed 6-digit precision; NaN/inf become null.
std::string json_number(double v);

class JsonObject {
 public:
  JsonObject& add(const std::string& key, const std::string& value);
  JsonObject& add(const std::string& key, const char* value);
  JsonObject& add(const std::string& key, bool value);
  JsonObject& add(const std::string& key, double value);

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  JsonObject& add(const std::string& key, T value) {
    return add_raw(key, std::to_string(value));
  }

  JsonObject& add(const std::string& key, const JsonObject& value) { return add_raw(key, value.str()); }

  // `json` must already be valid JSON (object, array, number, literal).
  JsonObject& add_raw(const std::string& key, const std::string& json);
  JsonObject& add_null(const std::string& key);

  [[nodiscard]] bool empty() const noexcept { return body_.empty(); }
  [[nodiscard]] std::string str() const { return "{" + body_ + "}"; }

 private:
  void key_(const std::string& key);

  std::string body_;
};

class JsonArray {
 public:
  JsonArray& push(const std::string& value);
  JsonArray& push(double value);
  JsonArray& push(const JsonObject& value) { return push_raw(value.str()); }
  JsonArray& push_raw(const std::string& json);

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::string str() const { return "[" + body_ + "]"; }

 private:
  std::string body_;
  std::size_t size_{0};
};

}  // namespace blast

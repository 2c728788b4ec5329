// tests/test_status_json.cpp
#include <cmath>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "blast/core/status.hpp"
#include "blast/core/types.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/time.hpp"

namespace blast {
namespace {

Status fails_then_propagates() {
  BLAST_RETURN_IF_ERROR(Status::io_error("disk"));
  return Status::internal("unreachable");
}

TEST(StatusTest, DefaultIsOk) {
  Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kOk);
}

TEST(StatusTest, ReturnIfErrorPropagatesFirstFailure) {
  const Status s = fails_then_propagates();
  EXPECT_EQ(s.code(), Status::Code::kIoError);
  EXPECT_EQ(s.message(), "disk");
}

TEST(StatusTest, ResultCarriesValueOrStatus) {
  auto ok = Result<int>::ok(7);
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(*ok, 7);

  auto err = Result<int>::err(Status::resource_exhausted("Log queue is full"));
  EXPECT_FALSE(err.ok());
  EXPECT_EQ(err.value_if_ok(), nullptr);
  EXPECT_EQ(err.status().code(), Status::Code::kResourceExhausted);
}

TEST(JsonTest, EscapesQuotesAndControlCharacters) {
  EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
  EXPECT_EQ(json_escape("line\nnext\ttab"), "line\\nnext\\ttab");
  EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonTest, NonFiniteNumbersBecomeNull) {
  EXPECT_EQ(json_number(std::numeric_limits<double>::infinity()), "null");
  EXPECT_EQ(json_number(std::nan("")), "null");
  EXPECT_EQ(json_number(1.5), "1.500000");
}

TEST(JsonTest, ObjectKeepsInsertionOrder) {
  JsonObject inner;
  inner.add("k", 1);

  JsonObject o;
  o.add("z", "last?").add("a", true).add("n", 3).add("obj", inner).add_null("none");
  EXPECT_EQ(o.str(), "{\"z\":\"last?\",\"a\":true,\"n\":3,\"obj\":{\"k\":1},\"none\":null}");

  JsonArray arr;
  arr.push("x").push(2.0).push(inner);
  EXPECT_EQ(arr.size(), 3u);
  EXPECT_EQ(arr.str(), "[\"x\",2.000000,{\"k\":1}]");
}

TEST(LevelTest, ParsesCaseInsensitively) {
  Level l = Level::kInfo;
  ASSERT_TRUE(parse_level("WARN", &l));
  EXPECT_EQ(l, Level::kWarning);
  ASSERT_TRUE(parse_level("Critical", &l));
  EXPECT_EQ(l, Level::kCritical);
  EXPECT_FALSE(parse_level("verbose", &l));
  EXPECT_STREQ(to_string(Level::kError), "ERROR");
}

TEST(TimeTest, Iso8601IsUtcWithMillis) {
  // 2021-01-01T00:00:00.250Z
  const TimestampNs t{1609459200LL * 1'000'000'000 + 250'000'000};
  EXPECT_EQ(iso8601_utc(t), "2021-01-01T00:00:00.250Z");
}

TEST(TimeTest, RunStampShape) {
  const std::string s = run_stamp(wall_now());
  // YYYYMMDD_HHMMSS_mmm
  ASSERT_EQ(s.size(), 19u);
  EXPECT_EQ(s[8], '_');
  EXPECT_EQ(s[15], '_');
}

}  // namespace
}  // namespace blast

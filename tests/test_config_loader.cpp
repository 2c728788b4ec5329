// tests/test_config_loader.cpp
#include <cmath>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "blast/core/util/config_loader.hpp"
#include "blast/core/util/repro_hash.hpp"
#include "test_util.hpp"

namespace blast {
namespace {

void write(const std::filesystem::path& p, const std::string& text) {
  std::ofstream f(p);
  f << text;
}

TEST(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
  auto r = parse_config("{}");
  ASSERT_TRUE(r.ok()) << r.status().message();
  const Config& c = *r;
  EXPECT_EQ(c.node_id, "blast_stand");
  EXPECT_EQ(c.logging.queue_capacity, 10000u);
  EXPECT_EQ(c.logging.backup_count, 7u);
  EXPECT_DOUBLE_EQ(c.performance.log_interval_s, 60.0);
  ASSERT_EQ(c.watchdog.components.size(), 4u);
  EXPECT_EQ(c.recovery.failure_threshold, 10);
  EXPECT_EQ(c.recovery.policies.at("serial_timeout").max_attempts, 5);
  EXPECT_DOUBLE_EQ(c.recovery.policies.at("resource_exhaustion").initial_delay_s, 2.0);
}

TEST(ConfigLoaderTest, ReadsSectionsAndKeepsUnsetPolicyFields) {
  auto r = parse_config(R"(
node_id: stand_b
logging: {base_dir: /tmp/x, keep_runs: 3, console_level: warning}
watchdog:
  min_heartbeat_interval_s: 0.5
  components: {acq: 2.0}
recovery:
  policies:
    network: {max_attempts: 9}
sensors:
  - {id: pt1, name: Chamber, unit: PSI, warning: 600, danger: 750, critical: 850}
  - {id: tc1, unit: C, warning: 70}
)");
  ASSERT_TRUE(r.ok()) << r.status().message();
  const Config& c = *r;
  EXPECT_EQ(c.node_id, "stand_b");
  EXPECT_EQ(c.logging.keep_runs, 3u);
  ASSERT_EQ(c.watchdog.components.size(), 1u);
  EXPECT_EQ(c.watchdog.components[0].name, "acq");
  EXPECT_EQ(c.recovery.policies.at("network").max_attempts, 9);
  EXPECT_DOUBLE_EQ(c.recovery.policies.at("network").initial_delay_s, 0.5);
  ASSERT_EQ(c.sensors.size(), 2u);
  EXPECT_EQ(c.sensors[1].name, "tc1");
  EXPECT_TRUE(std::isinf(c.sensors[1].danger));
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
  EXPECT_EQ(parse_config("performance: {sample_interval_s: 0}").status().code(),
            Status::Code::kInvalidArgument);
  EXPECT_EQ(parse_config("logging: {queue_capacity: 0}").status().code(),
            Status::Code::kInvalidArgument);
  EXPECT_EQ(parse_config("logging: {base_dir: ''}").status().code(),
            Status::Code::kInvalidArgument);
  EXPECT_EQ(parse_config("watchdog: {components: {acq: 1.0}}").status().code(),
            Status::Code::kInvalidArgument);
  EXPECT_EQ(parse_config("recovery: {policies: {cosmic_rays: {max_attempts: 1}}}").status().code(),
            Status::Code::kInvalidArgument);
  EXPECT_EQ(parse_config("sensors: [{id: pt1, warning: 600, danger: 500}]").status().code(),
            Status::Code::kInvalidArgument);
}

TEST(ConfigLoaderTest, BadScalarIsParseError) {
  EXPECT_EQ(parse_config("performance: {sample_interval_s: fast}").status().code(),
            Status::Code::kParseError);
}

TEST(ConfigLoaderTest, IncludesAreMergedAndOverridden) {
  test::TempDir dir;
  write(dir.path() / "base.yaml", "node_id: from_base\nserial: {port: /dev/ttyACM0, baudrate: 9600}\n");
  write(dir.path() / "main.yaml", "includes: [base.yaml]\nserial: {baudrate: 57600}\n");

  auto r = load_config((dir.path() / "main.yaml").string());
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->node_id, "from_base");
  EXPECT_EQ(r->serial.port, "/dev/ttyACM0");
  EXPECT_EQ(r->serial.baudrate, 57600);
}

TEST(ConfigLoaderTest, IncludeCycleIsRejected) {
  test::TempDir dir;
  write(dir.path() / "a.yaml", "includes: [b.yaml]\n");
  write(dir.path() / "b.yaml", "includes: [a.yaml]\n");
  EXPECT_EQ(load_config((dir.path() / "a.yaml").string()).status().code(),
            Status::Code::kInvalidArgument);
}

TEST(ConfigLoaderTest, MissingFileIsNotFound) {
  EXPECT_EQ(load_config("/nonexistent/blast.yaml").status().code(), Status::Code::kNotFound);
}

TEST(ConfigHashTest, StableAndSensitive) {
  Config a;
  Config b;
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(b));
  EXPECT_EQ(compute_config_hash(a).size(), 16u);

  b.recovery.policies["network"].max_attempts = 6;
  EXPECT_NE(compute_config_hash(a), compute_config_hash(b));
}

}  // namespace
}  // namespace blast

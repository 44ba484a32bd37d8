#include "../include/queue_statistics.hpp"
#include "../include/triage_config.hpp"
#include "../include/triage_queue_impl.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>

namespace {

triage::Patient withSeverity(int id, int severity) {
  triage::Patient p;
  p.id = id;
  p.name = "P" + std::to_string(id);
  p.severity = severity;
  p.arrival_time = id;
  return p;
}

}  // namespace

TEST(QueueStatisticsTest, EmptySnapshotHasNoSeverityStats) {
  EXPECT_FALSE(triage::ComputeSeverityStats({}).has_value());
}

TEST(QueueStatisticsTest, SeverityAverageMinMax) {
  auto stats = triage::ComputeSeverityStats(
      {withSeverity(1, 3), withSeverity(2, 1), withSeverity(3, 5), withSeverity(4, 2)});
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->count, 4u);
  EXPECT_DOUBLE_EQ(stats->average, 2.75);
  EXPECT_EQ(stats->min, 1);
  EXPECT_EQ(stats->max, 5);
}

TEST(QueueStatisticsTest, CapacityUsage) {
  EXPECT_FALSE(triage::CapacityUsage(3, std::nullopt).has_value());
  EXPECT_DOUBLE_EQ(*triage::CapacityUsage(0, 4), 0.0);
  EXPECT_DOUBLE_EQ(*triage::CapacityUsage(3, 4), 75.0);
}

TEST(QueueStatisticsTest, ComputedFromQueueSnapshot) {
  triage::TriageQueueImpl queue(5);
  queue.Arrive(withSeverity(1, 4));
  queue.Arrive(withSeverity(2, 2));

  auto stats = triage::ComputeQueueStatistics(queue);
  EXPECT_EQ(stats.size, 2u);
  EXPECT_EQ(stats.capacity, std::optional<std::size_t>(5));
  EXPECT_DOUBLE_EQ(*stats.usage_percent, 40.0);
  EXPECT_EQ(stats.severity->min, 2);
  EXPECT_EQ(stats.severity->max, 4);

  auto json = stats.ToJson();
  EXPECT_EQ(json["size"], 2);
  EXPECT_EQ(json["capacity"], 5);
  EXPECT_EQ(json["severity"]["max"], 4);
}

TEST(QueueStatisticsTest, JsonUsesNullForUnboundedEmptyQueue) {
  triage::TriageQueueImpl queue;
  auto json = triage::ComputeQueueStatistics(queue).ToJson();
  EXPECT_TRUE(json["capacity"].is_null());
  EXPECT_TRUE(json["usage_percent"].is_null());
  EXPECT_TRUE(json["severity"].is_null());
}

TEST(QueueStatisticsTest, PatientJsonCarriesAllFields) {
  auto json = triage::PatientToJson(withSeverity(9, 4));
  EXPECT_EQ(json["id"], 9);
  EXPECT_EQ(json["name"], "P9");
  EXPECT_EQ(json["severity"], 4);
  EXPECT_EQ(json["arrival_time"], 9);
}

// Configuration tests
TEST(TriageConfigTest, ParsesCapacityAndLevel) {
  auto config = triage::ParseConfig(R"({"capacity": 5, "log_level": "debug"})");
  ASSERT_TRUE(config.capacity.has_value());
  EXPECT_EQ(*config.capacity, 5u);
  EXPECT_EQ(config.log_level, triage::observability::LogLevel::DEBUG);
}

TEST(TriageConfigTest, MissingKeysKeepDefaults) {
  auto config = triage::ParseConfig("{}");
  EXPECT_FALSE(config.capacity.has_value());
  EXPECT_EQ(config.log_level, triage::observability::LogLevel::INFO);

  config = triage::ParseConfig(R"({"capacity": null})");
  EXPECT_FALSE(config.capacity.has_value());
}

TEST(TriageConfigTest, RejectsInvalidDocuments) {
  EXPECT_THROW(triage::ParseConfig("{not json"), triage::ConfigError);
  EXPECT_THROW(triage::ParseConfig("[1, 2]"), triage::ConfigError);
  EXPECT_THROW(triage::ParseConfig(R"({"capacity": 0})"), triage::ConfigError);
  EXPECT_THROW(triage::ParseConfig(R"({"capacity": -3})"), triage::ConfigError);
  EXPECT_THROW(triage::ParseConfig(R"({"capacity": "ten"})"), triage::ConfigError);
  EXPECT_THROW(triage::ParseConfig(R"({"log_level": "LOUD"})"), triage::ConfigError);
}

TEST(TriageConfigTest, LargeUnsignedCapacityDoesNotWrap) {
  if (sizeof(std::size_t) >= sizeof(std::uint64_t)) {
    auto config = triage::ParseConfig(R"({"capacity": 18446744073709551615})");
    ASSERT_TRUE(config.capacity.has_value());
    EXPECT_EQ(*config.capacity, static_cast<std::size_t>(UINT64_MAX));
  } else {
    EXPECT_THROW(triage::ParseConfig(R"({"capacity": 18446744073709551615})"),
                 triage::ConfigError);
  }

  try {
    triage::ParseConfig(R"({"capacity": -5})");
    FAIL() << "negative capacity accepted";
  } catch (const triage::ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("got -5"), std::string::npos);
  }
}

TEST(TriageConfigTest, ParseLogLevelIsCaseInsensitive) {
  EXPECT_EQ(triage::ParseLogLevel("warn"), triage::observability::LogLevel::WARN);
  EXPECT_EQ(triage::ParseLogLevel("Error"), triage::observability::LogLevel::ERROR);
  EXPECT_THROW(triage::ParseLogLevel(""), triage::ConfigError);
}

TEST(TriageConfigTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "triage_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"capacity": 12, "log_level": "WARN"})";
  }

  auto config = triage::LoadConfigFile(path);
  std::remove(path.c_str());

  EXPECT_EQ(config.capacity, std::optional<std::size_t>(12));
  EXPECT_EQ(config.log_level, triage::observability::LogLevel::WARN);
}

TEST(TriageConfigTest, MissingFileRaisesConfigError) {
  EXPECT_THROW(triage::LoadConfigFile("/nonexistent/triage.json"), triage::ConfigError);
}

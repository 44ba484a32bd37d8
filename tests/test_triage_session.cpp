#include "../include/observability/logger.hpp"
#include "../include/observability/metrics.hpp"
#include "../include/triage_queue_impl.hpp"
#include "../include/triage_session.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

class TriageSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = std::make_unique<triage::TriageSession>(
        std::make_unique<triage::TriageQueueImpl>(2), metrics_);
  }

  triage::observability::MetricsCollector metrics_;
  std::unique_ptr<triage::TriageSession> session_;
};

TEST_F(TriageSessionTest, StampsIncreasingArrivalTimes) {
  auto first = session_->Admit(101, "John", 3);
  auto second = session_->Admit(102, "Sarah", 4);

  ASSERT_TRUE(first.admitted());
  ASSERT_TRUE(second.admitted());
  EXPECT_EQ(first.patient->arrival_time, 1);
  EXPECT_EQ(second.patient->arrival_time, 2);
  EXPECT_EQ(session_->ArrivalsStamped(), 2);
}

TEST_F(TriageSessionTest, TrimsNames) {
  auto result = session_->Admit(1, "  Mike \t", 2);
  ASSERT_TRUE(result.admitted());
  EXPECT_EQ(result.patient->name, "Mike");
  EXPECT_EQ(session_->Front()->name, "Mike");
}

TEST_F(TriageSessionTest, RefusesBlankNameWithoutStamping) {
  auto result = session_->Admit(1, "   ", 3);
  EXPECT_EQ(result.status, triage::AdmissionStatus::kInvalidName);
  EXPECT_FALSE(result.patient.has_value());
  EXPECT_EQ(session_->ArrivalsStamped(), 0);
  EXPECT_TRUE(session_->Queue().IsEmpty());
  EXPECT_EQ(metrics_.counterValue("triage_admissions_invalid_total"), 1.0);
}

TEST_F(TriageSessionTest, RefusesSeverityOutsideOneToFive) {
  EXPECT_EQ(session_->Admit(1, "Ann", 0).status, triage::AdmissionStatus::kInvalidSeverity);
  EXPECT_EQ(session_->Admit(2, "Ben", 6).status, triage::AdmissionStatus::kInvalidSeverity);
  EXPECT_TRUE(session_->Admit(3, "Cal", 1).admitted());
  EXPECT_TRUE(session_->Admit(4, "Dee", 5).admitted());
  EXPECT_EQ(session_->ArrivalsStamped(), 2);
}

TEST_F(TriageSessionTest, FullQueueStillConsumesArrivalNumber) {
  ASSERT_TRUE(session_->Admit(1, "Ann", 3).admitted());
  ASSERT_TRUE(session_->Admit(2, "Ben", 3).admitted());

  auto refused = session_->Admit(3, "Cal", 3);
  EXPECT_EQ(refused.status, triage::AdmissionStatus::kQueueFull);
  ASSERT_TRUE(refused.patient.has_value());
  EXPECT_EQ(refused.patient->arrival_time, 3);
  EXPECT_EQ(session_->Queue().Size(), 2u);

  session_->ServeNext();
  auto admitted = session_->Admit(3, "Cal", 3);
  ASSERT_TRUE(admitted.admitted());
  EXPECT_EQ(admitted.patient->arrival_time, 4);
}

TEST_F(TriageSessionTest, AllowsDuplicateIds) {
  EXPECT_TRUE(session_->Admit(7, "Ann", 2).admitted());
  EXPECT_TRUE(session_->Admit(7, "Ann", 2).admitted());

  auto snapshot = session_->Snapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0].id, snapshot[1].id);
  EXPECT_NE(snapshot[0].arrival_time, snapshot[1].arrival_time);
}

TEST_F(TriageSessionTest, ServesFifoAndReportsUnderflow) {
  session_->Admit(1, "Ann", 1);
  session_->Admit(2, "Ben", 5);

  EXPECT_EQ(session_->ServeNext()->name, "Ann");
  EXPECT_EQ(session_->ServeNext()->name, "Ben");
  EXPECT_FALSE(session_->ServeNext().has_value());
}

TEST_F(TriageSessionTest, RecordsMetrics) {
  session_->Admit(1, "Ann", 1);
  session_->Admit(2, "Ben", 2);
  session_->Admit(3, "Cal", 3);  // full
  session_->ServeNext();
  session_->ServeNext();
  session_->ServeNext();  // empty

  EXPECT_EQ(metrics_.counterValue("triage_admissions_total"), 2.0);
  EXPECT_EQ(metrics_.counterValue("triage_admissions_rejected_total"), 1.0);
  EXPECT_EQ(metrics_.counterValue("triage_served_total"), 2.0);
  EXPECT_EQ(metrics_.counterValue("triage_serve_underflow_total"), 1.0);
  EXPECT_EQ(metrics_.gaugeValue("triage_queue_depth"), 0.0);

  const std::string exported = metrics_.exportMetrics();
  EXPECT_NE(exported.find("# TYPE triage_admissions_total counter"), std::string::npos);
  EXPECT_NE(exported.find("# HELP triage_queue_depth Patients currently waiting"), std::string::npos);
}

TEST_F(TriageSessionTest, StatisticsFollowTheQueue) {
  session_->Admit(1, "Ann", 2);
  session_->Admit(2, "Ben", 5);

  auto stats = session_->Statistics();
  EXPECT_EQ(stats.size, 2u);
  ASSERT_TRUE(stats.usage_percent.has_value());
  EXPECT_DOUBLE_EQ(*stats.usage_percent, 100.0);
  ASSERT_TRUE(stats.severity.has_value());
  EXPECT_DOUBLE_EQ(stats.severity->average, 3.5);
}

TEST(TriageSessionConfigTest, BuildsQueueFromConfig) {
  triage::TriageConfig config;
  config.capacity = 1;
  triage::TriageSession session(config);

  EXPECT_EQ(session.Queue().Capacity(), std::optional<std::size_t>(1));
  EXPECT_TRUE(session.Admit(1, "Ann", 3).admitted());
  EXPECT_EQ(session.Admit(2, "Ben", 3).status, triage::AdmissionStatus::kQueueFull);
}

TEST(TriageSessionConfigTest, UnboundedWhenCapacityUnset) {
  triage::TriageSession session(triage::TriageConfig{});
  EXPECT_FALSE(session.Queue().Capacity().has_value());
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(session.Admit(i, "P", 1).admitted());
  }
}

TEST(TriageSessionConfigTest, RejectsNullQueue) {
  triage::observability::MetricsCollector metrics;
  EXPECT_THROW(triage::TriageSession(nullptr, metrics), std::invalid_argument);
}

TEST_F(TriageSessionTest, AdmitsNamesThatAreNotUtf8) {
  auto& logger = triage::observability::Logger::getInstance();
  const auto previous_level = logger.getLogLevel();
  std::ostringstream sink;
  logger.setOutputStream(sink);
  logger.setLogLevel(triage::observability::LogLevel::INFO);

  auto result = session_->Admit(101, "Jos\xe9", 3);

  logger.setOutputStream(std::cerr);
  logger.setLogLevel(previous_level);

  ASSERT_TRUE(result.admitted());
  EXPECT_EQ(session_->Front()->name, "Jos\xe9");

  const std::string logged = sink.str();
  EXPECT_NE(logged.find("\"message\":\"patient admitted\""), std::string::npos);
  // The invalid byte is replaced by U+FFFD in the log line
  EXPECT_NE(logged.find("Jos\xEF\xBF\xBD"), std::string::npos);
}

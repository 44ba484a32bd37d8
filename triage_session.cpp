#include "triage_session.hpp"

#include "observability/logger.hpp"
#include "triage_queue_impl.hpp"
#include "triage_queue_thread_safe.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace triage {

namespace {

std::string trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

void registerMetrics(observability::MetricsCollector& metrics) {
  metrics.describe("triage_admissions_total", "Patients admitted to the queue");
  metrics.describe("triage_admissions_rejected_total", "Admissions refused because the queue was full");
  metrics.describe("triage_admissions_invalid_total", "Admissions refused by record validation");
  metrics.describe("triage_served_total", "Patients served from the front of the queue");
  metrics.describe("triage_serve_underflow_total", "Serve requests on an empty queue");
  metrics.describe("triage_queue_depth", "Patients currently waiting");
}

}  // namespace

const char* AdmissionStatusToString(AdmissionStatus status) {
  switch (status) {
    case AdmissionStatus::kAdmitted: return "admitted";
    case AdmissionStatus::kQueueFull: return "queue_full";
    case AdmissionStatus::kInvalidName: return "invalid_name";
    case AdmissionStatus::kInvalidSeverity: return "invalid_severity";
  }
  return "unknown";
}

TriageSession::TriageSession(const TriageConfig& config)
    : TriageSession(std::make_unique<TriageQueueThreadSafe>(
                        std::make_unique<TriageQueueImpl>(config.capacity)),
                    observability::getGlobalMetrics()) {}

TriageSession::TriageSession(std::unique_ptr<TriageQueue> queue,
                             observability::MetricsCollector& metrics)
    : queue_(std::move(queue)), metrics_(metrics) {
  if (!queue_) {
    throw std::invalid_argument("TriageSession requires a queue");
  }
  registerMetrics(metrics_);
  updateDepthGauge();

  const auto capacity = queue_->Capacity();
  TRIAGE_LOG_BUILDER(observability::LogLevel::INFO, "triage session started")
      .field("capacity", capacity ? nlohmann::json(*capacity) : nlohmann::json("unlimited"));
}

AdmissionResult TriageSession::Admit(int id, const std::string& name, int severity) {
  const std::string clean_name = trim(name);

  if (clean_name.empty()) {
    metrics_.incrementCounter("triage_admissions_invalid_total");
    TRIAGE_LOG_BUILDER(observability::LogLevel::WARN, "admission refused: empty name")
        .field("id", id);
    return {AdmissionStatus::kInvalidName, std::nullopt};
  }

  if (severity < kMinSeverity || severity > kMaxSeverity) {
    metrics_.incrementCounter("triage_admissions_invalid_total");
    TRIAGE_LOG_BUILDER(observability::LogLevel::WARN, "admission refused: severity out of range")
        .field("id", id)
        .field("severity", severity);
    return {AdmissionStatus::kInvalidSeverity, std::nullopt};
  }

  Patient patient;
  patient.id = id;
  patient.name = clean_name;
  patient.severity = severity;
  patient.arrival_time = ++arrival_counter_;

  if (!queue_->Arrive(patient)) {
    metrics_.incrementCounter("triage_admissions_rejected_total");
    TRIAGE_LOG_BUILDER(observability::LogLevel::WARN, "admission refused: queue full")
        .field("patient", PatientToJson(patient))
        .field("size", queue_->Size());
    return {AdmissionStatus::kQueueFull, patient};
  }

  metrics_.incrementCounter("triage_admissions_total");
  updateDepthGauge();
  TRIAGE_LOG_BUILDER(observability::LogLevel::INFO, "patient admitted")
      .field("patient", PatientToJson(patient))
      .field("size", queue_->Size());
  return {AdmissionStatus::kAdmitted, patient};
}

std::optional<Patient> TriageSession::ServeNext() {
  auto served = queue_->ServeNext();
  if (!served) {
    metrics_.incrementCounter("triage_serve_underflow_total");
    TRIAGE_LOG_INFO("serve requested on empty queue");
    return std::nullopt;
  }

  metrics_.incrementCounter("triage_served_total");
  updateDepthGauge();
  TRIAGE_LOG_BUILDER(observability::LogLevel::INFO, "patient served")
      .field("patient", PatientToJson(*served))
      .field("size", queue_->Size());
  return served;
}

void TriageSession::updateDepthGauge() {
  metrics_.setGauge("triage_queue_depth", static_cast<double>(queue_->Size()));
}

}  // namespace triage

#ifndef TRIAGE_SESSION_HPP_
#define TRIAGE_SESSION_HPP_

#include "observability/metrics.hpp"
#include "patient.hpp"
#include "queue_statistics.hpp"
#include "triage_config.hpp"
#include "triage_queue.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace triage {

constexpr int kMinSeverity = 1;
constexpr int kMaxSeverity = 5;

enum class AdmissionStatus {
  kAdmitted,
  kQueueFull,
  kInvalidName,
  kInvalidSeverity
};

const char* AdmissionStatusToString(AdmissionStatus status);

struct AdmissionResult {
  AdmissionStatus status;
  // The stamped record; absent when validation refused it
  std::optional<Patient> patient;

  bool admitted() const { return status == AdmissionStatus::kAdmitted; }
};

/**
 * One run of the triage desk.
 *
 * Owns the queue and the arrival counter used to stamp new patients, and
 * validates records before they reach the queue. All outcomes are logged and
 * counted.
 */
class TriageSession {
 public:
  explicit TriageSession(const TriageConfig& config);

  // Takes an existing queue; used by tests to inject a specific engine.
  TriageSession(std::unique_ptr<TriageQueue> queue,
                observability::MetricsCollector& metrics);

  TriageSession(const TriageSession&) = delete;
  TriageSession& operator=(const TriageSession&) = delete;

  /**
   * Validates and stamps a new patient, then admits it at the rear.
   * A valid record consumes an arrival number even if the queue is full.
   */
  AdmissionResult Admit(int id, const std::string& name, int severity);

  std::optional<Patient> ServeNext();

  std::optional<Patient> Front() const { return queue_->Front(); }
  std::optional<Patient> Rear() const { return queue_->Rear(); }
  std::vector<Patient> Snapshot() const { return queue_->TraverseForward(); }
  QueueStatistics Statistics() const { return ComputeQueueStatistics(*queue_); }

  const TriageQueue& Queue() const { return *queue_; }

  int ArrivalsStamped() const { return arrival_counter_; }

 private:
  void updateDepthGauge();

  std::unique_ptr<TriageQueue> queue_;
  observability::MetricsCollector& metrics_;
  int arrival_counter_ = 0;
};

}  // namespace triage

#endif  // TRIAGE_SESSION_HPP_

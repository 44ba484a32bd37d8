#ifndef TRIAGE_QUEUE_STATISTICS_HPP_
#define TRIAGE_QUEUE_STATISTICS_HPP_

#include "patient.hpp"
#include "triage_queue.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace triage {

/**
 * Severity summary over a snapshot of queued patients.
 */
struct SeverityStats {
  std::size_t count = 0;
  double average = 0.0;
  int min = 0;
  int max = 0;
};

/**
 * Occupancy and severity summary of a queue at one point in time.
 */
struct QueueStatistics {
  std::size_t size = 0;
  std::optional<std::size_t> capacity;
  std::optional<double> usage_percent;   // nullopt when unbounded
  std::optional<SeverityStats> severity; // nullopt when empty

  nlohmann::json ToJson() const;
};

// nullopt for an empty snapshot.
std::optional<SeverityStats> ComputeSeverityStats(const std::vector<Patient>& snapshot);

// Percentage of `capacity` taken by `size`; nullopt when unbounded.
std::optional<double> CapacityUsage(std::size_t size, std::optional<std::size_t> capacity);

// Takes a single forward snapshot so size and severity agree.
QueueStatistics ComputeQueueStatistics(const TriageQueue& queue);

nlohmann::json PatientToJson(const Patient& patient);

}  // namespace triage

#endif  // TRIAGE_QUEUE_STATISTICS_HPP_

#include "queue_statistics.hpp"

#include <algorithm>

namespace triage {

std::optional<SeverityStats> ComputeSeverityStats(const std::vector<Patient>& snapshot) {
  if (snapshot.empty()) {
    return std::nullopt;
  }

  SeverityStats stats;
  stats.count = snapshot.size();
  stats.min = snapshot.front().severity;
  stats.max = snapshot.front().severity;

  long long total = 0;
  for (const Patient& p : snapshot) {
    total += p.severity;
    stats.min = std::min(stats.min, p.severity);
    stats.max = std::max(stats.max, p.severity);
  }
  stats.average = static_cast<double>(total) / static_cast<double>(snapshot.size());
  return stats;
}

std::optional<double> CapacityUsage(std::size_t size, std::optional<std::size_t> capacity) {
  if (!capacity || *capacity == 0) {
    return std::nullopt;
  }
  return static_cast<double>(size) / static_cast<double>(*capacity) * 100.0;
}

QueueStatistics ComputeQueueStatistics(const TriageQueue& queue) {
  const std::vector<Patient> snapshot = queue.TraverseForward();

  QueueStatistics stats;
  stats.size = snapshot.size();
  stats.capacity = queue.Capacity();
  stats.usage_percent = CapacityUsage(stats.size, stats.capacity);
  stats.severity = ComputeSeverityStats(snapshot);
  return stats;
}

nlohmann::json QueueStatistics::ToJson() const {
  nlohmann::json out;
  out["size"] = size;
  out["capacity"] = capacity ? nlohmann::json(*capacity) : nlohmann::json(nullptr);
  out["usage_percent"] = usage_percent ? nlohmann::json(*usage_percent) : nlohmann::json(nullptr);

  if (severity) {
    out["severity"] = {
        {"count", severity->count},
        {"average", severity->average},
        {"min", severity->min},
        {"max", severity->max},
    };
  } else {
    out["severity"] = nullptr;
  }
  return out;
}

nlohmann::json PatientToJson(const Patient& patient) {
  return {
      {"id", patient.id},
      {"name", patient.name},
      {"severity", patient.severity},
      {"arrival_time", patient.arrival_time},
  };
}

}  // namespace triage

#ifndef TRIAGE_QUEUE_THREAD_SAFE_HPP_
#define TRIAGE_QUEUE_THREAD_SAFE_HPP_

#include "triage_queue.hpp"

#include <memory>
#include <shared_mutex>

namespace triage {

/**
 * Thread-safe wrapper for TriageQueue.
 * Admission and removal take the lock exclusively; queries share it, so a
 * snapshot never observes a half-linked node.
 */
class TriageQueueThreadSafe : public TriageQueue {
 public:
  explicit TriageQueueThreadSafe(std::unique_ptr<TriageQueue> impl);
  ~TriageQueueThreadSafe() override = default;

  // Non-copyable
  TriageQueueThreadSafe(const TriageQueueThreadSafe&) = delete;
  TriageQueueThreadSafe& operator=(const TriageQueueThreadSafe&) = delete;

  bool IsFull() const override;
  bool IsEmpty() const override;

  bool Arrive(const Patient& patient) override;
  std::optional<Patient> ServeNext() override;

  std::optional<Patient> Front() const override;
  std::optional<Patient> Rear() const override;

  std::vector<Patient> TraverseForward() const override;
  std::vector<Patient> TraverseBackward() const override;

  std::size_t Size() const override;
  std::optional<std::size_t> Capacity() const override;

 private:
  std::unique_ptr<TriageQueue> impl_;
  mutable std::shared_mutex mutex_;
};

}  // namespace triage

#endif  // TRIAGE_QUEUE_THREAD_SAFE_HPP_

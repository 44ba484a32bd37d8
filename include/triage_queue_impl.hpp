#ifndef TRIAGE_QUEUE_IMPL_HPP_
#define TRIAGE_QUEUE_IMPL_HPP_

#include "triage_queue.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace triage {

// Implementation notes:
// - The chain is a doubly linked list whose nodes live in an arena (`nodes_`)
//   and refer to each other by slot index instead of by pointer.
// - Slots released by ServeNext are recycled through `free_slots_`, so the
//   arena never grows beyond the largest number of simultaneously queued
//   patients.
// - No I/O and no locking; see TriageQueueThreadSafe for shared use.

/**
 * In-memory first-come-first-served queue with an optional capacity.
 *
 * Responsibilities:
 * - O(1) admission at the tail and removal at the head
 * - Snapshot traversal in either direction
 */
class TriageQueueImpl : public TriageQueue {
 public:
  /**
   * Creates an empty queue. A present `capacity` must be positive;
   * zero throws std::invalid_argument.
   */
  explicit TriageQueueImpl(std::optional<std::size_t> capacity = std::nullopt);

  bool IsFull() const override;
  bool IsEmpty() const override;

  bool Arrive(const Patient& patient) override;
  std::optional<Patient> ServeNext() override;

  std::optional<Patient> Front() const override;
  std::optional<Patient> Rear() const override;

  std::vector<Patient> TraverseForward() const override;
  std::vector<Patient> TraverseBackward() const override;

  std::size_t Size() const override { return size_; }
  std::optional<std::size_t> Capacity() const override { return capacity_; }

 private:
  using Slot = std::size_t;

  struct Node {
    Patient data;
    std::optional<Slot> next;  // toward the rear
    std::optional<Slot> prev;  // toward the front
  };

  // Stores `patient` in a free slot (or a new one) and returns its index.
  Slot acquireSlot(const Patient& patient);

  // Returns a detached node's slot to the free list.
  void releaseSlot(Slot slot);

  std::vector<Node> nodes_;
  std::vector<Slot> free_slots_;

  std::optional<Slot> head_;
  std::optional<Slot> tail_;
  std::size_t size_ = 0;
  const std::optional<std::size_t> capacity_;
};

}  // namespace triage

#endif  // TRIAGE_QUEUE_IMPL_HPP_

#include "triage_queue_impl.hpp"

#include <stdexcept>
#include <utility>

namespace triage {

TriageQueueImpl::TriageQueueImpl(std::optional<std::size_t> capacity)
    : capacity_(capacity) {
  if (capacity_ && *capacity_ == 0) {
    throw std::invalid_argument("queue capacity must be positive");
  }
}

bool TriageQueueImpl::IsFull() const {
  return capacity_.has_value() && size_ >= *capacity_;
}

bool TriageQueueImpl::IsEmpty() const {
  return size_ == 0;
}

// Links a new node after the current tail; refuses without mutation when full.
bool TriageQueueImpl::Arrive(const Patient& patient) {
  if (IsFull()) {
    return false;
  }

  const Slot slot = acquireSlot(patient);

  if (!head_) {
    head_ = slot;
    tail_ = slot;
  } else {
    nodes_[*tail_].next = slot;
    nodes_[slot].prev = tail_;
    tail_ = slot;
  }

  ++size_;
  return true;
}

// Detaches the head node; the following node (if any) becomes the new head.
std::optional<Patient> TriageQueueImpl::ServeNext() {
  if (!head_) {
    return std::nullopt;
  }

  const Slot slot = *head_;
  Patient served = std::move(nodes_[slot].data);

  head_ = nodes_[slot].next;
  if (head_) {
    nodes_[*head_].prev.reset();
  } else {
    tail_.reset();
  }

  releaseSlot(slot);
  --size_;
  return served;
}

std::optional<Patient> TriageQueueImpl::Front() const {
  if (!head_) return std::nullopt;
  return nodes_[*head_].data;
}

std::optional<Patient> TriageQueueImpl::Rear() const {
  if (!tail_) return std::nullopt;
  return nodes_[*tail_].data;
}

std::vector<Patient> TriageQueueImpl::TraverseForward() const {
  std::vector<Patient> result;
  result.reserve(size_);
  for (auto current = head_; current; current = nodes_[*current].next) {
    result.push_back(nodes_[*current].data);
  }
  return result;
}

std::vector<Patient> TriageQueueImpl::TraverseBackward() const {
  std::vector<Patient> result;
  result.reserve(size_);
  for (auto current = tail_; current; current = nodes_[*current].prev) {
    result.push_back(nodes_[*current].data);
  }
  return result;
}

TriageQueueImpl::Slot TriageQueueImpl::acquireSlot(const Patient& patient) {
  if (!free_slots_.empty()) {
    const Slot slot = free_slots_.back();
    free_slots_.pop_back();
    nodes_[slot] = Node{patient, std::nullopt, std::nullopt};
    return slot;
  }
  nodes_.push_back(Node{patient, std::nullopt, std::nullopt});
  return nodes_.size() - 1;
}

void TriageQueueImpl::releaseSlot(Slot slot) {
  Node& node = nodes_[slot];
  node.data = Patient{};
  node.next.reset();
  node.prev.reset();
  free_slots_.push_back(slot);
}

}  // namespace triage

#include "triage_queue_thread_safe.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace triage {

TriageQueueThreadSafe::TriageQueueThreadSafe(std::unique_ptr<TriageQueue> impl)
    : impl_(std::move(impl)) {
  if (!impl_) {
    throw std::invalid_argument("TriageQueueThreadSafe requires a queue");
  }
}

bool TriageQueueThreadSafe::IsFull() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->IsFull();
}

bool TriageQueueThreadSafe::IsEmpty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->IsEmpty();
}

bool TriageQueueThreadSafe::Arrive(const Patient& patient) {
  // The full check and the link update must happen under one lock
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return impl_->Arrive(patient);
}

std::optional<Patient> TriageQueueThreadSafe::ServeNext() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return impl_->ServeNext();
}

std::optional<Patient> TriageQueueThreadSafe::Front() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->Front();
}

std::optional<Patient> TriageQueueThreadSafe::Rear() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->Rear();
}

std::vector<Patient> TriageQueueThreadSafe::TraverseForward() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->TraverseForward();
}

std::vector<Patient> TriageQueueThreadSafe::TraverseBackward() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->TraverseBackward();
}

std::size_t TriageQueueThreadSafe::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return impl_->Size();
}

std::optional<std::size_t> TriageQueueThreadSafe::Capacity() const {
  // Immutable after construction
  return impl_->Capacity();
}

}  // namespace triage

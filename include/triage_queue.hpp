#ifndef TRIAGE_QUEUE_HPP_
#define TRIAGE_QUEUE_HPP_

#include "patient.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace triage {

/**
 * Abstract base class for the admission queue of a triage desk.
 * Patients are served strictly in the order they were admitted.
 */
class TriageQueue {
 public:
  virtual ~TriageQueue() = default;

  /**
   * True iff a capacity is set and the queue holds that many patients.
   */
  virtual bool IsFull() const = 0;

  virtual bool IsEmpty() const = 0;

  /**
   * Admits `patient` at the rear. Returns false and leaves the queue
   * untouched when it is full.
   */
  virtual bool Arrive(const Patient& patient) = 0;

  /**
   * Removes and returns the frontmost patient, or nullopt when empty.
   */
  virtual std::optional<Patient> ServeNext() = 0;

  /** Copies of the patients at the front and at the rear. */
  virtual std::optional<Patient> Front() const = 0;
  virtual std::optional<Patient> Rear() const = 0;

  /**
   * Point-in-time copies of the queue, front-to-rear and rear-to-front.
   */
  virtual std::vector<Patient> TraverseForward() const = 0;
  virtual std::vector<Patient> TraverseBackward() const = 0;

  virtual std::size_t Size() const = 0;

  /** Maximum number of patients, nullopt for an unbounded queue. */
  virtual std::optional<std::size_t> Capacity() const = 0;
};

}  // namespace triage

#endif  // TRIAGE_QUEUE_HPP_

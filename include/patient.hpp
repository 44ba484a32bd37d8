#ifndef TRIAGE_PATIENT_HPP_
#define TRIAGE_PATIENT_HPP_

#include <string>

namespace triage {

/**
 * One admission event at the triage desk.
 *
 * Field values are taken as given: the queue does not check `name`,
 * `severity` or the uniqueness of `id`.
 */
struct Patient {
  int id = 0;
  std::string name;
  int severity = 0;      // 1 (low) to 5 (critical)
  int arrival_time = 0;  // stamped by the session, display only
};

inline bool operator==(const Patient& lhs, const Patient& rhs) {
  return lhs.id == rhs.id && lhs.name == rhs.name &&
         lhs.severity == rhs.severity && lhs.arrival_time == rhs.arrival_time;
}

inline bool operator!=(const Patient& lhs, const Patient& rhs) {
  return !(lhs == rhs);
}

}  // namespace triage

#endif  // TRIAGE_PATIENT_HPP_

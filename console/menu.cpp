#include "console/menu.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace triage {
namespace console {

namespace {

const std::string kRule(60, '=');
const std::string kThinRule(60, '-');
const std::string kTableRule(110, '-');

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string capacityText(std::optional<std::size_t> capacity) {
  return capacity ? std::to_string(*capacity) : "Unlimited";
}

std::string oneDecimal(double value) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << value;
  return ss.str();
}

}  // namespace

std::string SeverityBar(int severity) {
  const int stars = std::clamp(severity, 0, kMaxSeverity);
  return "[" + std::string(stars, '*') + std::string(kMaxSeverity - stars, ' ') + "]";
}

ConsoleMenu::ConsoleMenu(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<std::string> ConsoleMenu::readLine() {
  std::string line;
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }
  return line;
}

std::optional<int> ConsoleMenu::ReadInt(const std::string& prompt,
                                        std::optional<int> min_val,
                                        std::optional<int> max_val) {
  while (true) {
    out_ << "  > " << prompt;
    auto line = readLine();
    if (!line) {
      out_ << "\n";
      return std::nullopt;
    }

    const std::string raw = trim(*line);
    if (raw.empty()) {
      printError("Input cannot be empty.");
      continue;
    }

    int value = 0;
    try {
      std::size_t consumed = 0;
      value = std::stoi(raw, &consumed);
      if (consumed != raw.size()) {
        throw std::invalid_argument(raw);
      }
    } catch (const std::invalid_argument&) {
      printError("Invalid input. Please enter a valid number.");
      continue;
    } catch (const std::out_of_range&) {
      printError("Invalid input. Please enter a valid number.");
      continue;
    }

    if (min_val && value < *min_val) {
      printError("Value too low. Please enter at least " + std::to_string(*min_val) + ".");
      continue;
    }
    if (max_val && value > *max_val) {
      printError("Value too high. Please enter at most " + std::to_string(*max_val) + ".");
      continue;
    }

    return value;
  }
}

std::optional<std::string> ConsoleMenu::ReadNonEmpty(const std::string& prompt) {
  while (true) {
    out_ << "  > " << prompt;
    auto line = readLine();
    if (!line) {
      out_ << "\n";
      return std::nullopt;
    }

    std::string value = trim(*line);
    if (!value.empty()) {
      return value;
    }
    printError("Input cannot be empty. Please try again.");
  }
}

void ConsoleMenu::PrintBanner() {
  out_ << "\n" << kRule << "\n";
  out_ << "  FCFS TRIAGE SYSTEM\n";
  out_ << "  First-Come-First-Serve Queue Implementation\n";
  out_ << kRule << "\n\n";
}

std::optional<TriageConfig> ConsoleMenu::PromptConfig() {
  auto capacity = ReadInt("Enter queue max capacity (e.g. 5 or 10): ", 1);
  if (!capacity) {
    return std::nullopt;
  }

  TriageConfig config;
  config.capacity = static_cast<std::size_t>(*capacity);
  config.log_level = observability::Logger::getInstance().getLogLevel();
  return config;
}

int ConsoleMenu::Run(TriageSession& session) {
  printSuccess("System initialized with capacity: " + capacityText(session.Queue().Capacity()) + "\n");

  int handled = 0;
  while (true) {
    printMenu();
    auto choice = ReadInt("Enter your choice (1-10): ", 1, 10);
    if (!choice) {
      TRIAGE_LOG_INFO("console input closed");
      break;
    }
    ++handled;
    if (!Dispatch(static_cast<MenuOption>(*choice), session)) {
      break;
    }
  }
  return handled;
}

bool ConsoleMenu::Dispatch(MenuOption option, TriageSession& session) {
  TRIAGE_LOG_DEBUG("menu choice " + std::to_string(static_cast<int>(option)));
  switch (option) {
    case MenuOption::kAddPatient: addPatient(session); break;
    case MenuOption::kServeNext: serveNext(session); break;
    case MenuOption::kViewFront: viewFront(session); break;
    case MenuOption::kViewRear: viewRear(session); break;
    case MenuOption::kCapacityStatus: capacityStatus(session); break;
    case MenuOption::kEmptyCheck: emptyCheck(session); break;
    case MenuOption::kDisplayQueue: displayQueue(session); break;
    case MenuOption::kStatistics: statistics(session); break;
    case MenuOption::kExportJson: exportJson(session); break;
    case MenuOption::kExit:
      printSection("EXITING FCFS TRIAGE SYSTEM");
      out_ << "  Thank you for using the system!\n";
      out_ << "  Goodbye.\n";
      return false;
  }
  return true;
}

void ConsoleMenu::printSection(const std::string& title) {
  out_ << "\n" << kThinRule << "\n";
  out_ << "  " << title << "\n";
  out_ << kThinRule << "\n";
}

void ConsoleMenu::printSuccess(const std::string& msg) {
  out_ << "[OK] " << msg << "\n";
}

void ConsoleMenu::printError(const std::string& msg) {
  out_ << "[ERROR] " << msg << "\n";
}

void ConsoleMenu::printMenu() {
  out_ << "\n" << kRule << "\n";
  out_ << "  MAIN MENU - What would you like to do?\n";
  out_ << kRule << "\n";
  out_ << " 1. Add patient to queue\n";
  out_ << " 2. Serve next patient (FIFO order)\n";
  out_ << " 3. View front patient in queue\n";
  out_ << " 4. View rear patient in queue\n";
  out_ << " 5. Check if queue is FULL\n";
  out_ << " 6. Check if queue is EMPTY\n";
  out_ << " 7. Display entire queue\n";
  out_ << " 8. View queue statistics\n";
  out_ << " 9. Exit program\n";
  out_ << "10. Export queue as JSON\n";
  out_ << kRule << "\n";
}

void ConsoleMenu::printPatientCard(const Patient& patient) {
  out_ << "  Name:           " << patient.name << "\n";
  out_ << "  ID:             " << patient.id << "\n";
  out_ << "  Severity:       " << patient.severity << "/5\n";
  out_ << "  Arrival Order:  Patient #" << patient.arrival_time << "\n";
}

void ConsoleMenu::addPatient(TriageSession& session) {
  printSection("ADD NEW PATIENT");
  auto name = ReadNonEmpty("Patient name: ");
  if (!name) return;
  auto id = ReadInt("Patient ID: ");
  if (!id) return;
  auto severity = ReadInt("Severity level (1=Low to 5=Critical): ", kMinSeverity, kMaxSeverity);
  if (!severity) return;

  const AdmissionResult result = session.Admit(*id, *name, *severity);
  switch (result.status) {
    case AdmissionStatus::kAdmitted:
      printSuccess("Patient '" + *name + "' (ID: " + std::to_string(*id) +
                   ") added to queue successfully!");
      break;
    case AdmissionStatus::kQueueFull:
      printError("Failed to add patient - queue is at full capacity!");
      break;
    case AdmissionStatus::kInvalidName:
    case AdmissionStatus::kInvalidSeverity:
      printError(std::string("Failed to add patient - ") + AdmissionStatusToString(result.status));
      break;
  }
}

void ConsoleMenu::serveNext(TriageSession& session) {
  printSection("SERVE NEXT PATIENT");
  auto patient = session.ServeNext();
  if (!patient) {
    printError("Cannot serve - queue is empty!");
    return;
  }
  printSuccess("Now serving: " + patient->name);
  out_ << "  Patient ID:    " << patient->id << "\n";
  out_ << "  Severity:      " << patient->severity << "/5\n";
  out_ << "  Arrival Order: Patient #" << patient->arrival_time << "\n";
}

void ConsoleMenu::viewFront(TriageSession& session) {
  printSection("FRONT PATIENT (Next to be served)");
  if (auto front = session.Front()) {
    printPatientCard(*front);
  } else {
    printError("Queue is empty!");
  }
}

void ConsoleMenu::viewRear(TriageSession& session) {
  printSection("REAR PATIENT (Last in queue)");
  if (auto rear = session.Rear()) {
    printPatientCard(*rear);
  } else {
    printError("Queue is empty!");
  }
}

void ConsoleMenu::capacityStatus(TriageSession& session) {
  printSection("QUEUE CAPACITY STATUS");
  const QueueStatistics stats = session.Statistics();
  const std::string cap = capacityText(stats.capacity);
  const std::string ratio = std::to_string(stats.size) + "/" + cap + " patients";

  if (session.Queue().IsFull()) {
    printError("Queue is FULL! " + ratio);
  } else {
    printSuccess("Queue is NOT full. " + ratio);
  }

  out_ << "  Current size:   " << stats.size << "\n";
  out_ << "  Max capacity:   " << cap << "\n";
  if (stats.usage_percent) {
    out_ << "  Usage percent:  " << oneDecimal(*stats.usage_percent) << "%\n";
  }
}

void ConsoleMenu::emptyCheck(TriageSession& session) {
  printSection("QUEUE EMPTY CHECK");
  const std::size_t size = session.Queue().Size();

  if (size == 0) {
    printError("Queue is EMPTY! No patients waiting.");
  } else {
    printSuccess("Queue is NOT empty. " + std::to_string(size) + " patient(s) waiting.");
  }
  out_ << "  Total patients: " << size << "\n";
}

void ConsoleMenu::displayQueue(TriageSession& session) {
  printSection("DISPLAY ALL PATIENTS (Front to Rear)");
  const std::vector<Patient> patients = session.Snapshot();
  if (patients.empty()) {
    printError("Queue is empty! No patients to display.");
    return;
  }

  out_ << "\n  " << kTableRule << "\n";
  out_ << "  " << std::left << std::setw(4) << "#" << " | "
       << std::setw(20) << "Name" << " | "
       << std::setw(5) << "ID" << " | "
       << std::setw(10) << "Severity" << " | "
       << std::setw(15) << "Arrival Order" << "\n";
  out_ << "  " << kTableRule << "\n";

  int row = 1;
  for (const Patient& p : patients) {
    out_ << "  " << std::setw(4) << row++ << " | "
         << std::setw(20) << p.name << " | "
         << std::setw(5) << p.id << " | "
         << std::setw(10) << SeverityBar(p.severity) << " | "
         << "Patient #" << std::setw(11) << p.arrival_time << "\n";
  }
  out_ << std::right;
  out_ << "  " << kTableRule << "\n";
  out_ << "\n  Total patients in queue: " << patients.size() << "\n";
}

void ConsoleMenu::statistics(TriageSession& session) {
  printSection("QUEUE STATISTICS");
  const QueueStatistics stats = session.Statistics();

  out_ << "\n  CAPACITY INFORMATION:\n";
  out_ << "    Total patients:  " << stats.size << "\n";
  out_ << "    Max capacity:    " << capacityText(stats.capacity) << "\n";

  if (!stats.severity) {
    printError("No patients in queue for statistics.");
    return;
  }

  out_ << "\n  SEVERITY STATISTICS:\n";
  out_ << "    Average severity: " << oneDecimal(stats.severity->average) << "/5\n";
  out_ << "    Max severity:     " << stats.severity->max << "/5\n";
  out_ << "    Min severity:     " << stats.severity->min << "/5\n";
}

void ConsoleMenu::exportJson(TriageSession& session) {
  printSection("EXPORT QUEUE (JSON)");
  nlohmann::json doc;
  doc["patients"] = nlohmann::json::array();
  for (const Patient& p : session.Snapshot()) {
    doc["patients"].push_back(PatientToJson(p));
  }
  doc["statistics"] = session.Statistics().ToJson();
  doc["arrivals_stamped"] = session.ArrivalsStamped();
  out_ << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

int RunConsoleDesk(std::istream& in, std::ostream& out,
                   const std::optional<TriageConfig>& preset) {
  ConsoleMenu menu(in, out);
  menu.PrintBanner();

  std::optional<TriageConfig> config = preset;
  if (!config) {
    config = menu.PromptConfig();
    if (!config) {
      TRIAGE_LOG_WARN("no capacity entered before input closed");
      return 1;
    }
  }

  try {
    TriageSession session(*config);
    const int handled = menu.Run(session);
    TRIAGE_LOG_BUILDER(observability::LogLevel::INFO, "triage session finished")
        .field("menu_choices", handled)
        .field("arrivals_stamped", session.ArrivalsStamped())
        .field("still_waiting", session.Queue().Size())
        .field("metrics", observability::getGlobalMetrics().exportMetrics());
  } catch (const std::exception& e) {
    TRIAGE_LOG_ERROR(std::string("triage session failed: ") + e.what());
    out << "[ERROR] " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace console
}  // namespace triage

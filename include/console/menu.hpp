#ifndef TRIAGE_CONSOLE_MENU_HPP_
#define TRIAGE_CONSOLE_MENU_HPP_

#include "triage_config.hpp"
#include "triage_session.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace triage {
namespace console {

/**
 * Menu choices, numbered as shown to the operator.
 */
enum class MenuOption {
  kAddPatient = 1,
  kServeNext = 2,
  kViewFront = 3,
  kViewRear = 4,
  kCapacityStatus = 5,
  kEmptyCheck = 6,
  kDisplayQueue = 7,
  kStatistics = 8,
  kExit = 9,
  kExportJson = 10
};

/**
 * Interactive text front end of the triage desk.
 * Reads operator input from `in` and writes everything to `out`; both are
 * injected so the desk can be driven from a script.
 */
class ConsoleMenu {
 public:
  ConsoleMenu(std::istream& in, std::ostream& out);

  ConsoleMenu(const ConsoleMenu&) = delete;
  ConsoleMenu& operator=(const ConsoleMenu&) = delete;

  /**
   * Prompts until an integer within [min_val, max_val] is entered.
   * Returns nullopt once the input is exhausted.
   */
  std::optional<int> ReadInt(const std::string& prompt,
                             std::optional<int> min_val = std::nullopt,
                             std::optional<int> max_val = std::nullopt);

  /**
   * Prompts until a non-blank line is entered; returns it trimmed.
   * Returns nullopt once the input is exhausted.
   */
  std::optional<std::string> ReadNonEmpty(const std::string& prompt);

  void PrintBanner();

  // Asks the operator for the queue capacity, as the desk does on start-up.
  std::optional<TriageConfig> PromptConfig();

  /**
   * Runs the menu loop until the operator exits or the input ends.
   * Returns the number of menu choices handled.
   */
  int Run(TriageSession& session);

  // Handles one menu choice. Returns false for kExit.
  bool Dispatch(MenuOption option, TriageSession& session);

 private:
  void printSection(const std::string& title);
  void printSuccess(const std::string& msg);
  void printError(const std::string& msg);
  void printMenu();
  void printPatientCard(const Patient& patient);

  void addPatient(TriageSession& session);
  void serveNext(TriageSession& session);
  void viewFront(TriageSession& session);
  void viewRear(TriageSession& session);
  void capacityStatus(TriageSession& session);
  void emptyCheck(TriageSession& session);
  void displayQueue(TriageSession& session);
  void statistics(TriageSession& session);
  void exportJson(TriageSession& session);

  std::optional<std::string> readLine();

  std::istream& in_;
  std::ostream& out_;
};

// Renders severity as a fixed-width bar, e.g. 3 -> "[***  ]".
std::string SeverityBar(int severity);

/**
 * Runs one complete desk session on the given streams. Without a preset
 * configuration the capacity is prompted for. Returns a process exit code.
 */
int RunConsoleDesk(std::istream& in, std::ostream& out,
                   const std::optional<TriageConfig>& preset = std::nullopt);

}  // namespace console
}  // namespace triage

#endif  // TRIAGE_CONSOLE_MENU_HPP_

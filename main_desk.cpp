#include "include/console/menu.hpp"
#include "include/observability/logger.hpp"
#include "include/triage_config.hpp"

#include <iostream>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
  auto& logger = triage::observability::Logger::getInstance();
  logger.setOutputStream(std::cerr);

  std::optional<triage::TriageConfig> config;

  try {
    // Usage: triage_desk [config.json]
    if (argc >= 2) {
      config = triage::LoadConfigFile(argv[1]);
      logger.setLogLevel(config->log_level);
    }
  } catch (const std::exception& e) {
    TRIAGE_LOG_FATAL(std::string("configuration error: ") + e.what());
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }

  return triage::console::RunConsoleDesk(std::cin, std::cout, config);
}

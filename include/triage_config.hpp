#ifndef TRIAGE_CONFIG_HPP_
#define TRIAGE_CONFIG_HPP_

#include "observability/logger.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace triage {

/**
 * Raised for unreadable or invalid desk configuration.
 */
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * Settings for one triage desk session.
 */
struct TriageConfig {
  std::optional<std::size_t> capacity;  // nullopt = unbounded
  observability::LogLevel log_level = observability::LogLevel::INFO;
};

/**
 * Maps DEBUG, INFO, WARN, ERROR or FATAL (any case) to a LogLevel.
 * Throws ConfigError for anything else.
 */
observability::LogLevel ParseLogLevel(const std::string& text);

/**
 * Parses a JSON document of the form
 *   {"capacity": 5, "log_level": "INFO"}
 * `capacity` may be null for an unbounded queue. Missing keys keep their
 * defaults.
 */
TriageConfig ParseConfig(const std::string& json_text);

/**
 * Reads and parses a configuration file. Throws ConfigError when the file
 * cannot be read or its content is invalid.
 */
TriageConfig LoadConfigFile(const std::string& path);

}  // namespace triage

#endif  // TRIAGE_CONFIG_HPP_

#include "triage_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace triage {

observability::LogLevel ParseLogLevel(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return observability::LogLevel::DEBUG;
  if (upper == "INFO") return observability::LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return observability::LogLevel::WARN;
  if (upper == "ERROR") return observability::LogLevel::ERROR;
  if (upper == "FATAL") return observability::LogLevel::FATAL;
  throw ConfigError("unknown log level: " + text);
}

TriageConfig ParseConfig(const std::string& json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }

  if (!doc.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  TriageConfig config;

  auto capacity = doc.find("capacity");
  if (capacity != doc.end() && !capacity->is_null()) {
    if (!capacity->is_number_integer()) {
      throw ConfigError("capacity must be an integer or null");
    }
    if (!capacity->is_number_unsigned()) {
      throw ConfigError("capacity must be positive, got " +
                        std::to_string(capacity->get<long long>()));
    }
    const std::uint64_t value = capacity->get<std::uint64_t>();
    if (value == 0) {
      throw ConfigError("capacity must be positive, got 0");
    }
    if (value > std::numeric_limits<std::size_t>::max()) {
      throw ConfigError("capacity too large: " + std::to_string(value));
    }
    config.capacity = static_cast<std::size_t>(value);
  }

  auto level = doc.find("log_level");
  if (level != doc.end()) {
    if (!level->is_string()) {
      throw ConfigError("log_level must be a string");
    }
    config.log_level = ParseLogLevel(level->get<std::string>());
  }

  return config;
}

TriageConfig LoadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseConfig(buffer.str());
}

}  // namespace triage

#ifndef TRIAGE_OBSERVABILITY_LOGGER_HPP_
#define TRIAGE_OBSERVABILITY_LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

namespace triage {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::string LogLevelToString(LogLevel level);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; the desk session and the console share the single instance.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cerr, keeping stdout for the menu)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted when the builder dies
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");
    ~LogBuilder();

    LogBuilder(const LogBuilder&) = delete;
    LogBuilder& operator=(const LogBuilder&) = delete;

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, std::size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, const nlohmann::json& value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::json fields_ = nlohmann::json::object();
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define TRIAGE_LOG_DEBUG(msg) triage::observability::Logger::getInstance().debug(msg, __func__)
#define TRIAGE_LOG_INFO(msg) triage::observability::Logger::getInstance().info(msg, __func__)
#define TRIAGE_LOG_WARN(msg) triage::observability::Logger::getInstance().warn(msg, __func__)
#define TRIAGE_LOG_ERROR(msg) triage::observability::Logger::getInstance().error(msg, __func__)
#define TRIAGE_LOG_FATAL(msg) triage::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define TRIAGE_LOG_BUILDER(level, msg) \
  triage::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace triage

#endif  // TRIAGE_OBSERVABILITY_LOGGER_HPP_

#ifndef DOCPARSE_LOG_HPP
#define DOCPARSE_LOG_HPP

#include <optional>
#include <ostream>
#include <string>

namespace docparse {

enum class LogLevel { Debug, Info, Warning, Error };

/**
 * @brief Parse a level name ("DEBUG", "info", "WARN", ...)
 */
std::optional<LogLevel> parseLogLevel(const std::string &name);

std::string logLevelName(LogLevel level);

/**
 * @brief Set the minimum level that is written (default: Debug)
 */
void setLogLevel(LogLevel level);
LogLevel logLevel();

/**
 * @brief Redirect log output (default: std::cerr)
 *
 * The stream must outlive all logging calls made while it is installed.
 */
void setLogStream(std::ostream &stream);

/**
 * @brief Write one log line: "[LEVEL] [stage] [document] message"
 * @param level Severity
 * @param stage Pipeline stage, e.g. "layout" or "backend"
 * @param documentId Document being processed, empty if none
 * @param message Free text
 */
void log(LogLevel level, const std::string &stage,
         const std::string &documentId, const std::string &message);

} // namespace docparse

#endif // DOCPARSE_LOG_HPP

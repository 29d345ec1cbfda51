#include "docparse/Log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace docparse {

namespace {

LogLevel g_level = LogLevel::Debug;
std::ostream *g_stream = &std::cerr;

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "DEBUG") {
    return LogLevel::Debug;
  }
  if (upper == "INFO") {
    return LogLevel::Info;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return LogLevel::Warning;
  }
  if (upper == "ERROR" || upper == "CRITICAL") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void setLogLevel(LogLevel level) { g_level = level; }

LogLevel logLevel() { return g_level; }

void setLogStream(std::ostream &stream) { g_stream = &stream; }

void log(LogLevel level, const std::string &stage,
         const std::string &documentId, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(g_level)) {
    return;
  }

  std::ostream &out = *g_stream;
  out << "[" << logLevelName(level) << "] [" << stage << "]";
  if (!documentId.empty()) {
    out << " [" << documentId << "]";
  }
  out << " " << message << std::endl;
}

} // namespace docparse

#pragma once

#include <string>

namespace nzbstream {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Opens (truncates) the log file; an empty path keeps logging on stdout only.
bool initLogFile(const std::string& path);
void closeLogFile();
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

// Tagged logging helpers. logLine is Info level with the "APP" tag.
void logLine(const std::string& msg);
void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace nzbstream

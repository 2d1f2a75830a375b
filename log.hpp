#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <string>

enum class LogLevel : uint8_t { Debug, Info, Warning, Error };

// debugLogPath == nullptr: console only, debug events dropped
bool initLog(char const* debugLogPath);
void shutdownLog();

void logMessage(LogLevel level, std::string const& msg);

inline void logDebug  (std::string const& msg) { logMessage(LogLevel::Debug,   msg); }
inline void logInfo   (std::string const& msg) { logMessage(LogLevel::Info,    msg); }
inline void logWarning(std::string const& msg) { logMessage(LogLevel::Warning, msg); }
inline void logError  (std::string const& msg) { logMessage(LogLevel::Error,   msg); }

#endif // LOG_H

#pragma once
#include <string>

namespace tablescan {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void setLogLevel(LogLevel level);
LogLevel logLevel();
bool logEnabled(LogLevel level);
// Writes "[level] message" to std::clog when the level is enabled.
void logMessage(LogLevel level, const std::string& message);

}

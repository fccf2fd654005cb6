#include "tablescan/Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace tablescan {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_writeMutex;

const char* tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[debug] ";
        case LogLevel::Info: return "[info] ";
        case LogLevel::Warn: return "[warn] ";
        case LogLevel::Error: return "[error] ";
        case LogLevel::Off: break;
    }
    return "";
}

}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

void logMessage(LogLevel level, const std::string& message) {
    if (!logEnabled(level)) return;
    std::lock_guard<std::mutex> lock(g_writeMutex);
    std::clog << tag(level) << message << std::endl;
}

}

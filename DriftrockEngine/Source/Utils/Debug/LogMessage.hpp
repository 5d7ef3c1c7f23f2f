#pragma once
#include <string>
#include <chrono>
#include <thread>

enum class LogLevel {
    Info,
    Warning,
    Error,
    Critical
};

struct LogMessage {
    LogLevel level = LogLevel::Info;
    std::string text;
    std::string channel;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Info:    return "[INFO]";
    case LogLevel::Warning: return "[WARN]";
    case LogLevel::Error:   return "[ERROR]";
    case LogLevel::Critical:return "[CRITICAL]";
    }
    return "[UNKNOWN]";
}

// "HH:MM:SS.mmm" in local time, or "YYYY-MM-DD HH:MM:SS.mmm" with the date.
std::string FormatTimestamp(std::chrono::system_clock::time_point time, bool withDate);

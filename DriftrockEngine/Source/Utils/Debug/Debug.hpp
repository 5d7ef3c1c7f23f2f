#pragma once
#include "LogMessage.hpp"
#include "DebugStream.hpp"
#include <string>

// Engine-wide logging front end. Messages are queued to the LogRouter worker
// and written to the console (optional) and to the per-run log file.
// Before Initialize, and after Shutdown, messages are dropped.
class Debug {
public:
    static void Initialize(const std::string& productName, bool consoleOutput = true);
    static void Shutdown();

    static void SetChannelEnabled(const std::string& channel, bool enabled);
    static void SetMinimumLevel(LogLevel level);

    static void Write(LogLevel level, const std::string& msg, const std::string& channel = "General");

    static void Log(const std::string& msg, const std::string& channel = "General");
    static void LogWarning(const std::string& msg, const std::string& channel = "General");
    static void LogError(const std::string& msg, const std::string& channel = "General");
    static void LogCritical(const std::string& msg, const std::string& channel = "General");

    static DebugStream Info(const std::string& channel = "General") {
        return DebugStream(LogLevel::Info, channel);
    }
    static DebugStream Warning(const std::string& channel = "General") {
        return DebugStream(LogLevel::Warning, channel);
    }
    static DebugStream Error(const std::string& channel = "General") {
        return DebugStream(LogLevel::Error, channel);
    }
    static DebugStream Critical(const std::string& channel = "General") {
        return DebugStream(LogLevel::Critical, channel);
    }
};

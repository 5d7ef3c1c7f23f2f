#include "Debug.hpp"
#include "LogRouter.hpp"

static LogMessage CreateMessage(LogLevel level, const std::string& text, const std::string& channel) {
    LogMessage msg;
    msg.level = level;
    msg.text = text;
    msg.channel = channel;
    msg.timestamp = std::chrono::system_clock::now();
    msg.threadId = std::this_thread::get_id();
    return msg;
}

void Debug::Initialize(const std::string& productName, bool consoleOutput) {
    LogRouter::Instance().SetProductName(productName);
    LogRouter::Instance().Start(consoleOutput);

    const std::string& logFile = LogRouter::Instance().GetLogFilePath();
    if (logFile.empty())
        Log("No log file, console output only", "Debug");
    else
        Log("Writing log to " + logFile, "Debug");
}

void Debug::Shutdown() {
    LogRouter::Instance().Stop();
}

void Debug::SetChannelEnabled(const std::string& channel, bool enabled) {
    LogRouter::Instance().SetChannelEnabled(channel, enabled);
}

void Debug::SetMinimumLevel(LogLevel level) {
    LogRouter::Instance().SetMinimumLevel(level);
}

void Debug::Write(LogLevel level, const std::string& msg, const std::string& channel) {
    LogRouter::Instance().Enqueue(CreateMessage(level, msg, channel));
}

void Debug::Log(const std::string& msg, const std::string& channel) {
    Write(LogLevel::Info, msg, channel);
}

void Debug::LogWarning(const std::string& msg, const std::string& channel) {
    Write(LogLevel::Warning, msg, channel);
}

void Debug::LogError(const std::string& msg, const std::string& channel) {
    Write(LogLevel::Error, msg, channel);
}

void Debug::LogCritical(const std::string& msg, const std::string& channel) {
    Write(LogLevel::Critical, msg, channel);
}

#pragma once
#include "LogMessage.hpp"
#include "ThreadSafeQueue.hpp"
#include "FileOutput.hpp"
#include <unordered_map>
#include <string>
#include <thread>
#include <atomic>
#include <mutex>

class LogRouter {
public:
    static LogRouter& Instance();

    void Start(bool consoleOutput);
    void Stop();

    void SetProductName(const std::string& name);
    void SetChannelEnabled(const std::string& channel, bool enabled);
    void SetMinimumLevel(LogLevel level);

    void Enqueue(const LogMessage& msg);

    const std::string& GetLogFilePath() const { return logFilePath; }

private:
    LogRouter();
    ~LogRouter();

    void RouterThread();
    bool ShouldWrite(const LogMessage& msg);

    ThreadSafeQueue<LogMessage> queue;

    std::atomic<bool> consoleOutputEnabled{ false };
    std::atomic<bool> running{ false };
    std::atomic<int> minimumLevel{ static_cast<int>(LogLevel::Info) };
    std::thread worker;

    std::mutex channelMutex;
    std::unordered_map<std::string, bool> channelStates;

    FileOutput fileOutput;
    std::string logFilePath;
};

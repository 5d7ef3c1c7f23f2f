#include "LogRouter.hpp"
#include "ConsoleOutput.hpp"
#include <filesystem>
#include <cstdlib>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <system_error>
#include <deque>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

LogRouter& LogRouter::Instance() {
    static LogRouter instance;
    return instance;
}

LogRouter::LogRouter() {}
LogRouter::~LogRouter() {
    Stop();
}

void LogRouter::Start(bool consoleOutput) {
    consoleOutputEnabled = consoleOutput;
    if (running)
        return;

    queue.Reopen();
    running = true;
    worker = std::thread(&LogRouter::RouterThread, this);
}

void LogRouter::Stop() {
    if (!running)
        return;

    running = false;
    queue.Close();

    if (worker.joinable())
        worker.join();

    fileOutput.Close();
}

void LogRouter::SetProductName(const std::string& name) {
#ifdef _WIN32
    char* localAppData = nullptr;
    size_t len = 0;
    _dupenv_s(&localAppData, &len, "LOCALAPPDATA");
    if (!localAppData)
        return;
    std::string folder = std::string(localAppData) + "\\Driftrock\\" + name + "\\logs\\";
    free(localAppData);
#else
    const char* home = std::getenv("HOME");
    if (!home)
        return;
    std::string folder = std::string(home) + "/.Driftrock/" + name + "/logs/";
#endif

    // File logging is optional; console output still works without it.
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec)
        return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::stringstream timestamp;
    timestamp << std::put_time(&tm, "%Y%m%d_%H%M%S");

#ifdef _WIN32
    DWORD pid = GetCurrentProcessId();
#else
    pid_t pid = getpid();
#endif

    logFilePath = folder + "driftrock_" + timestamp.str() + "_PID" + std::to_string(pid) + ".log";

    fileOutput.Close();
    fileOutput.Open(logFilePath);
}

void LogRouter::SetChannelEnabled(const std::string& channel, bool enabled) {
    std::lock_guard<std::mutex> lock(channelMutex);
    channelStates[channel] = enabled;
}

void LogRouter::SetMinimumLevel(LogLevel level) {
    minimumLevel = static_cast<int>(level);
}

void LogRouter::Enqueue(const LogMessage& msg) {
    // Nothing drains the queue while the worker is down
    if (!running)
        return;
    queue.Push(msg);
}

bool LogRouter::ShouldWrite(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < minimumLevel)
        return false;

    std::lock_guard<std::mutex> lock(channelMutex);
    auto it = channelStates.find(msg.channel);
    return it == channelStates.end() || it->second;
}

void LogRouter::RouterThread() {
    std::deque<LogMessage> batch;
    // Keeps draining after Stop() until the queue is empty
    while (queue.WaitPopAll(batch)) {
        bool flush = false;
        for (const LogMessage& msg : batch) {
            if (!ShouldWrite(msg))
                continue;

            if (consoleOutputEnabled)
                ConsoleOutput::Write(msg);

            fileOutput.Write(msg);
            if (msg.level >= LogLevel::Error)
                flush = true;
        }

        // One flush per batch that carried an error
        if (flush)
            fileOutput.Flush();
    }
}

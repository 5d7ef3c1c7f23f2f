#include "FileOutput.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

std::string FormatTimestamp(std::chrono::system_clock::time_point time, bool withDate) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

    std::ostringstream out;
    out << std::put_time(&tm, withDate ? "%Y-%m-%d %H:%M:%S" : "%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

bool FileOutput::Open(const std::string& filepath) {
    file.open(filepath, std::ios::out | std::ios::app);
    return file.is_open();
}

void FileOutput::Write(const LogMessage& msg) {
    if (!file.is_open())
        return;

    // Full date and the writing thread, the console only shows the time
    file << FormatTimestamp(msg.timestamp, true) << ' '
         << LevelToString(msg.level) << " [" << msg.channel << "] "
         << "(thread " << msg.threadId << ") "
         << msg.text << '\n';
}

void FileOutput::Flush() {
    if (file.is_open())
        file.flush();
}

void FileOutput::Close() {
    if (file.is_open())
        file.close();
}

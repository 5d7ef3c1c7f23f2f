#pragma once
#include <sstream>
#include <string>
#include "LogMessage.hpp"  // only LogLevel

// Collects a message with operator<< and hands it to Debug on destruction.
class DebugStream {
public:
    DebugStream(LogLevel level = LogLevel::Info, const std::string& channel = "General");
    ~DebugStream();

    DebugStream(const DebugStream&) = delete;
    DebugStream& operator=(const DebugStream&) = delete;

    template<typename T>
    DebugStream& operator<<(const T& value) {
        buffer << value;
        return *this;
    }

private:
    std::stringstream buffer;
    LogLevel level;
    std::string channel;
};

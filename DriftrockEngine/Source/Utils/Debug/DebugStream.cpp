#include "DebugStream.hpp"
#include "Debug.hpp"

DebugStream::DebugStream(LogLevel level, const std::string& channel)
    : level(level), channel(channel) {
}

DebugStream::~DebugStream() {
    std::string text = buffer.str();
    // Debug::Info() << nothing
    if (text.empty())
        return;
    Debug::Write(level, text, channel);
}

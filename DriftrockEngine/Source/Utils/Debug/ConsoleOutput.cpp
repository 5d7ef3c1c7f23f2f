#include "ConsoleOutput.hpp"
#include <cstdio>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define DRIFTROCK_ISATTY _isatty
#define DRIFTROCK_FILENO _fileno
#else
#include <unistd.h>
#define DRIFTROCK_ISATTY isatty
#define DRIFTROCK_FILENO fileno
#endif

namespace {
    const char* LevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Info:     return "\033[0m";
        case LogLevel::Warning:  return "\033[33m";
        case LogLevel::Error:    return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
        }
        return "\033[0m";
    }

    bool IsTerminal(FILE* stream) {
        static const bool stdoutTty = DRIFTROCK_ISATTY(DRIFTROCK_FILENO(stdout)) != 0;
        static const bool stderrTty = DRIFTROCK_ISATTY(DRIFTROCK_FILENO(stderr)) != 0;
        return stream == stdout ? stdoutTty : stderrTty;
    }
}

void ConsoleOutput::Write(const LogMessage& msg) {
    bool toStderr = msg.level != LogLevel::Info;
    std::ostream& out = toStderr ? std::cerr : std::cout;
    bool color = IsTerminal(toStderr ? stderr : stdout);

    out << FormatTimestamp(msg.timestamp, false) << ' ';
    if (color) out << LevelColor(msg.level);
    out << LevelToString(msg.level);
    if (color) out << "\033[0m";
    out << " [" << msg.channel << "] " << msg.text << '\n';
}

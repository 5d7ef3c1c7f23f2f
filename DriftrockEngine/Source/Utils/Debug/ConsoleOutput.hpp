#pragma once
#include "LogMessage.hpp"

class ConsoleOutput {
public:
    // Warnings and above go to stderr, the rest to stdout. Levels are
    // colored when the stream is a terminal.
    static void Write(const LogMessage& msg);
};

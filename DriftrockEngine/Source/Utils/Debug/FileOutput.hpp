#pragma once
#include "LogMessage.hpp"
#include <fstream>
#include <string>

class FileOutput {
public:
    FileOutput() = default;
    bool Open(const std::string& filepath);
    bool IsOpen() const { return file.is_open(); }
    void Write(const LogMessage& msg);
    void Flush();
    void Close();

private:
    std::ofstream file;
};

#pragma once

#include <chrono>
#include <expected>
#include <string>

// Line-oriented log that script output ends up in.
class LogSource {
public:
    virtual ~LogSource() = default;
    virtual std::expected<std::string, std::string> read_since(std::chrono::system_clock::time_point since) = 0;
};

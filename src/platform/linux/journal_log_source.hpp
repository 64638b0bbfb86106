#pragma once

#include "platform/log_source.hpp"

#include <string>
#include <vector>

// Reads KWin's output from the systemd user journal via journalctl.
class JournalLogSource : public LogSource {
public:
    explicit JournalLogSource(std::vector<std::string> units);

    std::expected<std::string, std::string> read_since(std::chrono::system_clock::time_point since) override;

    // Local time as "YYYY-MM-DD HH:MM:SS", the form --since accepts.
    static std::string format_since(std::chrono::system_clock::time_point since);

    std::vector<std::string> command_line(std::chrono::system_clock::time_point since) const;

private:
    std::vector<std::string> units_;
};

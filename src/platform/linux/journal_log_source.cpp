#include "platform/linux/journal_log_source.hpp"

#include "platform/linux/subprocess.hpp"

#include <ctime>
#include <format>

JournalLogSource::JournalLogSource(std::vector<std::string> units)
    : units_(std::move(units)) {}

std::expected<std::string, std::string>
JournalLogSource::read_since(std::chrono::system_clock::time_point since) {
    auto result = platform::run_process(command_line(since));
    if (!result) return std::unexpected(result.error());

    if (result->exit_code == 127) {
        return std::unexpected("journalctl not found");
    }
    if (result->exit_code != 0) {
        return std::unexpected(std::format("journalctl exited with code {}", result->exit_code));
    }
    return std::move(result->out);
}

std::string JournalLogSource::format_since(std::chrono::system_clock::time_point since) {
    std::time_t t = std::chrono::system_clock::to_time_t(since);
    std::tm local{};
    ::localtime_r(&t, &local);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

std::vector<std::string> JournalLogSource::command_line(std::chrono::system_clock::time_point since) const {
    std::vector<std::string> argv = {
        "journalctl",
        "--since=" + format_since(since),
        "--user",
    };
    for (const auto& unit : units_) {
        argv.push_back("--unit=" + unit);
    }
    argv.push_back("--output=cat");
    return argv;
}

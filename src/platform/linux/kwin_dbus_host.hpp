#pragma once

#include "platform/script_host.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Talks to KWin's org.kde.kwin.Scripting interface through dbus-send.
class KWinDbusHost : public ScriptHost {
public:
    KWinDbusHost(std::string service, uint32_t timeout_ms);

    std::expected<int, std::string> load(const std::string& path) override;
    std::expected<void, std::string> run(int script_id) override;
    std::expected<void, std::string> stop(int script_id) override;

    // Extracts the script id from `dbus-send --print-reply` output ("   int32 7").
    static std::expected<int, std::string> parse_load_reply(const std::string& reply);

private:
    std::vector<std::string> method_call(const std::string& object_path, const std::string& method,
                                         const std::vector<std::string>& args = {}) const;
    std::expected<std::string, std::string> call(const std::vector<std::string>& argv) const;

    std::string service_;
    uint32_t timeout_ms_;
};

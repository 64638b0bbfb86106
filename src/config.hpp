#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct KWin {
        std::string service = "org.kde.KWin";
        uint32_t timeout_ms = 5000;
        std::string session_version; // "" = use $KDE_SESSION_VERSION, else "5" or "6"
    } kwin;

    struct Journal {
        std::vector<std::string> units = {"plasma-kwin_wayland.service", "plasma-kwin_x11.service"};
        std::string prefix = "js: ";
        // Extra reads when the FINISH line has not reached the journal yet.
        uint32_t retries = 3;
        uint32_t retry_delay_ms = 100;
    } journal;

    struct Script {
        std::string prefix = "kdotool-";
    } script;

    // KWin 5 needs clientList() instead of windowList().
    bool target_kde5() const;

    static Config load(const std::string& path);
    static Config load_default();
};

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

bool Config::target_kde5() const {
    if (!kwin.session_version.empty()) {
        return kwin.session_version == "5";
    }
    const char* version = std::getenv("KDE_SESSION_VERSION");
    return version && std::string(version) == "5";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("kwin")) {
            auto& k = j["kwin"];
            if (k.contains("service")) cfg.kwin.service = k["service"].get<std::string>();
            if (k.contains("timeout_ms")) cfg.kwin.timeout_ms = k["timeout_ms"].get<uint32_t>();
            if (k.contains("session_version")) cfg.kwin.session_version = k["session_version"].get<std::string>();
        }

        if (j.contains("journal")) {
            auto& jr = j["journal"];
            if (jr.contains("units")) cfg.journal.units = jr["units"].get<std::vector<std::string>>();
            if (jr.contains("prefix")) cfg.journal.prefix = jr["prefix"].get<std::string>();
            if (jr.contains("retries")) cfg.journal.retries = jr["retries"].get<uint32_t>();
            if (jr.contains("retry_delay_ms")) cfg.journal.retry_delay_ms = jr["retry_delay_ms"].get<uint32_t>();
        }

        if (j.contains("script")) {
            auto& s = j["script"];
            if (s.contains("prefix")) cfg.script.prefix = s["prefix"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

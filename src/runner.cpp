#include "runner.hpp"

#include <chrono>
#include <format>
#include <print>
#include <thread>

Runner::Runner(Config config, bool verbose, ScriptHost& host, LogSource& logs)
    : config_(std::move(config)), verbose_(verbose), host_(host), logs_(logs) {}

std::expected<protocol::DecodedRun, std::string> Runner::execute(const CompiledScript& script,
                                                                 ScriptFile& file) {
    log("===== Generate KWin script =====");
    log("Script:\n" + script.text);
    auto written = file.write(script.text);
    if (!written) return std::unexpected("failed to write script: " + written.error());

    log("===== Load script into KWin =====");
    auto script_id = host_.load(file.path());
    if (!script_id) return std::unexpected("failed to load script: " + script_id.error());
    log(std::format("Script ID: {}", *script_id));

    log("===== Run script =====");
    auto start_time = std::chrono::system_clock::now();
    auto ran = host_.run(*script_id);
    if (!ran) return std::unexpected("failed to run script: " + ran.error());

    auto stopped = host_.stop(*script_id);
    if (!stopped) {
        std::println(stderr, "runner: failed to stop script {}: {}", *script_id, stopped.error());
    }

    log("===== Output =====");
    return collect(start_time, file.marker());
}

std::expected<protocol::DecodedRun, std::string>
Runner::collect(std::chrono::system_clock::time_point since, const std::string& marker) {
    protocol::DecodedRun run;
    std::string text;
    for (uint32_t attempt = 0; attempt <= config_.journal.retries; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.journal.retry_delay_ms));
        }

        auto read = logs_.read_since(since);
        if (!read) return std::unexpected("failed to read KWin log: " + read.error());

        text = std::move(*read);
        run = protocol::decode(text, marker, config_.journal.prefix);
        if (run.finished) break;
    }
    log("KWin log from the systemd journal:\n" + text);

    for (const auto& line : run.debug) {
        log("script: " + line);
    }

    if (!run.started) {
        std::println(stderr, "runner: no output from script {} found in the KWin log", marker);
    } else if (run.incomplete()) {
        std::println(stderr, "runner: script {} did not finish, output may be incomplete", marker);
    }
    return run;
}

void Runner::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[kdotool] {}", msg);
    }
}

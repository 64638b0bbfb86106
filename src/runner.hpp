#pragma once

#include "compiler/script_compiler.hpp"
#include "config.hpp"
#include "platform/log_source.hpp"
#include "platform/script_file.hpp"
#include "platform/script_host.hpp"
#include "protocol/output_protocol.hpp"

#include <expected>
#include <string>

// Executes a compiled script in the host and recovers its output from the log.
class Runner {
public:
    Runner(Config config, bool verbose, ScriptHost& host, LogSource& logs);

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    std::expected<protocol::DecodedRun, std::string> execute(const CompiledScript& script,
                                                             ScriptFile& file);

private:
    // Re-reads the log until FINISH shows up or retries run out.
    std::expected<protocol::DecodedRun, std::string>
    collect(std::chrono::system_clock::time_point since, const std::string& marker);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    ScriptHost& host_;
    LogSource& logs_;
};

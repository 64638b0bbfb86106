#pragma once

#include <expected>
#include <string>

// Scripting host that executes generated scripts.
class ScriptHost {
public:
    virtual ~ScriptHost() = default;
    // Returns the host's id for the loaded script.
    virtual std::expected<int, std::string> load(const std::string& path) = 0;
    virtual std::expected<void, std::string> run(int script_id) = 0;
    virtual std::expected<void, std::string> stop(int script_id) = 0;
};

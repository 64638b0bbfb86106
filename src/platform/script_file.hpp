#pragma once

#include <expected>
#include <string>

// Transient file a script is loaded from. Its unique name doubles as the marker.
class ScriptFile {
public:
    virtual ~ScriptFile() = default;
    virtual const std::string& path() const = 0;
    virtual std::string marker() const = 0;
    virtual std::expected<void, std::string> write(const std::string& contents) = 0;
};

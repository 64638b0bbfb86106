#pragma once

#include "platform/script_file.hpp"

#include <memory>

class TempScriptFile : public ScriptFile {
public:
    // Creates <dir>/<prefix>XXXXXX with mkstemp.
    static std::expected<std::unique_ptr<TempScriptFile>, std::string>
    create(const std::string& dir, const std::string& prefix);

    ~TempScriptFile() override;

    TempScriptFile(const TempScriptFile&) = delete;
    TempScriptFile& operator=(const TempScriptFile&) = delete;

    const std::string& path() const override { return path_; }
    std::string marker() const override;
    std::expected<void, std::string> write(const std::string& contents) override;

private:
    TempScriptFile(int fd, std::string path);

    int fd_ = -1;
    std::string path_;
};

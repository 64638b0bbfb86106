#include "platform/linux/temp_script_file.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

std::expected<std::unique_ptr<TempScriptFile>, std::string>
TempScriptFile::create(const std::string& dir, const std::string& prefix) {
    auto path = (std::filesystem::path(dir) / (prefix + "XXXXXX")).string();

    // mkstemp needs a mutable char*
    std::vector<char> tmpl(path.begin(), path.end());
    tmpl.push_back('\0');
    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return std::unexpected(std::string("mkstemp() failed: ") + std::strerror(errno));
    }
    return std::unique_ptr<TempScriptFile>(new TempScriptFile(fd, std::string(tmpl.data())));
}

TempScriptFile::TempScriptFile(int fd, std::string path)
    : fd_(fd), path_(std::move(path)) {}

TempScriptFile::~TempScriptFile() {
    if (fd_ >= 0) ::close(fd_);
    ::unlink(path_.c_str());
}

std::string TempScriptFile::marker() const {
    return std::filesystem::path(path_).filename().string();
}

std::expected<void, std::string> TempScriptFile::write(const std::string& contents) {
    if (fd_ < 0) return std::unexpected("script file is closed");

    if (::ftruncate(fd_, 0) < 0 || ::lseek(fd_, 0, SEEK_SET) < 0) {
        return std::unexpected(std::string("truncate failed: ") + std::strerror(errno));
    }

    size_t total_written = 0;
    while (total_written < contents.size()) {
        ssize_t n = ::write(fd_, contents.data() + total_written, contents.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("write() failed: ") + std::strerror(errno));
        }
        total_written += static_cast<size_t>(n);
    }

    if (::fsync(fd_) < 0) {
        return std::unexpected(std::string("fsync() failed: ") + std::strerror(errno));
    }
    return {};
}

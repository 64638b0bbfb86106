#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = 0;
    std::string out; // captured stdout
};

// fork/exec argv[0] from $PATH, capture stdout, wait for exit.
// stderr is inherited. Exit code 127 means the program could not be executed.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv);

} // namespace platform

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox::process {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    // The child never started; exit_code is meaningless.
    bool spawn_failed = false;
    std::string std_out;
    std::string std_err;
    std::string error;
};

class ProcessRunner {
public:
    // Runs argv directly (no shell) in working_dir. argv[0] is looked up on
    // PATH unless it contains a '/'. A zero timeout waits indefinitely.
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const std::filesystem::path& working_dir,
                             std::chrono::seconds timeout);
};

}  // namespace runbox::process

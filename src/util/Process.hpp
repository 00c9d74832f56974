#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitpulse {

struct ProcessResult {
    int exitCode{0};          // exit status, or -signal when killed
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Run an executable (searched on PATH) and capture its output
 *
 * Arguments are passed straight to execvp, no shell is involved.
 * The child is terminated when @p timeout elapses, which is reported
 * as ErrorCode::Timeout. Failing to spawn is ErrorCode::IoError.
 * A non-zero exit status is not an error here; callers inspect exitCode.
 */
Expected<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                   const std::filesystem::path& workingDir,
                                   std::chrono::milliseconds timeout);

}

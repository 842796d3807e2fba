#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::runner {

struct ExecutionRequest {
    std::string code;
    std::string filename;
    std::string language;
    // Absolute location inside the workspace, fixed during validation.
    std::filesystem::path file_path;
};

enum class ExecutionStatus {
    Success,
    Error
};

inline const char* ToString(ExecutionStatus status) {
    return status == ExecutionStatus::Success ? "success" : "error";
}

// Why the runner itself failed. A child that exits non-zero is not a failure.
enum class FailureKind {
    None,
    // The request named a language the engine has no interpreter for.
    UnsupportedLanguage,
    WriteError,
    SpawnError,
    Timeout
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Error;
    FailureKind failure = FailureKind::None;
    std::string std_out;
    std::string std_err;
    std::vector<std::string> command_executed;
    std::optional<int> return_code;
    std::string error;
};

}  // namespace runbox::runner

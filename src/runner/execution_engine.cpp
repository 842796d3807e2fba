#include "runner/execution_engine.hpp"

#include <string>
#include <utility>

#include "process/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::runner {

using runbox::utils::LogLevel;

ExecutionEngine::ExecutionEngine(const runbox::workspace::Workspace& workspace,
                                 const LanguageTable& languages,
                                 EngineOptions options)
    : workspace_(workspace)
    , languages_(languages)
    , options_(options) {}

ExecutionResult ExecutionEngine::Run(const ExecutionRequest& request) const {
    const auto* language = languages_.Find(request.language);
    if (!language) {
        ExecutionResult result{};
        result.failure = FailureKind::UnsupportedLanguage;
        result.error = "Unsupported language: " + request.language;
        return result;
    }

    auto result = Execute(request, *language);
    if (options_.cleanup_after_run && result.failure != FailureKind::WriteError) {
        Cleanup(request);
    }
    return result;
}

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request,
                                         const Language& language) const {
    ExecutionResult result{};
    const auto path_string = request.file_path.string();

    if (!workspace_.EnsureExists()) {
        result.failure = FailureKind::WriteError;
        result.error = "Failed to write code to file: workspace unavailable";
        return result;
    }
    const auto written = workspace_.WriteFile(request.file_path, request.code);
    if (!written.ok) {
        runbox::utils::Log(LogLevel::kError, "engine", "write failed",
                           {{"path", path_string}, {"reason", written.error}});
        result.failure = FailureKind::WriteError;
        result.error = "Failed to write code to file: " + written.error;
        return result;
    }
    runbox::utils::Log(LogLevel::kDebug, "engine", "code written",
                       {{"path", path_string}, {"bytes", std::to_string(request.code.size())}});

    result.command_executed = {language.interpreter, path_string};
    runbox::utils::Log(LogLevel::kInfo, "engine", "executing",
                       {{"command", runbox::utils::Join(result.command_executed, " ")}});

    const auto outcome = runbox::process::ProcessRunner::Run(
        result.command_executed,
        workspace_.Root(),
        options_.timeout);

    if (outcome.spawn_failed) {
        runbox::utils::Log(LogLevel::kError, "engine", "spawn failed",
                           {{"filename", request.filename}, {"reason", outcome.error}});
        result.failure = FailureKind::SpawnError;
        result.error = "Failed to start " + language.interpreter + ": " + outcome.error;
        return result;
    }

    result.std_out = outcome.std_out;
    result.std_err = outcome.std_err;

    if (outcome.timed_out) {
        runbox::utils::Log(LogLevel::kWarn, "engine", "timed out",
                           {{"filename", request.filename},
                            {"timeout_s", std::to_string(options_.timeout.count())}});
        result.failure = FailureKind::Timeout;
        result.error = "Execution timed out after " + std::to_string(options_.timeout.count()) +
                       " seconds.";
        return result;
    }
    if (!outcome.error.empty()) {
        result.failure = FailureKind::SpawnError;
        result.error = "Failed to observe child process: " + outcome.error;
        return result;
    }

    result.status = ExecutionStatus::Success;
    result.return_code = outcome.exit_code;
    runbox::utils::Log(LogLevel::kInfo, "engine", "finished",
                       {{"filename", request.filename},
                        {"return_code", std::to_string(outcome.exit_code)}});
    return result;
}

void ExecutionEngine::Cleanup(const ExecutionRequest& request) const {
    if (workspace_.RemoveFile(request.file_path)) {
        runbox::utils::Log(LogLevel::kDebug, "engine", "cleaned up",
                           {{"path", request.file_path.string()}});
    }
}

}  // namespace runbox::runner

#pragma once

#include <chrono>

#include "runner/execution_types.hpp"
#include "runner/languages.hpp"
#include "workspace/workspace.hpp"

namespace runbox::runner {

struct EngineOptions {
    // Zero means no deadline.
    std::chrono::seconds timeout{30};
    bool cleanup_after_run = true;
};

// Writes a validated request into the workspace and runs it with the
// language's interpreter. Holds no locks; concurrent runs of the same
// filename overwrite each other's file.
class ExecutionEngine {
public:
    ExecutionEngine(const runbox::workspace::Workspace& workspace,
                    const LanguageTable& languages,
                    EngineOptions options = {});

    ExecutionResult Run(const ExecutionRequest& request) const;

    const EngineOptions& Options() const { return options_; }

private:
    ExecutionResult Execute(const ExecutionRequest& request, const Language& language) const;
    void Cleanup(const ExecutionRequest& request) const;

    const runbox::workspace::Workspace& workspace_;
    const LanguageTable& languages_;
    EngineOptions options_;
};

}  // namespace runbox::runner

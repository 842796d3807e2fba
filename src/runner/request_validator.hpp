#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "runner/execution_types.hpp"
#include "runner/languages.hpp"
#include "workspace/workspace.hpp"

namespace runbox::runner {

enum class ValidationErrorKind {
    None,
    InvalidPayload,
    MissingField,
    UnsupportedLanguage,
    InvalidFilename
};

const char* ToString(ValidationErrorKind kind);

struct ValidationResult {
    std::optional<ExecutionRequest> request;
    ValidationErrorKind error_kind = ValidationErrorKind::None;
    std::string error;

    bool ok() const { return request.has_value(); }
};

class RequestValidator {
public:
    RequestValidator(const runbox::workspace::Workspace& workspace, const LanguageTable& languages);

    ValidationResult ValidateBody(const std::string& body) const;
    ValidationResult Validate(const nlohmann::json& payload) const;

private:
    const runbox::workspace::Workspace& workspace_;
    const LanguageTable& languages_;
};

}  // namespace runbox::runner

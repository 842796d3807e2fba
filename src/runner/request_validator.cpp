#include "runner/request_validator.hpp"

#include <utility>
#include <vector>

#include "utils/common.hpp"

namespace runbox::runner {
namespace {

ValidationResult Reject(ValidationErrorKind kind, std::string message) {
    ValidationResult result{};
    result.error_kind = kind;
    result.error = std::move(message);
    return result;
}

// Empty when the field is absent, not a string, or "".
std::string GetString(const nlohmann::json& payload, const char* name) {
    auto it = payload.find(name);
    if (it == payload.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

const char* ToString(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::None: return "none";
        case ValidationErrorKind::InvalidPayload: return "invalid_payload";
        case ValidationErrorKind::MissingField: return "missing_field";
        case ValidationErrorKind::UnsupportedLanguage: return "unsupported_language";
        case ValidationErrorKind::InvalidFilename: return "invalid_filename";
    }
    return "unknown";
}

RequestValidator::RequestValidator(const runbox::workspace::Workspace& workspace,
                                   const LanguageTable& languages)
    : workspace_(workspace)
    , languages_(languages) {}

ValidationResult RequestValidator::ValidateBody(const std::string& body) const {
    return Validate(nlohmann::json::parse(body, nullptr, false));
}

ValidationResult RequestValidator::Validate(const nlohmann::json& payload) const {
    if (payload.is_discarded() || !payload.is_object()) {
        return Reject(ValidationErrorKind::InvalidPayload, "Invalid JSON payload");
    }

    ExecutionRequest request{};
    request.code = GetString(payload, "code");
    request.filename = GetString(payload, "filename");

    std::vector<std::string> missing;
    if (request.code.empty()) {
        missing.push_back("code");
    }
    if (request.filename.empty()) {
        missing.push_back("filename");
    }
    if (!missing.empty()) {
        return Reject(ValidationErrorKind::MissingField,
                      "Missing 'code' or 'filename' (missing: " + runbox::utils::Join(missing, ", ") + ")");
    }

    request.language = kDefaultLanguage;
    auto language_it = payload.find("language");
    if (language_it != payload.end() && !language_it->is_null()) {
        if (!language_it->is_string()) {
            return Reject(ValidationErrorKind::UnsupportedLanguage,
                          "Unsupported language: " + language_it->dump());
        }
        request.language = language_it->get<std::string>();
    }
    if (!languages_.Find(request.language)) {
        return Reject(ValidationErrorKind::UnsupportedLanguage,
                      "Unsupported language: " + request.language);
    }

    auto path = workspace_.Resolve(request.filename);
    if (!path) {
        return Reject(ValidationErrorKind::InvalidFilename,
                      "Invalid filename. Directory traversal attempt detected.");
    }
    request.file_path = std::move(*path);

    ValidationResult result{};
    result.request = std::move(request);
    return result;
}

}  // namespace runbox::runner

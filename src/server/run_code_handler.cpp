#include "server/run_code_handler.hpp"

#include "utils/logging.hpp"

namespace runbox::server {

using runbox::runner::ExecutionResult;
using runbox::runner::ExecutionStatus;
using runbox::runner::FailureKind;
using runbox::utils::LogLevel;

nlohmann::json BuildErrorJson(const std::string& message) {
    return {{"error", message}};
}

std::string DumpJson(const nlohmann::json& body, int indent) {
    return body.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json BuildResultJson(const ExecutionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["status"] = runbox::runner::ToString(result.status);
    if (result.status == ExecutionStatus::Success) {
        json["stdout"] = result.std_out;
        json["stderr"] = result.std_err;
        json["command_executed"] = result.command_executed;
        json["return_code"] = result.return_code.value_or(0);
        return json;
    }

    json["error"] = result.error;
    switch (result.failure) {
        case FailureKind::Timeout:
            json["stdout"] = result.std_out;
            json["stderr"] = result.std_err;
            json["command_executed"] = result.command_executed;
            json["timed_out"] = true;
            break;
        case FailureKind::SpawnError:
            if (!result.command_executed.empty()) {
                json["command_executed"] = result.command_executed;
            }
            break;
        case FailureKind::UnsupportedLanguage:
        case FailureKind::WriteError:
        case FailureKind::None:
            break;
    }
    return json;
}

int StatusCodeFor(const ExecutionResult& result) {
    if (result.status == ExecutionStatus::Success) {
        return 200;
    }
    switch (result.failure) {
        case FailureKind::Timeout:
            return 408;
        case FailureKind::UnsupportedLanguage:
            return 400;
        default:
            return 500;
    }
}

RunCodeHandler::RunCodeHandler(const runbox::runner::RequestValidator& validator,
                               const runbox::runner::ExecutionEngine& engine)
    : validator_(validator)
    , engine_(engine) {}

HttpReply RunCodeHandler::HandleBody(const std::string& body) const {
    return Respond(validator_.ValidateBody(body));
}

HttpReply RunCodeHandler::Handle(const nlohmann::json& payload) const {
    return Respond(validator_.Validate(payload));
}

HttpReply RunCodeHandler::Respond(const runbox::runner::ValidationResult& validation) const {
    if (!validation.ok()) {
        runbox::utils::Log(LogLevel::kWarn, "run_code", "rejected",
                           {{"kind", runbox::runner::ToString(validation.error_kind)},
                            {"reason", validation.error}});
        return {400, BuildErrorJson(validation.error)};
    }

    const auto& request = *validation.request;
    runbox::utils::Log(LogLevel::kInfo, "run_code", "received",
                       {{"filename", request.filename}, {"language", request.language}});

    const auto result = engine_.Run(request);
    return {StatusCodeFor(result), BuildResultJson(result)};
}

}  // namespace runbox::server

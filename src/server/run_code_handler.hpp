#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "runner/execution_engine.hpp"
#include "runner/request_validator.hpp"

namespace runbox::server {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

nlohmann::json BuildErrorJson(const std::string& message);
// Child output is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
std::string DumpJson(const nlohmann::json& body, int indent = -1);
nlohmann::json BuildResultJson(const runbox::runner::ExecutionResult& result);
int StatusCodeFor(const runbox::runner::ExecutionResult& result);

// Body of POST /run_code, independent of the transport.
class RunCodeHandler {
public:
    RunCodeHandler(const runbox::runner::RequestValidator& validator,
                   const runbox::runner::ExecutionEngine& engine);

    HttpReply HandleBody(const std::string& body) const;
    HttpReply Handle(const nlohmann::json& payload) const;

private:
    HttpReply Respond(const runbox::runner::ValidationResult& validation) const;

    const runbox::runner::RequestValidator& validator_;
    const runbox::runner::ExecutionEngine& engine_;
};

}  // namespace runbox::server

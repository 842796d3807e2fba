#include "server/http_server.hpp"

#include <exception>

#include "utils/logging.hpp"

namespace runbox::server {

using runbox::utils::LogLevel;

namespace {

constexpr const char* kJsonContentType = "application/json";

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(DumpJson(body), kJsonContentType);
}

}  // namespace

HttpServer::HttpServer(const runbox::config::ServerConfig& config, const RunCodeHandler& handler)
    : config_(config)
    , handler_(handler) {
    server_.set_payload_max_length(config_.max_body_bytes);
    RegisterRoutes();
}

void HttpServer::RegisterRoutes() {
    server_.Post("/run_code", [this](const httplib::Request& req, httplib::Response& res) {
        HandleRunCode(req, res);
    });
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        WriteJson(res, 200, {{"status", "ok"}});
    });
}

void HttpServer::HandleRunCode(const httplib::Request& req, httplib::Response& res) const {
    try {
        const auto reply = handler_.HandleBody(req.body);
        WriteJson(res, reply.status, reply.body);
    } catch (const std::exception& ex) {
        runbox::utils::Log(LogLevel::kError, "http", "unhandled exception in /run_code",
                           {{"what", ex.what()}});
        WriteJson(res, 500, BuildErrorJson("Internal server error"));
    }
}

bool HttpServer::Listen() {
    runbox::utils::Log(LogLevel::kInfo, "http", "listening",
                       {{"host", config_.host}, {"port", std::to_string(config_.port)}});
    const bool ok = server_.listen(config_.host.c_str(), config_.port);
    if (!ok) {
        runbox::utils::Log(LogLevel::kError, "http", "failed to listen",
                           {{"host", config_.host}, {"port", std::to_string(config_.port)}});
    }
    return ok;
}

int HttpServer::BindToAnyPort(const std::string& host) {
    return server_.bind_to_any_port(host.c_str());
}

bool HttpServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void HttpServer::Stop() {
    server_.stop();
}

bool HttpServer::IsRunning() const {
    return server_.is_running();
}

}  // namespace runbox::server

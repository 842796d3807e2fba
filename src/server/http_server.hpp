#pragma once

#include <string>

#include <httplib.h>

#include "config/config_schema.hpp"
#include "server/run_code_handler.hpp"

namespace runbox::server {

class HttpServer {
public:
    HttpServer(const runbox::config::ServerConfig& config, const RunCodeHandler& handler);

    // Blocks until Stop() is called. False when the address cannot be bound.
    bool Listen();

    // Binds an ephemeral port on `host` and returns it, or -1.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

private:
    void RegisterRoutes();
    void HandleRunCode(const httplib::Request& req, httplib::Response& res) const;

    runbox::config::ServerConfig config_;
    const RunCodeHandler& handler_;
    httplib::Server server_;
};

}  // namespace runbox::server

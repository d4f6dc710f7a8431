#pragma once

#include "daemon/supervisor.hpp"

#include <memory>
#include <string>

/// HTTP/JSON front end over a Supervisor
class ApiServer {
public:
    explicit ApiServer(Supervisor& supervisor);
    ~ApiServer();

    /// Bind host:port; port 0 picks a free one. Returns the bound port, -1 on failure.
    int bind(const std::string& host, int port);

    /// Serve until stop(). Requires a successful bind().
    bool listen();

    void stop();
    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

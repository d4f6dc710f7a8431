#include "daemon/daemon.hpp"

#include <spdlog/spdlog.h>
#include <chrono>

PosixProcessControl::Options Daemon::control_options(const AppConfig& cfg) {
    PosixProcessControl::Options opts;
    opts.java_binary = cfg.java_binary;
    opts.java_args = cfg.java_args;
    opts.launch_check = std::chrono::milliseconds(cfg.launch_check_ms);
    opts.stop_timeout = std::chrono::seconds(cfg.stop_timeout_sec);
    opts.kill_timeout = std::chrono::seconds(cfg.kill_timeout_sec);
    return opts;
}

Daemon::Daemon(Config& config)
    : config_(config),
      store_(config.data().store_path),
      control_(control_options(config.data())),
      supervisor_(store_, registry_, control_, probe_, clock_,
                  Supervisor::options_from(config.data())),
      api_(supervisor_) {}

Daemon::~Daemon() {
    request_stop();
    api_.stop();
    if (api_thread_.joinable()) {
        api_thread_.join();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    const auto& d = config_.data();

    // 1. Bind the API first so a port clash fails fast
    int port = api_.bind(d.api_host, d.api_port);
    if (port < 0) {
        spdlog::error("Cannot bind HTTP API on {}:{}", d.api_host, d.api_port);
        return 1;
    }
    spdlog::info("Policies: {}", store_.path());
    spdlog::info("HTTP API listening on http://{}:{}", d.api_host, port);

    // 2. Background discovery + evaluation
    supervisor_.start();

    // 3. Serve
    api_thread_ = std::thread([this] {
        if (!api_.listen()) {
            spdlog::error("HTTP API stopped unexpectedly");
            stop_flag_.store(true);
        }
    });

    while (!stop_flag_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // 4. Cleanup. Supervised services keep running.
    spdlog::info("Shutting down");
    api_.stop();
    if (api_thread_.joinable()) {
        api_thread_.join();
    }
    supervisor_.stop();
    return 0;
}

#pragma once

#include "api/api_server.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/policy_store.hpp"
#include "daemon/launcher.hpp"
#include "daemon/process_registry.hpp"
#include "daemon/queue_probe.hpp"
#include "daemon/supervisor.hpp"

#include <atomic>
#include <thread>

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop; blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    static PosixProcessControl::Options control_options(const AppConfig& cfg);

private:
    Config& config_;
    PolicyStore store_;
    ProcfsRegistry registry_;
    PosixProcessControl control_;
    UnavailableQueueProbe probe_;
    SteadyClock clock_;
    Supervisor supervisor_;
    ApiServer api_;

    std::atomic<bool> stop_flag_{false};
    std::thread api_thread_;
};

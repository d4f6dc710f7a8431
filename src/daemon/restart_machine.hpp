#pragma once

#include "core/clock.hpp"
#include "core/service_types.hpp"
#include "daemon/launcher.hpp"
#include "daemon/runtime_table.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/// Drives Idle -> Stopping -> Delaying -> Relaunching -> Idle for one logical
/// name at a time. Each cycle runs on its own thread so a long delay never
/// blocks evaluation of other services.
class RestartMachine {
public:
    struct Options {
        std::chrono::seconds restart_delay{120};
        std::chrono::seconds queue_restart_delay{60};
        std::chrono::milliseconds poll_interval{200};
    };

    struct Transition {
        std::string logical_name;
        RestartPhase from;
        RestartPhase to;
        pid_t pid;
    };

    struct Outcome {
        bool success = false;
        bool cancelled = false;
        pid_t old_pid = -1;
        pid_t new_pid = -1;
        std::string error;          // "RestartFailed: ..." on failure
    };

    RestartMachine(RuntimeTable& table, ProcessControl& control, const Clock& clock);
    RestartMachine(RuntimeTable& table, ProcessControl& control, const Clock& clock,
                   Options options);
    ~RestartMachine();

    RestartMachine(const RestartMachine&) = delete;
    RestartMachine& operator=(const RestartMachine&) = delete;

    /// Start a cycle. False when the name already has one in flight
    /// or the machine is shutting down.
    bool trigger(const RestartTrigger& trigger, const AutoRestartPolicy& policy);

    /// Cancel a pending relaunch (manual stop while Stopping or Delaying).
    /// The service ends Idle and stays down.
    bool cancel(const std::string& logical_name);

    RestartPhase phase(const std::string& logical_name) const;

    /// Delay applied for a given breach
    std::chrono::seconds delay_for(BreachReason reason) const;

    /// Abandon delaying cycles and join every worker. Supervised processes
    /// are not touched.
    void shutdown();

    /// Invoked from worker threads
    std::function<void(const Transition&)> on_transition;
    std::function<void(const std::string&, const Outcome&)> on_finished;

private:
    struct Cycle {
        std::thread worker;
        std::atomic<bool> cancel{false};
        std::atomic<bool> done{false};
    };

    RuntimeTable& table_;
    ProcessControl& control_;
    const Clock& clock_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Cycle>, CaseInsensitiveLess> cycles_;
    std::atomic<bool> shutting_down_{false};

    void run_cycle(RestartTrigger trigger, std::shared_ptr<Cycle> cycle);
    void transition(const std::string& name, RestartPhase from, RestartPhase to, pid_t pid);
    void finish(const std::string& name, const Outcome& outcome);
};

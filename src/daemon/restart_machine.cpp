#include "daemon/restart_machine.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>
#include <vector>

RestartMachine::RestartMachine(RuntimeTable& table, ProcessControl& control, const Clock& clock)
    : RestartMachine(table, control, clock, Options{}) {}

RestartMachine::RestartMachine(RuntimeTable& table, ProcessControl& control, const Clock& clock,
                               Options options)
    : table_(table), control_(control), clock_(clock), options_(options) {}

RestartMachine::~RestartMachine() {
    shutdown();
}

std::chrono::seconds RestartMachine::delay_for(BreachReason reason) const {
    // queue-only breaches drain faster than CPU/memory recovery
    if (reason == BreachReason::Queue) return options_.queue_restart_delay;
    return options_.restart_delay;
}

RestartPhase RestartMachine::phase(const std::string& logical_name) const {
    auto state = table_.find_by_name(logical_name);
    if (!state || !state->restarting) return RestartPhase::Idle;
    return state->phase;
}

void RestartMachine::transition(const std::string& name, RestartPhase from, RestartPhase to,
                                pid_t pid) {
    spdlog::debug("Restart cycle {}: {} -> {}", name, restart_phase_name(from), restart_phase_name(to));
    if (on_transition) on_transition(Transition{name, from, to, pid});
}

void RestartMachine::finish(const std::string& name, const Outcome& outcome) {
    if (on_finished) on_finished(name, outcome);
}

// ── Trigger / cancel ────────────────────────────────────────

bool RestartMachine::trigger(const RestartTrigger& trigger, const AutoRestartPolicy& policy) {
    if (shutting_down_.load()) return false;

    if (!table_.begin_restart(trigger, policy)) {
        spdlog::info("Restart of {} already in progress, ignoring trigger for pid {}",
                     trigger.logical_name, trigger.pid);
        return false;
    }

    // A previous cycle for the name has left the table but may still be
    // reporting; its worker is joined once mutex_ is released
    std::shared_ptr<Cycle> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = cycles_[trigger.logical_name];
        previous = std::move(slot);
        slot = std::make_shared<Cycle>();
        slot->worker = std::thread(&RestartMachine::run_cycle, this, trigger, slot);
    }
    if (previous && previous->worker.joinable()) previous->worker.join();
    return true;
}

bool RestartMachine::cancel(const std::string& logical_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cycles_.find(logical_name);
    if (it == cycles_.end() || it->second->done.load()) return false;

    RestartPhase current = phase(logical_name);
    if (current != RestartPhase::Stopping && current != RestartPhase::Delaying) return false;

    it->second->cancel.store(true);
    cv_.notify_all();
    spdlog::info("Pending relaunch of {} cancelled", logical_name);
    return true;
}

void RestartMachine::shutdown() {
    shutting_down_.store(true);
    cv_.notify_all();

    std::vector<std::shared_ptr<Cycle>> cycles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, cycle] : cycles_) cycles.push_back(cycle);
        cycles_.clear();
    }
    for (auto& cycle : cycles) {
        if (cycle->worker.joinable()) cycle->worker.join();
    }
}

// ── Cycle ───────────────────────────────────────────────────

void RestartMachine::run_cycle(RestartTrigger trigger, std::shared_ptr<Cycle> cycle) {
    const std::string name = trigger.logical_name;
    Outcome outcome;
    outcome.old_pid = trigger.pid;

    transition(name, RestartPhase::Idle, RestartPhase::Stopping, trigger.pid);

    // Stopping
    try {
        control_.stop(trigger.pid);
    } catch (const StopTimeout& e) {
        spdlog::error("Restart of {} aborted: {}", name, e.what());
        table_.abort_restart(name, false);
        outcome.error = std::string("RestartFailed: ") + e.what();
        transition(name, RestartPhase::Stopping, RestartPhase::Idle, trigger.pid);
        cycle->done.store(true);
        finish(name, outcome);
        return;
    }

    // Delaying: the deadline starts once the old process is confirmed gone
    auto deadline = clock_.now() + delay_for(trigger.reason);
    table_.set_phase(name, RestartPhase::Delaying, deadline);
    transition(name, RestartPhase::Stopping, RestartPhase::Delaying, trigger.pid);
    spdlog::info("Waiting {} seconds before restarting {}",
                 delay_for(trigger.reason).count(), name);

    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cycle->cancel.load() && !shutting_down_.load() && clock_.now() < deadline) {
            cv_.wait_for(lock, options_.poll_interval);
        }
    }

    if (cycle->cancel.load() || shutting_down_.load()) {
        if (shutting_down_.load() && !cycle->cancel.load()) {
            spdlog::warn("Supervisor shutting down; relaunch of {} abandoned", name);
            outcome.error = "Relaunch abandoned at shutdown";
        }
        table_.abort_restart(name, true);
        outcome.cancelled = true;
        transition(name, RestartPhase::Delaying, RestartPhase::Idle, trigger.pid);
        cycle->done.store(true);
        finish(name, outcome);
        return;
    }

    // Relaunching
    table_.set_phase(name, RestartPhase::Relaunching);
    transition(name, RestartPhase::Delaying, RestartPhase::Relaunching, trigger.pid);

    try {
        LaunchRequest request;
        request.artifact_path = trigger.artifact_path;
        request.working_directory = trigger.working_directory;
        pid_t new_pid = control_.launch(request);

        table_.rekey(name, new_pid);
        outcome.success = true;
        outcome.new_pid = new_pid;
        spdlog::info("Auto-restart of {} succeeded. PID {} -> {}", name, trigger.pid, new_pid);
        transition(name, RestartPhase::Relaunching, RestartPhase::Idle, new_pid);
    } catch (const LaunchError& e) {
        spdlog::error("Auto-restart of {} failed ({}): {}",
                      name, launch_error_kind_name(e.kind()), e.what());
        table_.abort_restart(name, true);
        outcome.error = std::string("RestartFailed: ") + e.what();
        transition(name, RestartPhase::Relaunching, RestartPhase::Idle, trigger.pid);
    }

    cycle->done.store(true);
    finish(name, outcome);
}

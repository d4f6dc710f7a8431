#include "daemon/supervisor.hpp"
#include "core/errors.hpp"
#include "core/identity.hpp"
#include "daemon/threshold_monitor.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

Supervisor::Options Supervisor::options_from(const AppConfig& cfg) {
    Options opts;
    opts.check_interval = std::chrono::seconds(cfg.check_interval_sec);
    opts.error_retry_interval = std::chrono::seconds(cfg.error_retry_interval_sec);
    opts.restart.restart_delay = std::chrono::seconds(cfg.restart_delay_sec);
    opts.restart.queue_restart_delay = std::chrono::seconds(cfg.queue_restart_delay_sec);
    return opts;
}

Supervisor::Supervisor(PolicyStore& store, ProcessRegistry& registry, ProcessControl& control,
                       QueueProbe& probe, const Clock& clock, Options options)
    : state_(store),
      registry_(registry),
      control_(control),
      probe_(probe),
      options_(options),
      restarts_(state_.runtime, control, clock, options.restart) {
    state_.snapshot = store.load_or_empty();

    restarts_.on_finished = [this](const std::string& name, const RestartMachine::Outcome& outcome) {
        if (outcome.success) {
            record_error(name, "");
        } else if (!outcome.error.empty()) {
            record_error(name, outcome.error);
        }
    };
}

Supervisor::~Supervisor() {
    stop();
}

// ── Background task ─────────────────────────────────────────

void Supervisor::start() {
    if (monitor_thread_.joinable()) return;
    stop_flag_.store(false);
    monitor_thread_ = std::thread(&Supervisor::monitor_loop, this);
    spdlog::info("Auto-restart monitoring started (every {} s)",
                 std::chrono::duration_cast<std::chrono::seconds>(options_.check_interval).count());
}

void Supervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_flag_.store(true);
    }
    loop_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    restarts_.shutdown();
}

bool Supervisor::wait_for(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    return !loop_cv_.wait_for(lock, interval, [this] { return stop_flag_.load(); });
}

void Supervisor::monitor_loop() {
    auto interval = options_.check_interval;
    while (wait_for(interval)) {
        interval = options_.check_interval;
        try {
            run_pass();
        } catch (const std::exception& e) {
            spdlog::error("Error in auto-restart monitor: {}", e.what());
            interval = options_.error_retry_interval;
        }
    }
}

std::vector<RestartTrigger> Supervisor::run_pass() {
    // Blocking OS queries happen before any shared state is touched
    auto discovered_at = state_.runtime.generation();
    auto live = registry_.discover();

    ConfigurationSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(state_.store_mutex);
        snapshot = state_.snapshot;
    }
    state_.runtime.reconcile(live, snapshot, discovered_at);

    auto states = state_.runtime.snapshot();
    auto triggers = ThresholdMonitor::evaluate_once(live, states, probe_);

    std::vector<RestartTrigger> accepted;
    for (const auto& trigger : triggers) {
        try {
            auto it = states.find(trigger.pid);
            if (it == states.end()) continue;
            if (restarts_.trigger(trigger, it->second.policy)) {
                spdlog::warn("Initiating auto-restart of {} (pid {}): {}",
                             trigger.logical_name, trigger.pid, trigger.detail);
                accepted.push_back(trigger);
            }
        } catch (const std::exception& e) {
            spdlog::error("Error handling breach of {} (pid {}): {}",
                          trigger.logical_name, trigger.pid, e.what());
            record_error(trigger.logical_name, e.what());
        }
    }
    return accepted;
}

// ── Helpers ─────────────────────────────────────────────────

void Supervisor::record_error(const std::string& name, const std::string& error) {
    std::lock_guard<std::mutex> lock(state_.errors_mutex);
    if (error.empty()) {
        state_.last_errors.erase(name);
    } else {
        state_.last_errors[name] = error;
    }
}

std::string Supervisor::last_error(const std::string& logical_name) {
    std::lock_guard<std::mutex> lock(state_.errors_mutex);
    auto it = state_.last_errors.find(logical_name);
    return it == state_.last_errors.end() ? "" : it->second;
}

RestartPhase Supervisor::phase(const std::string& logical_name) const {
    return restarts_.phase(logical_name);
}

std::optional<AutoRestartPolicy> Supervisor::stored_policy(const std::string& name) {
    std::lock_guard<std::mutex> lock(state_.store_mutex);
    auto it = state_.snapshot.policies.find(name);
    if (it == state_.snapshot.policies.end()) return std::nullopt;
    return it->second;
}

AutoRestartPolicy Supervisor::default_policy(const std::string& logical_name) {
    AutoRestartPolicy policy;
    policy.logical_name = logical_name;
    policy.enabled = false;
    policy.cpu_threshold_percent = PolicyLimits::default_cpu;
    policy.memory_threshold_bytes = mb_to_bytes(PolicyLimits::default_memory_mb);
    return policy;
}

std::string Supervisor::validate(const AutoRestartPolicy& policy) {
    if (policy.logical_name.empty()) {
        return "Service name is required";
    }
    if (policy.cpu_threshold_percent < PolicyLimits::cpu_min ||
        policy.cpu_threshold_percent > PolicyLimits::cpu_max) {
        return "CPU threshold must be between 1 and 100";
    }
    double mb = bytes_to_mb(policy.memory_threshold_bytes);
    if (mb < PolicyLimits::memory_min_mb || mb > PolicyLimits::memory_max_mb) {
        return "Memory threshold must be between 1 MB and 10240 MB (10 GB)";
    }
    if (policy.queue_threshold_count &&
        (*policy.queue_threshold_count < PolicyLimits::queue_min ||
         *policy.queue_threshold_count > PolicyLimits::queue_max)) {
        return "Queue threshold must be between 1 and 1000000 messages";
    }
    return "";
}

ServiceView Supervisor::make_view(const ServiceRecord& rec) {
    ServiceView view;
    view.record = rec;
    auto stored = stored_policy(rec.logical_name);
    view.has_policy = stored.has_value();
    view.policy = stored ? *stored : default_policy(rec.logical_name);

    if (auto state = state_.runtime.find(rec.pid)) {
        view.restarting = state->restarting;
        view.phase = state->phase;
    }
    view.last_error = last_error(rec.logical_name);
    return view;
}

// Caller holds store_mutex. The in-memory snapshot is updated even when the
// write fails; the next successful save persists it.
OpResult Supervisor::persist_locked(const ConfigurationSnapshot& next) {
    OpResult result;
    state_.snapshot = next;
    try {
        state_.store.save(next);
        result.success = true;
    } catch (const ConfigError& e) {
        spdlog::error("Error saving config file {}: {}", state_.store.path(), e.what());
        result.error = std::string("Failed to save configuration: ") + e.what();
    }
    return result;
}

// ── Service operations ──────────────────────────────────────

std::vector<ServiceView> Supervisor::list_services() {
    auto discovered_at = state_.runtime.generation();
    auto live = registry_.discover();

    ConfigurationSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(state_.store_mutex);
        snapshot = state_.snapshot;
    }
    state_.runtime.reconcile(live, snapshot, discovered_at);

    std::vector<ServiceView> views;
    views.reserve(live.size());
    for (const auto& rec : live) {
        views.push_back(make_view(rec));
    }
    return views;
}

std::optional<ServiceView> Supervisor::get_service_detail(pid_t pid) {
    auto rec = registry_.inspect(pid);
    if (!rec) return std::nullopt;
    return make_view(*rec);
}

OpResult Supervisor::stop_service(pid_t pid) {
    OpResult result;

    if (cancel_pending(pid, result)) return result;

    auto rec = registry_.inspect(pid);
    if (!rec) {
        result.not_found = true;
        result.error = "Process not found or not a supervised artifact";
        return result;
    }

    // Holds off breach triggers for the name until the process is gone
    if (!state_.runtime.begin_manual_stop(rec->logical_name)) {
        if (cancel_pending(pid, result)) return result;
        result.error = "Restart of " + rec->logical_name + " in progress; try again shortly";
        return result;
    }

    try {
        control_.stop(pid);
    } catch (const StopTimeout& e) {
        state_.runtime.end_manual_stop(rec->logical_name);
        result.error = std::string("Failed to stop process: ") + e.what();
        record_error(rec->logical_name, result.error);
        return result;
    }

    state_.runtime.erase(pid);
    state_.runtime.end_manual_stop(rec->logical_name);

    result.success = true;
    result.message = "Service " + std::to_string(pid) + " stopped successfully";
    spdlog::info("Stopped service {} (pid {})", rec->logical_name, pid);
    return result;
}

// Old pid of a cycle in flight: drop the pending relaunch instead of stopping
bool Supervisor::cancel_pending(pid_t pid, OpResult& result) {
    auto state = state_.runtime.find(pid);
    if (!state || !state->restarting) return false;

    if (restarts_.cancel(state->logical_name)) {
        result.success = true;
        result.message = "Pending restart of " + state->logical_name + " cancelled";
    } else {
        result.error = "Service " + state->logical_name + " is relaunching; try again shortly";
    }
    return true;
}

StartResult Supervisor::start_service(const std::string& artifact_path,
                                      const std::string& working_directory,
                                      const std::vector<std::string>& extra_args) {
    StartResult result;
    if (artifact_path.empty()) {
        result.error = "jar_path is required";
        return result;
    }

    LaunchRequest request;
    request.artifact_path = artifact_path;
    request.working_directory = working_directory;
    request.extra_args = extra_args;
    try {
        result.pid = control_.launch(request);
        result.success = true;
        record_error(Identity::logical_name(artifact_path), "");
    } catch (const LaunchError& e) {
        result.error = e.what();
        record_error(Identity::logical_name(artifact_path), result.error);
        spdlog::error("Error starting service {} ({}): {}",
                      artifact_path, launch_error_kind_name(e.kind()), e.what());
    }
    return result;
}

OpResult Supervisor::restart_service(pid_t pid, const std::string& jar_name) {
    OpResult result;

    auto rec = registry_.inspect(pid);
    if (!rec) {
        result.not_found = true;
        result.error = "Service not found";
        return result;
    }

    RestartTrigger trigger;
    trigger.pid = pid;
    trigger.logical_name = rec->logical_name;
    trigger.artifact_path = rec->artifact_path;
    trigger.working_directory = rec->working_directory;
    trigger.reason = BreachReason::Manual;
    trigger.detail = "manual restart";

    if (!jar_name.empty()) {
        auto folder = folder_path();
        if (folder) {
            std::string resolved = ArtifactCatalog::resolve(*folder, jar_name);
            if (resolved.empty()) {
                result.error = "JAR file not found: " + (fs::path(*folder) / jar_name).string();
                return result;
            }
            trigger.artifact_path = resolved;
        }
    }

    auto policy = stored_policy(rec->logical_name).value_or(default_policy(rec->logical_name));
    if (!restarts_.trigger(trigger, policy)) {
        result.error = "Restart of " + rec->logical_name + " already in progress";
        return result;
    }

    result.success = true;
    result.message = "Restart scheduled; relaunch in " +
                     std::to_string(restarts_.delay_for(BreachReason::Manual).count()) + " seconds";
    return result;
}

// ── Auto-restart configuration ──────────────────────────────

AutoRestartPolicy Supervisor::get_auto_restart_config(const std::string& name_or_pid) {
    std::string name = name_or_pid;

    if (auto pid = Identity::parse_pid(name_or_pid)) {
        if (auto state = state_.runtime.find(*pid)) {
            name = state->logical_name;
        } else if (auto rec = registry_.inspect(*pid)) {
            name = rec->logical_name;
        }
    }

    return stored_policy(name).value_or(default_policy(name));
}

OpResult Supervisor::set_auto_restart_config(const std::string& logical_name,
                                             AutoRestartPolicy policy) {
    policy.logical_name = logical_name;
    OpResult result;
    result.error = validate(policy);
    if (!result.error.empty()) return result;

    {
        std::lock_guard<std::mutex> lock(state_.store_mutex);
        ConfigurationSnapshot next = state_.snapshot;
        auto it = next.policies.find(logical_name);
        if (it != next.policies.end()) {
            policy.logical_name = it->second.logical_name;  // keep first spelling
            it->second = policy;
        } else {
            next.policies.emplace(logical_name, policy);
        }
        result = persist_locked(next);
    }

    // Cycles in flight keep running; only future triggers see the change
    state_.runtime.update_policy(policy);

    if (result.success) {
        spdlog::info("Auto-restart {} for {}: CPU {:.1f}%, Memory {:.1f} MB",
                     policy.enabled ? "configured" : "disabled", logical_name,
                     policy.cpu_threshold_percent, bytes_to_mb(policy.memory_threshold_bytes));
        result.message = std::string("Auto-restart ") + (policy.enabled ? "enabled" : "disabled") +
                         " for " + logical_name;
    }
    return result;
}

OpResult Supervisor::delete_auto_restart_config(const std::string& logical_name) {
    OpResult result;
    {
        std::lock_guard<std::mutex> lock(state_.store_mutex);
        ConfigurationSnapshot next = state_.snapshot;
        if (next.policies.erase(logical_name) == 0) {
            result.success = true;
            result.message = "No auto-restart configuration for " + logical_name;
            return result;
        }
        result = persist_locked(next);
    }

    // Entries stop triggering now; the next pass drops them
    state_.runtime.update_policy(default_policy(logical_name));
    if (result.success) result.message = "Auto-restart configuration removed for " + logical_name;
    return result;
}

// ── Folder / artifacts ──────────────────────────────────────

OpResult Supervisor::set_folder_path(const std::string& path) {
    OpResult result;
    if (path.empty()) {
        result.error = "folder_path is required";
        return result;
    }
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        result.error = "Folder does not exist: " + path;
        return result;
    }

    std::lock_guard<std::mutex> lock(state_.store_mutex);
    ConfigurationSnapshot next = state_.snapshot;
    next.folder_path = path;
    result = persist_locked(next);
    if (result.success) result.message = "Folder path set successfully";
    return result;
}

std::optional<std::string> Supervisor::folder_path() {
    std::lock_guard<std::mutex> lock(state_.store_mutex);
    return state_.snapshot.folder_path;
}

ArtifactCatalog::ListResult Supervisor::list_artifacts(const std::string& folder) {
    std::string target = folder;
    if (target.empty()) {
        target = folder_path().value_or("");
    }
    return ArtifactCatalog::list(target);
}

#pragma once

#include "core/artifact_catalog.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/policy_store.hpp"
#include "core/service_types.hpp"
#include "daemon/launcher.hpp"
#include "daemon/process_registry.hpp"
#include "daemon/queue_probe.hpp"
#include "daemon/restart_machine.hpp"
#include "daemon/runtime_table.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/// Everything the background task and the API handlers share.
/// Owned by Supervisor, passed around by reference.
struct SupervisorState {
    explicit SupervisorState(PolicyStore& store) : store(store) {}

    PolicyStore& store;

    // Canonical policies and folder path; one writer at a time
    std::mutex store_mutex;
    ConfigurationSnapshot snapshot;

    RuntimeTable runtime;

    std::mutex errors_mutex;
    std::map<std::string, std::string, CaseInsensitiveLess> last_errors;
};

struct ServiceView {
    ServiceRecord record;
    AutoRestartPolicy policy;       // stored policy, or defaults when none
    bool has_policy = false;
    bool restarting = false;
    RestartPhase phase = RestartPhase::Idle;
    std::string last_error;
};

struct OpResult {
    bool success = false;
    bool not_found = false;         // unknown pid
    std::string error;
    std::string message;
};

struct StartResult {
    bool success = false;
    pid_t pid = -1;
    std::string error;
};

class Supervisor {
public:
    struct Options {
        std::chrono::milliseconds check_interval{30000};
        std::chrono::milliseconds error_retry_interval{60000};
        RestartMachine::Options restart;
    };

    static Options options_from(const AppConfig& cfg);

    Supervisor(PolicyStore& store, ProcessRegistry& registry, ProcessControl& control,
               QueueProbe& probe, const Clock& clock, Options options);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Start the periodic discovery + evaluation task
    void start();

    /// Stop and join the periodic task and any restart cycle threads.
    /// Launched services keep running.
    void stop();

    /// One discovery, reconcile and evaluation pass; fires restart cycles.
    /// Returns the triggers that were accepted.
    std::vector<RestartTrigger> run_pass();

    // ── Operations exposed to the API layer ─────────────────

    std::vector<ServiceView> list_services();
    std::optional<ServiceView> get_service_detail(pid_t pid);
    OpResult stop_service(pid_t pid);
    StartResult start_service(const std::string& artifact_path,
                              const std::string& working_directory = "",
                              const std::vector<std::string>& extra_args = {});

    /// Manual restart through the same cycle as auto-restart. With jar_name
    /// and a folder path set, the artifact is resolved in that folder instead.
    OpResult restart_service(pid_t pid, const std::string& jar_name = "");

    /// Accepts a logical name or a pid in decimal
    AutoRestartPolicy get_auto_restart_config(const std::string& name_or_pid);
    OpResult set_auto_restart_config(const std::string& logical_name, AutoRestartPolicy policy);
    OpResult delete_auto_restart_config(const std::string& logical_name);

    OpResult set_folder_path(const std::string& path);
    std::optional<std::string> folder_path();
    ArtifactCatalog::ListResult list_artifacts(const std::string& folder = "");

    RestartPhase phase(const std::string& logical_name) const;
    std::string last_error(const std::string& logical_name);

    SupervisorState& state() { return state_; }

    /// Default policy shown for services with none stored
    static AutoRestartPolicy default_policy(const std::string& logical_name);

    /// Empty when valid, otherwise the operator-facing message
    static std::string validate(const AutoRestartPolicy& policy);

private:
    SupervisorState state_;
    ProcessRegistry& registry_;
    ProcessControl& control_;
    QueueProbe& probe_;
    Options options_;
    RestartMachine restarts_;

    std::thread monitor_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> stop_flag_{false};

    void monitor_loop();
    bool wait_for(std::chrono::milliseconds interval);

    void record_error(const std::string& name, const std::string& error);
    std::optional<AutoRestartPolicy> stored_policy(const std::string& name);
    ServiceView make_view(const ServiceRecord& rec);
    OpResult persist_locked(const ConfigurationSnapshot& next);
    bool cancel_pending(pid_t pid, OpResult& result);
};

#pragma once

#include "core/service_types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

/// Thread-safe pid -> RestartRuntimeState cache with one lock per logical name.
///
/// The per-name lock covers every transition that flips `restarting` or moves
/// an entry to a new pid, so at most one entry per name is ever restarting.
class RuntimeTable {
public:
    /// Rebuild from a discovery pass. Call without holding any name lock.
    void reconcile(const std::vector<ServiceRecord>& live, const ConfigurationSnapshot& snapshot);

    /// As above, for a pass discovered at `discovered_at` (see generation()).
    /// Entries moved to a new pid after that point are kept even though the
    /// pass could not see the new process.
    void reconcile(const std::vector<ServiceRecord>& live, const ConfigurationSnapshot& snapshot,
                   uint64_t discovered_at);

    /// Bumped by every rekey; read it before discovering
    uint64_t generation() const;

    RuntimeStateMap snapshot() const;
    std::optional<RestartRuntimeState> find(pid_t pid) const;

    /// Entry for a name; a restarting entry wins over an idle one
    std::optional<RestartRuntimeState> find_by_name(const std::string& name) const;

    bool is_restarting(const std::string& name) const;

    /// Idle -> Stopping. Creates the entry when the pid has none (manual
    /// restart of an unmanaged service). False if the name is already
    /// restarting or an operator stop of it is in flight.
    bool begin_restart(const RestartTrigger& trigger, const AutoRestartPolicy& policy);

    /// Mark an operator stop of name as in flight. False while a restart
    /// cycle holds the name. Every successful call needs end_manual_stop.
    bool begin_manual_stop(const std::string& name);
    void end_manual_stop(const std::string& name);

    void set_phase(const std::string& name, RestartPhase phase,
                   std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    /// Relaunching -> Idle: move the restarting entry for name to new_pid
    void rekey(const std::string& name, pid_t new_pid);

    /// Cycle ended without a new process. With old_pid_gone the entry is
    /// dropped and its pid retired; otherwise it just returns to Idle.
    void abort_restart(const std::string& name, bool old_pid_gone);

    /// Push a changed policy into every entry carrying that name
    void update_policy(const AutoRestartPolicy& policy);

    /// Drop an idle entry. Entries owned by a restart cycle are kept.
    bool erase(pid_t pid);

private:
    mutable std::mutex mutex_;
    RuntimeStateMap states_;
    // pids a cycle has moved away from; never re-attached while still listed
    std::set<pid_t> retired_;
    // new pid -> generation of the rekey that created it
    std::map<pid_t, uint64_t> rekeyed_;
    uint64_t generation_ = 0;
    std::map<std::string, int, CaseInsensitiveLess> manual_stops_;

    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>, CaseInsensitiveLess> name_locks_;

    std::mutex& name_lock(const std::string& name);
    RuntimeStateMap::iterator restarting_entry(const std::string& name);
};

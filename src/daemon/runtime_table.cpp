#include "daemon/runtime_table.hpp"
#include "core/identity.hpp"
#include "core/policy_store.hpp"

#include <spdlog/spdlog.h>

std::mutex& RuntimeTable::name_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = name_locks_[name];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

RuntimeStateMap::iterator RuntimeTable::restarting_entry(const std::string& name) {
    for (auto it = states_.begin(); it != states_.end(); ++it) {
        if (it->second.restarting && Identity::same_name(it->second.logical_name, name)) {
            return it;
        }
    }
    return states_.end();
}

void RuntimeTable::reconcile(const std::vector<ServiceRecord>& live,
                             const ConfigurationSnapshot& snapshot) {
    reconcile(live, snapshot, generation());
}

void RuntimeTable::reconcile(const std::vector<ServiceRecord>& live,
                             const ConfigurationSnapshot& snapshot, uint64_t discovered_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<pid_t> live_pids;
    std::vector<ServiceRecord> attachable;
    for (const auto& rec : live) {
        live_pids.insert(rec.pid);
        if (!retired_.count(rec.pid)) attachable.push_back(rec);
    }
    // a retired pid that vanished from discovery may be reused later
    for (auto it = retired_.begin(); it != retired_.end();) {
        it = live_pids.count(*it) ? std::next(it) : retired_.erase(it);
    }

    RuntimeStateMap next = PolicyStore::reconcile(attachable, snapshot, states_);

    // Relaunched after this pass discovered: it has not seen the new pid yet
    for (auto it = rekeyed_.begin(); it != rekeyed_.end();) {
        if (live_pids.count(it->first) || it->second <= discovered_at) {
            it = rekeyed_.erase(it);
            continue;
        }
        auto state = states_.find(it->first);
        if (state != states_.end() && !next.count(it->first)) {
            next.emplace(it->first, state->second);
        }
        ++it;
    }

    states_ = std::move(next);
}

uint64_t RuntimeTable::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

RuntimeStateMap RuntimeTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

std::optional<RestartRuntimeState> RuntimeTable::find(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(pid);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

std::optional<RestartRuntimeState> RuntimeTable::find_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<RestartRuntimeState> found;
    for (const auto& [pid, state] : states_) {
        if (!Identity::same_name(state.logical_name, name)) continue;
        if (state.restarting) return state;
        if (!found) found = state;
    }
    return found;
}

bool RuntimeTable::is_restarting(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [pid, state] : states_) {
        if (state.restarting && Identity::same_name(state.logical_name, name)) return true;
    }
    return false;
}

bool RuntimeTable::begin_restart(const RestartTrigger& trigger, const AutoRestartPolicy& policy) {
    std::lock_guard<std::mutex> name_guard(name_lock(trigger.logical_name));
    std::lock_guard<std::mutex> lock(mutex_);

    if (restarting_entry(trigger.logical_name) != states_.end() ||
        manual_stops_.count(trigger.logical_name)) {
        return false;
    }

    auto& state = states_[trigger.pid];
    if (state.pid != trigger.pid) {
        state.pid = trigger.pid;
        state.logical_name = trigger.logical_name;
        state.policy = policy;
    }
    state.artifact_path = trigger.artifact_path;
    state.working_directory = trigger.working_directory;
    state.restarting = true;
    state.phase = RestartPhase::Stopping;
    state.restart_deadline.reset();
    return true;
}

void RuntimeTable::set_phase(const std::string& name, RestartPhase phase,
                             std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::lock_guard<std::mutex> name_guard(name_lock(name));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = restarting_entry(name);
    if (it == states_.end()) return;
    it->second.phase = phase;
    if (deadline) it->second.restart_deadline = deadline;
}

void RuntimeTable::rekey(const std::string& name, pid_t new_pid) {
    std::lock_guard<std::mutex> name_guard(name_lock(name));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = restarting_entry(name);
    if (it == states_.end()) return;

    RestartRuntimeState state = std::move(it->second);
    pid_t old_pid = it->first;
    states_.erase(it);
    retired_.insert(old_pid);

    state.pid = new_pid;
    state.restarting = false;
    state.phase = RestartPhase::Idle;
    state.restart_deadline.reset();
    states_[new_pid] = std::move(state);
    rekeyed_[new_pid] = ++generation_;
    spdlog::debug("Runtime state for {} moved from pid {} to {}", name, old_pid, new_pid);
}

void RuntimeTable::abort_restart(const std::string& name, bool old_pid_gone) {
    std::lock_guard<std::mutex> name_guard(name_lock(name));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = restarting_entry(name);
    if (it == states_.end()) return;
    if (old_pid_gone) {
        retired_.insert(it->first);
        states_.erase(it);
        return;
    }
    it->second.restarting = false;
    it->second.phase = RestartPhase::Idle;
    it->second.restart_deadline.reset();
}

void RuntimeTable::update_policy(const AutoRestartPolicy& policy) {
    std::lock_guard<std::mutex> name_guard(name_lock(policy.logical_name));
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [pid, state] : states_) {
        if (Identity::same_name(state.logical_name, policy.logical_name)) {
            state.policy = policy;
        }
    }
}

bool RuntimeTable::begin_manual_stop(const std::string& name) {
    std::lock_guard<std::mutex> name_guard(name_lock(name));
    std::lock_guard<std::mutex> lock(mutex_);
    if (restarting_entry(name) != states_.end()) return false;
    ++manual_stops_[name];
    return true;
}

void RuntimeTable::end_manual_stop(const std::string& name) {
    std::lock_guard<std::mutex> name_guard(name_lock(name));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = manual_stops_.find(name);
    if (it == manual_stops_.end()) return;
    if (--it->second == 0) manual_stops_.erase(it);
}

bool RuntimeTable::erase(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(pid);
    if (it == states_.end()) return false;
    if (it->second.restarting) return false;
    states_.erase(it);
    rekeyed_.erase(pid);
    return true;
}

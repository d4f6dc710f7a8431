#include "daemon/threshold_monitor.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <set>
#include <string>

bool ThresholdMonitor::breached(const ServiceRecord& record,
                                const AutoRestartPolicy& policy,
                                QueueProbe& probe,
                                RestartTrigger& trigger) {
    BreachReason reason = BreachReason::None;
    std::string detail;
    auto append = [&detail](const std::string& part) {
        if (!detail.empty()) detail += ", ";
        detail += part;
    };

    if (record.cpu_percent > policy.cpu_threshold_percent) {
        reason = reason | BreachReason::Cpu;
        append(fmt::format("CPU ({:.1f}% > {:.1f}%)",
                           record.cpu_percent, policy.cpu_threshold_percent));
    }
    if (record.memory_bytes > policy.memory_threshold_bytes) {
        reason = reason | BreachReason::Memory;
        append(fmt::format("Memory ({:.1f} MB > {:.1f} MB)",
                           bytes_to_mb(record.memory_bytes),
                           bytes_to_mb(policy.memory_threshold_bytes)));
    }
    if (policy.queue_threshold_count) {
        auto depth = probe.queue_depth(record.logical_name);
        if (depth && *depth > *policy.queue_threshold_count) {
            reason = reason | BreachReason::Queue;
            append(fmt::format("Queue ({} > {} messages)", *depth, *policy.queue_threshold_count));
        }
    }

    if (reason == BreachReason::None) return false;
    trigger.pid = record.pid;
    trigger.logical_name = record.logical_name;
    trigger.artifact_path = record.artifact_path;
    trigger.working_directory = record.working_directory;
    trigger.reason = reason;
    trigger.detail = detail;
    return true;
}

std::vector<RestartTrigger> ThresholdMonitor::evaluate_once(const std::vector<ServiceRecord>& live,
                                                            const RuntimeStateMap& states,
                                                            QueueProbe& probe) {
    std::vector<RestartTrigger> triggers;

    std::set<std::string, CaseInsensitiveLess> busy;
    for (const auto& [pid, state] : states) {
        if (state.restarting) busy.insert(state.logical_name);
    }

    for (const auto& rec : live) {
        auto it = states.find(rec.pid);
        if (it == states.end()) continue;
        const auto& state = it->second;
        if (!state.policy.enabled || state.restarting || busy.count(rec.logical_name)) continue;

        RestartTrigger trigger;
        if (breached(rec, state.policy, probe, trigger)) {
            spdlog::warn("Service {} ({}) exceeds threshold(s): {}",
                         rec.pid, rec.logical_name, trigger.detail);
            triggers.push_back(std::move(trigger));
        }
    }
    return triggers;
}

#pragma once

#include "core/service_types.hpp"
#include "daemon/queue_probe.hpp"

#include <vector>

class ThresholdMonitor {
public:
    /// One evaluation pass. For every live record attached to an enabled,
    /// non-restarting runtime state, a breach is any of
    ///   cpu > cpu threshold, memory > memory threshold,
    ///   queue depth > queue threshold (only when set and the probe answers).
    /// Read-only: emits triggers, mutates nothing.
    static std::vector<RestartTrigger> evaluate_once(const std::vector<ServiceRecord>& live,
                                                     const RuntimeStateMap& states,
                                                     QueueProbe& probe);

    /// Breach test for a single record; fills trigger.reason / trigger.detail
    static bool breached(const ServiceRecord& record,
                         const AutoRestartPolicy& policy,
                         QueueProbe& probe,
                         RestartTrigger& trigger);
};

#pragma once

#include "core/artifact_catalog.hpp"
#include "core/service_types.hpp"
#include "daemon/supervisor.hpp"

#include <nlohmann/json.hpp>
#include <string>

/// JSON shapes shared by the HTTP API and its client
class Wire {
public:
    /// One row of GET /api/services
    static nlohmann::json service_summary(const ServiceView& view);

    /// GET /api/service/<pid>: summary plus threads, files, connections, cmdline, user
    static nlohmann::json service_detail(const ServiceView& view);

    static nlohmann::json policy(const AutoRestartPolicy& policy, bool restarting = false);

    /// Fills thresholds from a request body on top of `base`.
    /// Throws std::invalid_argument on a malformed field.
    static AutoRestartPolicy policy_from(const nlohmann::json& body, AutoRestartPolicy base);

    static nlohmann::json artifact(const ArtifactInfo& info);

    static nlohmann::json ok(const std::string& message = "");
    static nlohmann::json error(const std::string& message);

    /// "1 day, 2:03:04" style uptime
    static std::string format_uptime(long long seconds);
    static std::string format_time(std::chrono::system_clock::time_point tp);
    static std::string status_name(char state);

    static double round2(double value);
};

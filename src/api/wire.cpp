#include "api/wire.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;

double Wire::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string Wire::status_name(char state) {
    switch (state) {
        case 'R': return "running";
        case 'S': return "sleeping";
        case 'D': return "disk-sleep";
        case 'T': return "stopped";
        case 't': return "tracing-stop";
        case 'Z': return "zombie";
        case 'X': return "dead";
        case 'I': return "idle";
        default:  return "unknown";
    }
}

std::string Wire::format_uptime(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long days = seconds / 86400;
    seconds %= 86400;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                  seconds / 3600, (seconds % 3600) / 60, seconds % 60);
    if (days == 0) return buf;
    return std::to_string(days) + (days == 1 ? " day, " : " days, ") + buf;
}

std::string Wire::format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ── Services ────────────────────────────────────────────────

json Wire::service_summary(const ServiceView& view) {
    const auto& rec = view.record;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - rec.start_time).count();

    json j = {
        {"pid", rec.pid},
        {"service_name", rec.logical_name},
        {"jar_name", rec.logical_name},
        {"jar_path", rec.artifact_path.empty() ? "Unknown" : rec.artifact_path},
        {"type", artifact_kind_label(rec.artifact_kind)},
        {"status", status_name(rec.state)},
        {"cpu_percent", round2(rec.cpu_percent)},
        {"memory_mb", round2(bytes_to_mb(rec.memory_bytes))},
        {"uptime_seconds", uptime < 0 ? 0 : uptime},
        {"uptime_formatted", format_uptime(uptime)},
        {"start_time", format_time(rec.start_time)},
        {"auto_restart", policy(view.policy, view.restarting)},
        {"restart_phase", restart_phase_name(view.phase)},
    };
    if (!view.last_error.empty()) j["last_error"] = view.last_error;
    return j;
}

json Wire::service_detail(const ServiceView& view) {
    json j = service_summary(view);
    const auto& rec = view.record;
    j["num_threads"] = rec.thread_count;
    j["num_open_files"] = rec.open_file_count;
    j["num_connections"] = rec.connection_count;
    j["cmdline"] = rec.command_line;
    j["working_directory"] = rec.working_directory;
    j["username"] = rec.user.empty() ? "Unknown" : rec.user;
    return j;
}

// ── Policies ────────────────────────────────────────────────

json Wire::policy(const AutoRestartPolicy& p, bool restarting) {
    json j = {
        {"service_name", p.logical_name},
        {"enabled", p.enabled},
        {"cpu_threshold", p.cpu_threshold_percent},
        {"memory_threshold_mb", round2(bytes_to_mb(p.memory_threshold_bytes))},
        {"restarting", restarting},
    };
    if (p.queue_threshold_count) {
        j["queue_threshold"] = *p.queue_threshold_count;
    } else {
        j["queue_threshold"] = nullptr;
    }
    return j;
}

AutoRestartPolicy Wire::policy_from(const json& body, AutoRestartPolicy base) {
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }

    auto number = [&](const char* key) -> std::optional<double> {
        auto it = body.find(key);
        if (it == body.end() || it->is_null()) return std::nullopt;
        if (!it->is_number()) {
            throw std::invalid_argument(std::string(key) + " must be a number");
        }
        return it->get<double>();
    };

    if (auto it = body.find("enabled"); it != body.end()) {
        if (!it->is_boolean()) throw std::invalid_argument("enabled must be true or false");
        base.enabled = it->get<bool>();
    }
    if (auto cpu = number("cpu_threshold")) {
        base.cpu_threshold_percent = *cpu;
    }
    if (auto mem = number("memory_threshold_mb")) {
        if (*mem < 0) throw std::invalid_argument("memory_threshold_mb must not be negative");
        base.memory_threshold_bytes = mb_to_bytes(*mem);
    }
    if (auto it = body.find("queue_threshold"); it != body.end()) {
        if (it->is_null()) {
            base.queue_threshold_count.reset();
        } else if (it->is_number_integer() && it->get<long long>() >= 0) {
            base.queue_threshold_count = it->get<uint64_t>();
        } else {
            throw std::invalid_argument("queue_threshold must be a non-negative integer");
        }
    }
    return base;
}

// ── Artifacts / envelopes ───────────────────────────────────

json Wire::artifact(const ArtifactInfo& info) {
    return {
        {"name", info.name},
        {"path", info.path},
        {"size_mb", info.size_mb},
        {"type", artifact_kind_label(info.kind)},
        {"extension", info.extension},
        {"subfolder", info.subfolder_layout},
    };
}

json Wire::ok(const std::string& message) {
    json j = {{"success", true}};
    if (!message.empty()) j["message"] = message;
    return j;
}

json Wire::error(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

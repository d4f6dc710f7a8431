#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// Kinds of launchable artifacts. Closed set: every switch over it is exhaustive.
enum class ArtifactKind {
    JarLike,
    NativeExecutable,
    BatchScript,
    ShellScript
};

/// Case-insensitive ordering for logical names used as map keys
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

/// One live supervised process, rebuilt on every discovery pass
struct ServiceRecord {
    pid_t pid = -1;
    std::string logical_name;       // "billing"
    std::string artifact_path;      // "/opt/services/billing/billing.jar"
    ArtifactKind artifact_kind = ArtifactKind::JarLike;
    double cpu_percent = 0.0;
    uint64_t memory_bytes = 0;
    std::chrono::system_clock::time_point start_time{};
    int thread_count = 0;
    std::string command_line;
    std::string working_directory;
    char state = '?';               // procfs state letter
    int connection_count = 0;
    int open_file_count = 0;
    std::string user;
};

/// Durable auto-restart policy, keyed by logical name
struct AutoRestartPolicy {
    std::string logical_name;
    bool enabled = false;
    double cpu_threshold_percent = 80.0;
    uint64_t memory_threshold_bytes = 1000ULL * 1024 * 1024;
    std::optional<uint64_t> queue_threshold_count;
};

bool operator==(const AutoRestartPolicy& a, const AutoRestartPolicy& b);

using PolicyMap = std::map<std::string, AutoRestartPolicy, CaseInsensitiveLess>;

/// Whole durable configuration file
struct ConfigurationSnapshot {
    PolicyMap policies;
    std::optional<std::string> folder_path;
};

enum class RestartPhase {
    Idle,
    Stopping,
    Delaying,
    Relaunching
};

/// In-memory view of a policy attached to the current pid of a service
struct RestartRuntimeState {
    pid_t pid = -1;
    std::string logical_name;
    std::string artifact_path;
    std::string working_directory;
    AutoRestartPolicy policy;
    bool restarting = false;
    RestartPhase phase = RestartPhase::Idle;
    std::optional<std::chrono::steady_clock::time_point> restart_deadline;
};

using RuntimeStateMap = std::map<pid_t, RestartRuntimeState>;

/// Which thresholds a breach crossed
enum class BreachReason : unsigned {
    None   = 0,
    Cpu    = 1u << 0,
    Memory = 1u << 1,
    Queue  = 1u << 2,
    Manual = 1u << 3
};

inline BreachReason operator|(BreachReason a, BreachReason b) {
    return static_cast<BreachReason>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

inline bool has_reason(BreachReason set, BreachReason bit) {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(bit)) != 0;
}

/// Emitted by the threshold monitor, consumed by the restart machine
struct RestartTrigger {
    pid_t pid = -1;
    std::string logical_name;
    std::string artifact_path;
    std::string working_directory;
    BreachReason reason = BreachReason::None;
    std::string detail;             // "CPU (95.0% > 80.0%)"
};

const char* artifact_kind_label(ArtifactKind kind);   // "JAR", "EXE", "BAT", "SH"
const char* restart_phase_name(RestartPhase phase);  // "idle", "stopping", ...

constexpr uint64_t kBytesPerMb = 1024ULL * 1024ULL;

inline double bytes_to_mb(uint64_t bytes) {
    return static_cast<double>(bytes) / static_cast<double>(kBytesPerMb);
}

uint64_t mb_to_bytes(double mb);

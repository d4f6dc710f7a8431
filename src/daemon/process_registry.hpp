#pragma once

#include "core/service_types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/// Source of live supervised processes
class ProcessRegistry {
public:
    virtual ~ProcessRegistry() = default;

    /// Snapshot of every live process running a recognized artifact.
    /// Per-process read failures skip that record only.
    virtual std::vector<ServiceRecord> discover() = 0;

    /// Single-pid lookup; nullopt if gone or not a recognized artifact
    virtual std::optional<ServiceRecord> inspect(pid_t pid) = 0;
};

/// Linux implementation reading /proc
class ProcfsRegistry : public ProcessRegistry {
public:
    explicit ProcfsRegistry(std::string proc_root = "/proc");

    std::vector<ServiceRecord> discover() override;
    std::optional<ServiceRecord> inspect(pid_t pid) override;

    struct Classified {
        ArtifactKind kind;
        std::string artifact_path;  // as written on the command line
    };

    /// Decide whether argv launches a recognized artifact.
    /// Looks at every kind; callers filter by platform.
    static std::optional<Classified> classify(const std::vector<std::string>& argv,
                                              const std::string& exe_path);

private:
    std::string proc_root_;
    long clock_ticks_;
    long page_size_;

    struct CpuSample {
        uint64_t ticks = 0;
        std::chrono::steady_clock::time_point taken;
    };
    std::mutex samples_mutex_;
    std::unordered_map<pid_t, CpuSample> samples_;

    /// Throws DiscoveryError when the process cannot be read
    std::optional<ServiceRecord> read_process(pid_t pid,
                                              std::unordered_map<pid_t, CpuSample>& next);

    std::string proc_path(pid_t pid, const char* leaf) const;
    double read_uptime() const;
    long long read_boot_time() const;
};

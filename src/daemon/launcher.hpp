#pragma once

#include "core/service_types.hpp"

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct LaunchRequest {
    std::string artifact_path;
    std::string working_directory;      // empty = default for the layout
    std::vector<std::string> extra_args;
};

/// Start and stop supervised processes. Tests substitute a fake.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    /// Start the artifact detached from the supervisor's session.
    /// Throws LaunchError.
    virtual pid_t launch(const LaunchRequest& request) = 0;

    /// SIGTERM, bounded wait, one SIGKILL, bounded wait.
    /// Returns once the pid is gone; throws StopTimeout otherwise.
    virtual void stop(pid_t pid) = 0;

    virtual bool is_alive(pid_t pid) const = 0;
};

class PosixProcessControl : public ProcessControl {
public:
    struct Options {
        std::string java_binary = "java";
        std::vector<std::string> java_args;
        std::chrono::milliseconds launch_check{1000};
        std::chrono::milliseconds stop_timeout{10000};
        std::chrono::milliseconds kill_timeout{5000};
        std::chrono::milliseconds exec_report_timeout{5000};
    };

    PosixProcessControl();
    explicit PosixProcessControl(Options options);

    pid_t launch(const LaunchRequest& request) override;
    void stop(pid_t pid) override;
    bool is_alive(pid_t pid) const override;

    /// argv for one artifact kind. The only place launch commands are built.
    static std::vector<std::string> build_command(ArtifactKind kind,
                                                  const std::string& artifact_path,
                                                  const std::vector<std::string>& extra_args,
                                                  const Options& options);

    /// Working directory used when the request leaves it empty
    static std::string default_working_directory(const std::string& artifact_path);

private:
    Options options_;

    bool wait_gone(pid_t pid, std::chrono::milliseconds timeout) const;
};

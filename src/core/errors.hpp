#pragma once

#include <stdexcept>
#include <string>
#include <sys/types.h>

class LaunchError : public std::runtime_error {
public:
    enum class Kind { ArtifactNotFound, PermissionDenied, SpawnFailed };

    LaunchError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class ConfigError : public std::runtime_error {
public:
    enum class Kind { Corrupt, WriteFailed };

    ConfigError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

/// Process survived SIGTERM and one SIGKILL within the bounded wait
class StopTimeout : public std::runtime_error {
public:
    explicit StopTimeout(pid_t pid)
        : std::runtime_error("Process " + std::to_string(pid) + " did not exit after SIGKILL"),
          pid_(pid) {}

    pid_t pid() const { return pid_; }

private:
    pid_t pid_;
};

/// Per-record read failure during discovery. Never escapes the registry.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* launch_error_kind_name(LaunchError::Kind kind);

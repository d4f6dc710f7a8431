#pragma once

#include "core/service_types.hpp"

#include <mutex>
#include <string>
#include <vector>

/// Durable name-keyed auto-restart policies plus the artifact folder path.
///
/// File format (JSON):
///   { "auto_restart": { "<name>": { "enabled": true, "cpu_threshold": 80.0,
///                                   "memory_threshold_mb": 1000.0,
///                                   "jar_name": "<name>",
///                                   "queue_threshold": 1000 } },
///     "folder_path": "/opt/services" }
class PolicyStore {
public:
    explicit PolicyStore(std::string path);

    const std::string& path() const { return path_; }

    /// Read the file. Missing file -> empty snapshot.
    /// Throws ConfigError{Corrupt} when the file exists but cannot be parsed.
    ConfigurationSnapshot load() const;

    /// load(), but a corrupt file is logged and replaced by an empty snapshot
    ConfigurationSnapshot load_or_empty() const;

    /// Atomically replace the file (write temp + rename).
    /// Throws ConfigError{WriteFailed}.
    void save(const ConfigurationSnapshot& snapshot);

    /// Merge live records with the snapshot: every live record whose logical
    /// name has an enabled policy gets an entry (existing entries keep their
    /// restart bookkeeping). Entries whose pid vanished are dropped unless a
    /// restart cycle still owns them.
    static RuntimeStateMap reconcile(const std::vector<ServiceRecord>& live,
                                     const ConfigurationSnapshot& snapshot,
                                     const RuntimeStateMap& existing = {});

    static std::string serialize(const ConfigurationSnapshot& snapshot);
    static ConfigurationSnapshot parse(const std::string& text);

private:
    std::string path_;
    std::mutex write_mutex_;
};

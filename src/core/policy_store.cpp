#include "core/policy_store.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

PolicyStore::PolicyStore(std::string path) : path_(std::move(path)) {}

// ── Serialization ───────────────────────────────────────────

std::string PolicyStore::serialize(const ConfigurationSnapshot& snapshot) {
    json root;
    root["auto_restart"] = json::object();
    for (const auto& [name, policy] : snapshot.policies) {
        json entry;
        entry["enabled"] = policy.enabled;
        entry["cpu_threshold"] = policy.cpu_threshold_percent;
        entry["memory_threshold_mb"] = bytes_to_mb(policy.memory_threshold_bytes);
        entry["jar_name"] = policy.logical_name.empty() ? name : policy.logical_name;
        if (policy.queue_threshold_count) {
            entry["queue_threshold"] = *policy.queue_threshold_count;
        }
        root["auto_restart"][name] = entry;
    }
    if (snapshot.folder_path) {
        root["folder_path"] = *snapshot.folder_path;
    } else {
        root["folder_path"] = nullptr;
    }
    return root.dump(2);
}

ConfigurationSnapshot PolicyStore::parse(const std::string& text) {
    ConfigurationSnapshot snapshot;
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(ConfigError::Kind::Corrupt, e.what());
    }
    if (!root.is_object()) {
        throw ConfigError(ConfigError::Kind::Corrupt, "top-level value is not an object");
    }

    try {
        if (root.contains("auto_restart") && root["auto_restart"].is_object()) {
            for (const auto& [name, entry] : root["auto_restart"].items()) {
                if (!entry.is_object()) {
                    throw ConfigError(ConfigError::Kind::Corrupt,
                                      "auto_restart entry '" + name + "' is not an object");
                }
                AutoRestartPolicy policy;
                policy.logical_name = entry.value("jar_name", name);
                if (policy.logical_name.empty()) policy.logical_name = name;
                policy.enabled = entry.value("enabled", false);
                policy.cpu_threshold_percent = entry.value("cpu_threshold", 80.0);
                policy.memory_threshold_bytes = mb_to_bytes(entry.value("memory_threshold_mb", 1000.0));
                if (entry.contains("queue_threshold") && !entry["queue_threshold"].is_null()) {
                    policy.queue_threshold_count = entry["queue_threshold"].get<uint64_t>();
                }
                // first spelling wins on case-insensitive duplicates
                snapshot.policies.emplace(name, std::move(policy));
            }
        }
        if (root.contains("folder_path") && root["folder_path"].is_string()) {
            snapshot.folder_path = root["folder_path"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigError(ConfigError::Kind::Corrupt, e.what());
    }
    return snapshot;
}

// ── File I/O ────────────────────────────────────────────────

ConfigurationSnapshot PolicyStore::load() const {
    if (path_.empty() || !fs::exists(path_)) {
        return {};
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw ConfigError(ConfigError::Kind::Corrupt, "cannot open " + path_);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

ConfigurationSnapshot PolicyStore::load_or_empty() const {
    try {
        auto snapshot = load();
        spdlog::info("Loaded {} auto-restart policies from {}", snapshot.policies.size(), path_);
        return snapshot;
    } catch (const ConfigError& e) {
        spdlog::warn("Policy file {} is corrupt ({}); starting with an empty configuration",
                     path_, e.what());
        return {};
    }
}

void PolicyStore::save(const ConfigurationSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::string text = serialize(snapshot);
    std::string tmp = path_ + ".tmp";
    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        // Atomic write: write to temp file, then rename
        std::ofstream fout(tmp, std::ios::trunc);
        if (!fout.is_open()) {
            throw ConfigError(ConfigError::Kind::WriteFailed, "cannot open " + tmp);
        }
        fout << text;
        fout.close();
        if (fout.fail()) {
            throw ConfigError(ConfigError::Kind::WriteFailed, "short write to " + tmp);
        }
        fs::rename(tmp, path_);
    } catch (const ConfigError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw ConfigError(ConfigError::Kind::WriteFailed, e.what());
    }
    spdlog::debug("Configuration saved to {}", path_);
}

// ── Reconciliation ──────────────────────────────────────────

RuntimeStateMap PolicyStore::reconcile(const std::vector<ServiceRecord>& live,
                                       const ConfigurationSnapshot& snapshot,
                                       const RuntimeStateMap& existing) {
    RuntimeStateMap result;

    // Cycles in flight own their entry even though the old pid is gone
    for (const auto& [pid, state] : existing) {
        if (state.restarting) {
            result.emplace(pid, state);
        }
    }

    for (const auto& rec : live) {
        auto it = snapshot.policies.find(rec.logical_name);
        if (it == snapshot.policies.end() || !it->second.enabled) {
            continue;
        }

        auto prev = existing.find(rec.pid);
        RestartRuntimeState state;
        if (prev != existing.end()) {
            state = prev->second;
        } else {
            state.pid = rec.pid;
            state.logical_name = rec.logical_name;
        }
        state.artifact_path = rec.artifact_path;
        state.working_directory = rec.working_directory;
        state.policy = it->second;
        result[rec.pid] = std::move(state);
    }
    return result;
}

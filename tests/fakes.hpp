#pragma once

#include "core/errors.hpp"
#include "core/identity.hpp"
#include "daemon/launcher.hpp"
#include "daemon/process_registry.hpp"
#include "daemon/queue_probe.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

/// Poll pred every 2 ms until it holds or timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

inline ServiceRecord make_record(pid_t pid, const std::string& artifact_path,
                                 double cpu = 5.0, double mem_mb = 200.0) {
    ServiceRecord rec;
    rec.pid = pid;
    rec.artifact_path = artifact_path;
    rec.logical_name = Identity::logical_name(artifact_path);
    rec.artifact_kind = Identity::kind_from_extension(artifact_path).value_or(ArtifactKind::JarLike);
    rec.cpu_percent = cpu;
    rec.memory_bytes = mb_to_bytes(mem_mb);
    rec.start_time = std::chrono::system_clock::now() - std::chrono::minutes(5);
    rec.thread_count = 12;
    rec.command_line = "java -jar " + artifact_path;
    rec.working_directory = "/srv";
    rec.state = 'S';
    rec.user = "svc";
    return rec;
}

class FakeRegistry : public ProcessRegistry {
public:
    std::vector<ServiceRecord> discover() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++discover_calls_;
        return records_;
    }

    std::optional<ServiceRecord> inspect(pid_t pid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& r : records_) {
            if (r.pid == pid) return r;
        }
        return std::nullopt;
    }

    void set(std::vector<ServiceRecord> records) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_ = std::move(records);
    }

    void add(const ServiceRecord& rec) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(rec);
    }

    void remove(pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [pid](const ServiceRecord& r) { return r.pid == pid; }),
                       records_.end());
    }

    int discover_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return discover_calls_;
    }

private:
    std::mutex mutex_;
    std::vector<ServiceRecord> records_;
    int discover_calls_ = 0;
};

/// Scripted ProcessControl. Optionally removes stopped pids from a registry
/// and adds launched ones, so the supervisor sees a consistent world.
class FakeControl : public ProcessControl {
public:
    explicit FakeControl(FakeRegistry* registry = nullptr) : registry_(registry) {}

    pid_t launch(const LaunchRequest& request) override {
        std::unique_lock<std::mutex> lock(mutex_);
        launches_.push_back(request);
        if (launch_error_) {
            throw LaunchError(*launch_error_, "scripted launch failure: " + request.artifact_path);
        }
        pid_t pid = next_pid_++;
        alive_.insert(pid);
        lock.unlock();
        if (registry_) {
            auto rec = make_record(pid, request.artifact_path);
            if (!request.working_directory.empty()) rec.working_directory = request.working_directory;
            registry_->add(rec);
        }
        return pid;
    }

    void stop(pid_t pid) override {
        std::unique_lock<std::mutex> lock(mutex_);
        stops_.push_back(pid);
        cv_.wait(lock, [this] { return !hold_stop_; });
        if (stop_timeout_) throw StopTimeout(pid);
        alive_.erase(pid);
        lock.unlock();
        if (registry_) registry_->remove(pid);
    }

    bool is_alive(pid_t pid) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return alive_.count(pid) > 0;
    }

    void fail_launch(LaunchError::Kind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        launch_error_ = kind;
    }

    void fail_stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_timeout_ = true;
    }

    /// Block every stop() until release_stop()
    void hold_stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_stop_ = true;
    }

    void release_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_stop_ = false;
        }
        cv_.notify_all();
    }

    void set_next_pid(pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        next_pid_ = pid;
    }

    std::vector<LaunchRequest> launches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launches_;
    }

    std::vector<pid_t> stops() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stops_;
    }

private:
    FakeRegistry* registry_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<LaunchRequest> launches_;
    std::vector<pid_t> stops_;
    std::set<pid_t> alive_;
    std::optional<LaunchError::Kind> launch_error_;
    bool stop_timeout_ = false;
    bool hold_stop_ = false;
    pid_t next_pid_ = 5000;
};

class FakeQueueProbe : public QueueProbe {
public:
    std::optional<uint64_t> queue_depth(const std::string& logical_name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++queries_;
        auto it = depths_.find(logical_name);
        if (it == depths_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& name, uint64_t depth) {
        std::lock_guard<std::mutex> lock(mutex_);
        depths_[name] = depth;
    }

    int queries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, uint64_t, CaseInsensitiveLess> depths_;
    int queries_ = 0;
};

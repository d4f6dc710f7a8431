#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // HTTP API
    std::string api_host = "127.0.0.1";
    int api_port = 5001;
    int api_timeout_ms = 5000;

    // Monitor loop and restart cycle
    int check_interval_sec = 30;
    int error_retry_interval_sec = 60;
    int restart_delay_sec = 120;
    int queue_restart_delay_sec = 60;
    int stop_timeout_sec = 10;
    int kill_timeout_sec = 5;
    int launch_check_ms = 1000;

    // Durable auto-restart policies (JSON)
    std::string store_path;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Launch
    std::string java_binary = "java";
    std::vector<std::string> java_args;
};

/// Validation limits for operator-supplied thresholds
struct PolicyLimits {
    static constexpr double cpu_min = 1.0;
    static constexpr double cpu_max = 100.0;
    static constexpr double memory_min_mb = 1.0;
    static constexpr double memory_max_mb = 10240.0;
    static constexpr unsigned long long queue_min = 1;
    static constexpr unsigned long long queue_max = 1000000;

    static constexpr double default_cpu = 80.0;
    static constexpr double default_memory_mb = 1000.0;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_store_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};

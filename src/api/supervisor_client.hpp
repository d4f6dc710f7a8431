#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

struct ApiResponse {
    bool success = false;
    int status = 0;                 // 0 = daemon unreachable
    std::string error;
    nlohmann::json body;
};

/// Client for the daemon's HTTP API, used by the CLI subcommands
class SupervisorClient {
public:
    SupervisorClient(const std::string& host, int port, int timeout_ms = 5000);
    ~SupervisorClient();

    bool test_connection();

    ApiResponse list_services();
    ApiResponse get_service(pid_t pid);
    ApiResponse stop_service(pid_t pid);
    ApiResponse restart_service(pid_t pid, const std::string& jar_name = "");
    ApiResponse start_service(const std::string& artifact_path,
                              const std::string& working_directory = "",
                              const std::vector<std::string>& args = {});

    ApiResponse get_auto_restart(const std::string& name_or_pid);

    /// body: {"enabled", "cpu_threshold", "memory_threshold_mb", "queue_threshold"}
    ApiResponse set_auto_restart(const std::string& name, const nlohmann::json& body);
    ApiResponse delete_auto_restart(const std::string& name);

    ApiResponse set_folder(const std::string& folder_path);
    ApiResponse list_artifacts(const std::string& folder_path = "");

    /// Percent-encode one path segment
    static std::string encode_segment(const std::string& s);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

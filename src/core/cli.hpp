#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

class SupervisorClient;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for "daemon" (caller runs the daemon).
    static int run(int argc, char* argv[]);

    /// Flags of "auto-restart set". Unset fields keep the stored value.
    struct PolicyFlags {
        bool disable = false;
        bool has_cpu = false;
        double cpu = 0.0;
        bool has_mem = false;
        double mem_mb = 0.0;
        bool has_queue = false;
        long long queue = 0;
        std::string error;
    };

    static PolicyFlags parse_policy_flags(const std::vector<std::string>& args);

    /// Request body for POST /api/auto-restart/<name>
    static nlohmann::json policy_body(const PolicyFlags& flags);

    /// Strict decimal pid within pid_t range; -1 if not one
    static long parse_pid(const std::string& s);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_list(SupervisorClient& client);
    static int cmd_show(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_stop(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_start(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_restart(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_auto_restart(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_folder(SupervisorClient& client, int argc, char* argv[]);
    static int cmd_artifacts(SupervisorClient& client, int argc, char* argv[]);

    static void print_policy(const nlohmann::json& config);
};

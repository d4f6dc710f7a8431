#include "core/cli.hpp"
#include "core/identity.hpp"
#include "core/config.hpp"
#include "api/supervisor_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

int fail(const ApiResponse& res) {
    std::cerr << "Error: " << res.error << "\n";
    return 1;
}

int usage(const char* text) {
    std::cerr << "Usage: svcguard " << text << "\n";
    return 1;
}

std::string str_or(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

}  // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return cmd_help();

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }

    Config config;
    config.load();
    const auto& d = config.data();
    SupervisorClient client(d.api_host, d.api_port, d.api_timeout_ms);

    if (std::strcmp(cmd, "list") == 0) return cmd_list(client);
    if (std::strcmp(cmd, "show") == 0) return cmd_show(client, argc, argv);
    if (std::strcmp(cmd, "stop") == 0) return cmd_stop(client, argc, argv);
    if (std::strcmp(cmd, "start") == 0) return cmd_start(client, argc, argv);
    if (std::strcmp(cmd, "restart") == 0) return cmd_restart(client, argc, argv);
    if (std::strcmp(cmd, "auto-restart") == 0) return cmd_auto_restart(client, argc, argv);
    if (std::strcmp(cmd, "folder") == 0) return cmd_folder(client, argc, argv);
    if (std::strcmp(cmd, "artifacts") == 0) return cmd_artifacts(client, argc, argv);

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'svcguard help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "svcguard - process supervisor with threshold-driven auto-restart\n"
        "\n"
        "Usage:\n"
        "  svcguard daemon                       Run supervisor and HTTP API\n"
        "  svcguard list                         List supervised services\n"
        "  svcguard show <pid>                   Show one service in detail\n"
        "  svcguard stop <pid>                   Stop a service (cancels a pending relaunch)\n"
        "  svcguard start <path> [workdir] [-- args...]  Launch an artifact detached\n"
        "  svcguard restart <pid> [artifact]     Restart through the normal delay\n"
        "  svcguard auto-restart get <name|pid>  Show the auto-restart policy\n"
        "  svcguard auto-restart set <name> [--cpu N] [--mem MB] [--queue N] [--disable]\n"
        "                                        Enable (or disable) auto-restart\n"
        "  svcguard auto-restart rm <name>       Forget the stored policy\n"
        "  svcguard folder set <path>            Set the artifact folder\n"
        "  svcguard artifacts [folder]           List launchable artifacts\n"
        "  svcguard version                      Show version\n"
        "  svcguard help                         Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "svcguard " << APP_VERSION << "\n";
    return 0;
}

// ── Argument helpers ────────────────────────────────────────

long CLI::parse_pid(const std::string& s) {
    auto pid = Identity::parse_pid(s);
    return pid ? *pid : -1;
}

CLI::PolicyFlags CLI::parse_policy_flags(const std::vector<std::string>& args) {
    PolicyFlags flags;

    auto number = [&](size_t& i, const std::string& name, double& out) -> bool {
        if (i + 1 >= args.size()) {
            flags.error = name + " needs a value";
            return false;
        }
        const std::string& text = args[++i];
        char* end = nullptr;
        errno = 0;
        out = std::strtod(text.c_str(), &end);
        if (errno != 0 || end == text.c_str() || *end != '\0') {
            flags.error = "Invalid value for " + name + ": " + text;
            return false;
        }
        return true;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--disable") {
            flags.disable = true;
        } else if (a == "--cpu") {
            if (!number(i, a, flags.cpu)) return flags;
            flags.has_cpu = true;
        } else if (a == "--mem") {
            if (!number(i, a, flags.mem_mb)) return flags;
            flags.has_mem = true;
        } else if (a == "--queue") {
            double q = 0.0;
            if (!number(i, a, q)) return flags;
            if (q < 0 || q != static_cast<double>(static_cast<long long>(q))) {
                flags.error = "Invalid value for --queue: " + args[i];
                return flags;
            }
            flags.queue = static_cast<long long>(q);
            flags.has_queue = true;
        } else {
            flags.error = "Unknown option: " + a;
            return flags;
        }
    }
    return flags;
}

json CLI::policy_body(const PolicyFlags& flags) {
    json body;
    body["enabled"] = !flags.disable;
    if (flags.has_cpu) body["cpu_threshold"] = flags.cpu;
    if (flags.has_mem) body["memory_threshold_mb"] = flags.mem_mb;
    if (flags.has_queue) body["queue_threshold"] = flags.queue;
    return body;
}

void CLI::print_policy(const json& config) {
    std::cout << "Service:   " << str_or(config, "service_name") << "\n";
    std::cout << "Enabled:   " << (config.value("enabled", false) ? "yes" : "no") << "\n";
    std::cout << fmt::format("CPU:       > {:.1f}%\n", config.value("cpu_threshold", 0.0));
    std::cout << fmt::format("Memory:    > {:.1f} MB\n", config.value("memory_threshold_mb", 0.0));
    auto q = config.find("queue_threshold");
    if (q != config.end() && q->is_number()) {
        std::cout << "Queue:     > " << q->get<long long>() << " messages\n";
    } else {
        std::cout << "Queue:     off\n";
    }
    if (config.value("restarting", false)) {
        std::cout << "Restart:   in progress\n";
    }
}

// ── list / show ─────────────────────────────────────────────

int CLI::cmd_list(SupervisorClient& client) {
    auto res = client.list_services();
    if (!res.success) return fail(res);

    const auto& services = res.body["services"];
    if (services.empty()) {
        std::cout << "No supervised services running.\n";
        return 0;
    }

    std::cout << fmt::format("{:>7}  {:<24} {:<4} {:>7} {:>10}  {:<14} {}\n",
                             "PID", "NAME", "TYPE", "CPU%", "MEM(MB)", "UPTIME", "AUTO-RESTART");
    for (const auto& s : services) {
        const auto& ar = s["auto_restart"];
        std::string auto_col = "off";
        if (ar.value("restarting", false)) {
            auto_col = "restarting (" + str_or(s, "restart_phase") + ")";
        } else if (ar.value("enabled", false)) {
            auto_col = fmt::format("on (cpu>{:.0f}% mem>{:.0f}MB)",
                                   ar.value("cpu_threshold", 0.0),
                                   ar.value("memory_threshold_mb", 0.0));
        }
        std::cout << fmt::format("{:>7}  {:<24} {:<4} {:>7.1f} {:>10.1f}  {:<14} {}\n",
                                 s.value("pid", 0), str_or(s, "service_name"), str_or(s, "type"),
                                 s.value("cpu_percent", 0.0), s.value("memory_mb", 0.0),
                                 str_or(s, "uptime_formatted"), auto_col);
    }
    return 0;
}

int CLI::cmd_show(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 3) return usage("show <pid>");
    long pid = parse_pid(argv[2]);
    if (pid < 0) {
        std::cerr << "Invalid pid: " << argv[2] << "\n";
        return 1;
    }

    auto res = client.get_service(static_cast<pid_t>(pid));
    if (!res.success) return fail(res);

    const auto& s = res.body["service"];
    std::cout << "PID:         " << s.value("pid", 0) << "\n";
    std::cout << "Name:        " << str_or(s, "service_name") << "\n";
    std::cout << "Artifact:    " << str_or(s, "jar_path") << " (" << str_or(s, "type") << ")\n";
    std::cout << "Status:      " << str_or(s, "status") << "\n";
    std::cout << fmt::format("CPU:         {:.2f}%\n", s.value("cpu_percent", 0.0));
    std::cout << fmt::format("Memory:      {:.2f} MB\n", s.value("memory_mb", 0.0));
    std::cout << "Started:     " << str_or(s, "start_time")
              << " (up " << str_or(s, "uptime_formatted") << ")\n";
    std::cout << "Threads:     " << s.value("num_threads", 0) << "\n";
    std::cout << "Open files:  " << s.value("num_open_files", 0) << "\n";
    std::cout << "Connections: " << s.value("num_connections", 0) << "\n";
    std::cout << "User:        " << str_or(s, "username") << "\n";
    std::cout << "Workdir:     " << str_or(s, "working_directory") << "\n";
    std::cout << "Command:     " << str_or(s, "cmdline") << "\n";
    std::string last_error = str_or(s, "last_error");
    if (!last_error.empty()) {
        std::cout << "Last error:  " << last_error << "\n";
    }
    std::cout << "\n";
    print_policy(s["auto_restart"]);
    return 0;
}

// ── stop / start / restart ──────────────────────────────────

int CLI::cmd_stop(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 3) return usage("stop <pid>");
    long pid = parse_pid(argv[2]);
    if (pid < 0) {
        std::cerr << "Invalid pid: " << argv[2] << "\n";
        return 1;
    }
    auto res = client.stop_service(static_cast<pid_t>(pid));
    if (!res.success) return fail(res);
    std::cout << str_or(res.body, "message", "Stopped") << "\n";
    return 0;
}

int CLI::cmd_start(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 3) return usage("start <path> [workdir] [-- args...]");

    std::string path = argv[2];
    std::string workdir;
    std::vector<std::string> args;
    int i = 3;
    if (i < argc && std::strcmp(argv[i], "--") != 0) {
        workdir = argv[i++];
    }
    if (i < argc && std::strcmp(argv[i], "--") == 0) {
        for (++i; i < argc; ++i) args.emplace_back(argv[i]);
    }
    if (i < argc) return usage("start <path> [workdir] [-- args...]");

    auto res = client.start_service(path, workdir, args);
    if (!res.success) return fail(res);
    std::cout << "Started " << path << " (pid " << res.body.value("pid", 0) << ")\n";
    return 0;
}

int CLI::cmd_restart(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 3) return usage("restart <pid> [artifact]");
    long pid = parse_pid(argv[2]);
    if (pid < 0) {
        std::cerr << "Invalid pid: " << argv[2] << "\n";
        return 1;
    }
    std::string artifact = argc > 3 ? argv[3] : "";
    auto res = client.restart_service(static_cast<pid_t>(pid), artifact);
    if (!res.success) return fail(res);
    std::cout << str_or(res.body, "message", "Restart scheduled") << "\n";
    return 0;
}

// ── auto-restart ────────────────────────────────────────────

int CLI::cmd_auto_restart(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 4) {
        return usage("auto-restart <get|set|rm> <name> [--cpu N] [--mem MB] [--queue N] [--disable]");
    }

    std::string sub = argv[2];
    std::string name = argv[3];

    if (sub == "get") {
        auto res = client.get_auto_restart(name);
        if (!res.success) return fail(res);
        print_policy(res.body["config"]);
        return 0;
    }

    if (sub == "set") {
        std::vector<std::string> rest(argv + 4, argv + argc);
        auto flags = parse_policy_flags(rest);
        if (!flags.error.empty()) {
            std::cerr << flags.error << "\n";
            return 1;
        }
        auto res = client.set_auto_restart(name, policy_body(flags));
        if (!res.success) return fail(res);
        std::cout << str_or(res.body, "message", "Saved") << "\n";
        if (res.body.contains("config")) print_policy(res.body["config"]);
        return 0;
    }

    if (sub == "rm") {
        auto res = client.delete_auto_restart(name);
        if (!res.success) return fail(res);
        std::cout << str_or(res.body, "message", "Removed") << "\n";
        return 0;
    }

    std::cerr << "Unknown auto-restart subcommand: " << sub << "\n";
    return 1;
}

// ── folder / artifacts ──────────────────────────────────────

int CLI::cmd_folder(SupervisorClient& client, int argc, char* argv[]) {
    if (argc < 4 || std::strcmp(argv[2], "set") != 0) return usage("folder set <path>");
    auto res = client.set_folder(argv[3]);
    if (!res.success) return fail(res);
    std::cout << "Artifact folder: " << argv[3] << "\n";
    return 0;
}

int CLI::cmd_artifacts(SupervisorClient& client, int argc, char* argv[]) {
    std::string folder = argc > 2 ? argv[2] : "";
    auto res = client.list_artifacts(folder);
    if (!res.success) return fail(res);

    const auto& items = res.body["artifacts"];
    std::cout << "Folder: " << str_or(res.body, "folder_path") << "\n";
    if (items.empty()) {
        std::cout << "No launchable artifacts found.\n";
        return 0;
    }
    for (const auto& a : items) {
        std::cout << fmt::format("  {:<4} {:>9.2f} MB  {}{}\n",
                                 str_or(a, "type"), a.value("size_mb", 0.0), str_or(a, "path"),
                                 a.value("subfolder", false) ? "" : "  (flat)");
    }
    return 0;
}

#include "daemon/launcher.hpp"
#include "core/errors.hpp"
#include "core/identity.hpp"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

const char* launch_error_kind_name(LaunchError::Kind kind) {
    switch (kind) {
        case LaunchError::Kind::ArtifactNotFound: return "ArtifactNotFound";
        case LaunchError::Kind::PermissionDenied: return "PermissionDenied";
        case LaunchError::Kind::SpawnFailed:      return "SpawnFailed";
    }
    return "?";
}

namespace {

// What the detached grandchild reports when it cannot exec
struct ExecReport {
    int stage;  // 1 = fork, 2 = chdir, 3 = exec
    int err;
};

void write_report(int fd, int stage, int err) {
    ExecReport rep{stage, err};
    ssize_t n = write(fd, &rep, sizeof(rep));
    (void)n;  // nothing left to do if the parent went away
}

bool read_exact(int fd, void* buf, size_t len, int timeout_ms) {
    auto* p = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        struct pollfd pfd{fd, POLLIN, 0};
        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;
        ssize_t n = read(fd, p + got, len - got);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        got += static_cast<size_t>(n);
    }
    return true;
}

struct PipePair {
    int fds[2] = {-1, -1};
    ~PipePair() { close_read(); close_write(); }
    void close_read() { if (fds[0] >= 0) { close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { close(fds[1]); fds[1] = -1; } }
};

} // namespace

PosixProcessControl::PosixProcessControl() = default;

PosixProcessControl::PosixProcessControl(Options options) : options_(std::move(options)) {}

// ── Command construction ────────────────────────────────────

std::vector<std::string> PosixProcessControl::build_command(
        ArtifactKind kind, const std::string& artifact_path,
        const std::vector<std::string>& extra_args, const Options& options) {
    std::vector<std::string> argv;
    switch (kind) {
        case ArtifactKind::JarLike:
            argv.push_back(options.java_binary);
            argv.insert(argv.end(), options.java_args.begin(), options.java_args.end());
            argv.insert(argv.end(), extra_args.begin(), extra_args.end());
            argv.push_back("-jar");
            argv.push_back(artifact_path);
            break;
        case ArtifactKind::NativeExecutable:
        case ArtifactKind::ShellScript:
            argv.push_back(artifact_path);
            argv.insert(argv.end(), extra_args.begin(), extra_args.end());
            break;
        case ArtifactKind::BatchScript:
            argv.push_back("cmd.exe");
            argv.push_back("/c");
            argv.push_back(artifact_path);
            argv.insert(argv.end(), extra_args.begin(), extra_args.end());
            break;
    }
    return argv;
}

std::string PosixProcessControl::default_working_directory(const std::string& artifact_path) {
    if (Identity::matches_folder_layout(artifact_path)) {
        return fs::path(artifact_path).parent_path().string();
    }
    return "";
}

// ── Launch ──────────────────────────────────────────────────

pid_t PosixProcessControl::launch(const LaunchRequest& request) {
    const std::string& path = request.artifact_path;
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        throw LaunchError(LaunchError::Kind::ArtifactNotFound, "Artifact not found: " + path);
    }
    auto kind = Identity::kind_from_extension(path);
    if (!kind) {
        throw LaunchError(LaunchError::Kind::SpawnFailed, "Unsupported artifact type: " + path);
    }

    std::string workdir = request.working_directory.empty()
        ? default_working_directory(path) : request.working_directory;

    // Everything the children touch is prepared before fork
    auto args = build_command(*kind, path, request.extra_args, options_);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    PipePair pid_pipe, report_pipe;
    if (pipe2(pid_pipe.fds, O_CLOEXEC) < 0 || pipe2(report_pipe.fds, O_CLOEXEC) < 0) {
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t mid = fork();
    if (mid < 0) {
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          std::string("fork failed: ") + std::strerror(errno));
    }

    if (mid == 0) {
        // Intermediate child: new session, then fork the real process and exit
        // so the service is reparented away from the supervisor.
        setsid();
        pid_t gc = fork();
        if (gc < 0) {
            write_report(report_pipe.fds[1], 1, errno);
            _exit(1);
        }
        if (gc > 0) {
            ssize_t n = write(pid_pipe.fds[1], &gc, sizeof(gc));
            _exit(n == sizeof(gc) ? 0 : 1);
        }

        // Grandchild
        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            write_report(report_pipe.fds[1], 2, errno);
            _exit(127);
        }
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGHUP, SIG_DFL);

        execvp(argv[0], argv.data());
        write_report(report_pipe.fds[1], 3, errno);
        _exit(127);
    }

    // Parent
    pid_pipe.close_write();
    report_pipe.close_write();

    int status = 0;
    while (waitpid(mid, &status, 0) < 0 && errno == EINTR) {}

    pid_t service_pid = -1;
    bool got_pid = read_exact(pid_pipe.fds[0], &service_pid, sizeof(service_pid),
                              static_cast<int>(options_.exec_report_timeout.count()));

    ExecReport rep{0, 0};
    bool failed = read_exact(report_pipe.fds[0], &rep, sizeof(rep),
                             static_cast<int>(options_.exec_report_timeout.count()));
    if (failed) {
        std::string reason = std::strerror(rep.err);
        if (rep.stage == 3 && (rep.err == EACCES || rep.err == EPERM)) {
            throw LaunchError(LaunchError::Kind::PermissionDenied,
                              "Permission denied executing " + args[0] + ": " + reason);
        }
        if (rep.stage == 2) {
            throw LaunchError(LaunchError::Kind::SpawnFailed,
                              "Cannot enter working directory " + workdir + ": " + reason);
        }
        const char* what = rep.stage == 1 ? "fork" : "exec";
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          std::string(what) + " " + args[0] + " failed: " + reason);
    }
    if (!got_pid || service_pid <= 0) {
        throw LaunchError(LaunchError::Kind::SpawnFailed, "Detached launch did not report a pid");
    }

    // A service that dies right away never counted as started
    if (options_.launch_check.count() > 0 && wait_gone(service_pid, options_.launch_check)) {
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          "Service exited immediately after start: " + path);
    }

    spdlog::info("Started detached service: PID {}, artifact {}", service_pid, path);
    return service_pid;
}

// ── Stop ────────────────────────────────────────────────────

bool PosixProcessControl::is_alive(pid_t pid) const {
    if (pid <= 0) return false;
    if (kill(pid, 0) != 0 && errno != EPERM) return false;

    // Zombies answer kill(0) but are gone for our purposes
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    if (stat && std::getline(stat, content)) {
        auto rp = content.rfind(')');
        if (rp != std::string::npos && rp + 2 < content.size() && content[rp + 2] == 'Z') {
            return false;
        }
    }
    return true;
}

bool PosixProcessControl::wait_gone(pid_t pid, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

void PosixProcessControl::stop(pid_t pid) {
    if (!is_alive(pid)) return;

    if (kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) return;
        spdlog::warn("SIGTERM to {} failed: {}", pid, std::strerror(errno));
    }
    if (wait_gone(pid, options_.stop_timeout)) {
        spdlog::info("Service {} stopped gracefully", pid);
        return;
    }

    spdlog::warn("Service {} ignored SIGTERM, sending SIGKILL", pid);
    if (kill(pid, SIGKILL) != 0 && errno == ESRCH) return;
    if (wait_gone(pid, options_.kill_timeout)) {
        spdlog::info("Service {} force stopped", pid);
        return;
    }
    throw StopTimeout(pid);
}

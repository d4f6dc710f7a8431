#include "daemon/process_registry.hpp"
#include "core/errors.hpp"
#include "core/identity.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Helpers ─────────────────────────────────────────────────

static std::optional<std::string> read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return s;
}

static std::string read_link(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) return "";
    return target.string();
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return lower(s.substr(s.size() - suffix.size())) == suffix;
}

static std::string base_name(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string user_name(uid_t uid) {
    struct passwd pw;
    struct passwd* found = nullptr;
    char buf[1024];
    if (getpwuid_r(uid, &pw, buf, sizeof(buf), &found) == 0 && found) {
        return found->pw_name;
    }
    return std::to_string(uid);
}

// ── Classification ──────────────────────────────────────────

std::optional<ProcfsRegistry::Classified> ProcfsRegistry::classify(
        const std::vector<std::string>& argv, const std::string& exe_path) {
    if (argv.empty()) return std::nullopt;

    std::string prog = lower(base_name(argv[0]));
    std::string exe = lower(base_name(exe_path));

    bool is_java = prog.rfind("java", 0) == 0 || exe.rfind("java", 0) == 0;
    if (is_java) {
        for (size_t i = 1; i < argv.size(); ++i) {
            if (ends_with_ci(argv[i], ".jar")) {
                return Classified{ArtifactKind::JarLike, argv[i]};
            }
        }
        return std::nullopt;
    }

    static const char* shells[] = {"sh", "bash", "dash", "zsh", "ksh"};
    bool is_shell = std::any_of(std::begin(shells), std::end(shells),
                                [&](const char* s) { return prog == s; });
    if (is_shell) {
        for (size_t i = 1; i < argv.size(); ++i) {
            if (!argv[i].empty() && argv[i][0] == '-') continue;
            if (ends_with_ci(argv[i], ".sh")) {
                return Classified{ArtifactKind::ShellScript, argv[i]};
            }
            break;  // first operand is the script, or this is not a script run
        }
        return std::nullopt;
    }
    if (ends_with_ci(argv[0], ".sh")) {
        return Classified{ArtifactKind::ShellScript, argv[0]};
    }

    if (prog == "cmd.exe" || prog == "cmd") {
        for (size_t i = 1; i < argv.size(); ++i) {
            if (ends_with_ci(argv[i], ".bat")) {
                return Classified{ArtifactKind::BatchScript, argv[i]};
            }
        }
        return std::nullopt;
    }

    if (ends_with_ci(argv[0], ".exe")) {
        return Classified{ArtifactKind::NativeExecutable, argv[0]};
    }
    if (ends_with_ci(exe_path, ".exe")) {
        return Classified{ArtifactKind::NativeExecutable, exe_path};
    }
    return std::nullopt;
}

// ── ProcfsRegistry ──────────────────────────────────────────

ProcfsRegistry::ProcfsRegistry(std::string proc_root)
    : proc_root_(std::move(proc_root)),
      clock_ticks_(sysconf(_SC_CLK_TCK)),
      page_size_(sysconf(_SC_PAGESIZE)) {
    if (clock_ticks_ <= 0) clock_ticks_ = 100;
    if (page_size_ <= 0) page_size_ = 4096;
}

std::string ProcfsRegistry::proc_path(pid_t pid, const char* leaf) const {
    return proc_root_ + "/" + std::to_string(pid) + "/" + leaf;
}

double ProcfsRegistry::read_uptime() const {
    auto txt = read_text(proc_root_ + "/uptime");
    if (!txt) return 0.0;
    return std::strtod(txt->c_str(), nullptr);
}

long long ProcfsRegistry::read_boot_time() const {
    auto txt = read_text(proc_root_ + "/stat");
    if (!txt) return 0;
    std::istringstream ss(*txt);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("btime ", 0) == 0) {
            return std::strtoll(line.c_str() + 6, nullptr, 10);
        }
    }
    return 0;
}

std::optional<ServiceRecord> ProcfsRegistry::read_process(
        pid_t pid, std::unordered_map<pid_t, CpuSample>& next) {
    // stat: "pid (comm) S ppid ..." -- comm may contain spaces and parens
    auto stat = read_text(proc_path(pid, "stat"));
    if (!stat) throw DiscoveryError("stat unreadable");
    auto rp = stat->rfind(')');
    if (rp == std::string::npos || rp + 2 > stat->size()) throw DiscoveryError("malformed stat");

    std::istringstream fields(stat->substr(rp + 2));
    std::vector<std::string> tok;
    for (std::string t; fields >> t;) tok.push_back(t);
    // field N of proc(5) is tok[N - 3]
    if (tok.size() < 22) throw DiscoveryError("short stat");

    auto cmdline = read_text(proc_path(pid, "cmdline"));
    if (!cmdline) throw DiscoveryError("cmdline unreadable");
    std::vector<std::string> argv;
    {
        std::string cur;
        for (char c : *cmdline) {
            if (c == '\0') { argv.push_back(cur); cur.clear(); }
            else cur.push_back(c);
        }
        if (!cur.empty()) argv.push_back(cur);
    }
    if (argv.empty()) return std::nullopt;  // kernel thread or zombie

    std::string exe = read_link(proc_path(pid, "exe"));
    auto cls = classify(argv, exe);
    if (!cls || !Identity::is_platform_kind(cls->kind)) return std::nullopt;

    ServiceRecord rec;
    rec.pid = pid;
    rec.artifact_kind = cls->kind;
    rec.state = tok[0].empty() ? '?' : tok[0][0];

    std::ostringstream joined;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) joined << ' ';
        joined << argv[i];
    }
    rec.command_line = joined.str();

    rec.working_directory = read_link(proc_path(pid, "cwd"));
    fs::path artifact(cls->artifact_path);
    if (artifact.is_relative() && !rec.working_directory.empty()) {
        artifact = fs::path(rec.working_directory) / artifact;
    }
    rec.artifact_path = artifact.lexically_normal().string();
    rec.logical_name = Identity::logical_name(rec.artifact_path);

    // status: resident memory, threads, owner
    auto status = read_text(proc_path(pid, "status"));
    if (!status) throw DiscoveryError("status unreadable");
    bool have_rss = false;
    std::istringstream ss(*status);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            rec.memory_bytes = std::strtoull(line.c_str() + 6, nullptr, 10) * 1024ULL;
            have_rss = true;
        } else if (line.rfind("Threads:", 0) == 0) {
            rec.thread_count = std::atoi(line.c_str() + 8);
        } else if (line.rfind("Uid:", 0) == 0) {
            rec.user = user_name(static_cast<uid_t>(std::strtoul(line.c_str() + 4, nullptr, 10)));
        }
    }
    if (!have_rss) {
        long long pages = std::strtoll(tok[21].c_str(), nullptr, 10);
        rec.memory_bytes = pages > 0 ? static_cast<uint64_t>(pages) * page_size_ : 0;
    }
    if (rec.thread_count == 0) rec.thread_count = std::atoi(tok[17].c_str());

    // CPU: delta against the previous pass, lifetime average on first sight
    uint64_t ticks = std::strtoull(tok[11].c_str(), nullptr, 10) +
                     std::strtoull(tok[12].c_str(), nullptr, 10);
    double start_sec = static_cast<double>(std::strtoull(tok[19].c_str(), nullptr, 10)) /
                       static_cast<double>(clock_ticks_);
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(samples_mutex_);
        auto prev = samples_.find(pid);
        if (prev != samples_.end() && ticks >= prev->second.ticks) {
            double wall = std::chrono::duration<double>(now - prev->second.taken).count();
            if (wall > 0.0) {
                rec.cpu_percent = 100.0 * static_cast<double>(ticks - prev->second.ticks) /
                                  static_cast<double>(clock_ticks_) / wall;
            }
        } else {
            double alive = read_uptime() - start_sec;
            if (alive > 0.0) {
                rec.cpu_percent = 100.0 * static_cast<double>(ticks) /
                                  static_cast<double>(clock_ticks_) / alive;
            }
        }
    }
    next[pid] = CpuSample{ticks, now};

    long long boot = read_boot_time();
    if (boot > 0) {
        rec.start_time = std::chrono::system_clock::time_point(
            std::chrono::seconds(boot) +
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::duration<double>(start_sec)));
    }

    // Descriptors: unreadable for foreign processes, counts stay zero
    std::error_code ec;
    fs::directory_iterator fds(proc_path(pid, "fd"), ec);
    if (!ec) {
        for (const auto& fd : fds) {
            std::string target = read_link(fd.path().string());
            if (target.rfind("socket:[", 0) == 0) ++rec.connection_count;
            else if (!target.empty() && target[0] == '/') ++rec.open_file_count;
        }
    }

    return rec;
}

std::vector<ServiceRecord> ProcfsRegistry::discover() {
    std::vector<ServiceRecord> records;
    std::unordered_map<pid_t, CpuSample> next;

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        spdlog::error("Cannot enumerate {}: {}", proc_root_, ec.message());
        return records;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::strtol(name.c_str(), nullptr, 10));
        try {
            auto rec = read_process(pid, next);
            if (rec) records.push_back(std::move(*rec));
        } catch (const DiscoveryError& e) {
            // exited mid-scan or permission denied
            spdlog::debug("Skipping pid {}: {}", pid, e.what());
        }
    }

    std::lock_guard<std::mutex> lock(samples_mutex_);
    samples_ = std::move(next);
    return records;
}

std::optional<ServiceRecord> ProcfsRegistry::inspect(pid_t pid) {
    std::unordered_map<pid_t, CpuSample> next;
    try {
        auto rec = read_process(pid, next);
        if (rec) {
            std::lock_guard<std::mutex> lock(samples_mutex_);
            samples_[pid] = next[pid];
        }
        return rec;
    } catch (const DiscoveryError& e) {
        spdlog::debug("Cannot inspect pid {}: {}", pid, e.what());
        return std::nullopt;
    }
}

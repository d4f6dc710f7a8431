#include "core/identity.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Identity::logical_name(const std::string& artifact_path) {
    std::string path = artifact_path;
    // Windows-family paths may arrive with backslashes
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.size() > 1 && path.back() == '/') path.pop_back();

    std::string file = path;
    auto slash = file.rfind('/');
    if (slash != std::string::npos) file = file.substr(slash + 1);

    auto dot = file.rfind('.');
    if (dot != std::string::npos && dot > 0) file = file.substr(0, dot);
    return file;
}

bool Identity::same_name(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string Identity::name_key(const std::string& name) {
    return lower(name);
}

bool Identity::matches_folder_layout(const std::string& artifact_path) {
    std::string path = artifact_path;
    std::replace(path.begin(), path.end(), '\\', '/');
    fs::path p(path);
    std::string parent = p.parent_path().filename().string();
    if (parent.empty()) return false;
    return same_name(logical_name(path), parent);
}

std::optional<ArtifactKind> Identity::kind_from_extension(const std::string& path) {
    std::string ext = lower(fs::path(path).extension().string());
    if (ext == ".jar") return ArtifactKind::JarLike;
    if (ext == ".exe") return ArtifactKind::NativeExecutable;
    if (ext == ".bat") return ArtifactKind::BatchScript;
    if (ext == ".sh")  return ArtifactKind::ShellScript;
    return std::nullopt;
}

const std::vector<ArtifactKind>& Identity::platform_artifact_kinds() {
#ifdef _WIN32
    static const std::vector<ArtifactKind> kinds = {
        ArtifactKind::JarLike, ArtifactKind::NativeExecutable, ArtifactKind::BatchScript};
#else
    static const std::vector<ArtifactKind> kinds = {
        ArtifactKind::JarLike, ArtifactKind::ShellScript};
#endif
    return kinds;
}

bool Identity::is_platform_kind(ArtifactKind kind) {
    const auto& kinds = platform_artifact_kinds();
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

std::vector<std::string> Identity::platform_extensions() {
    std::vector<std::string> exts;
    for (auto kind : platform_artifact_kinds()) {
        switch (kind) {
            case ArtifactKind::JarLike:          exts.push_back(".jar"); break;
            case ArtifactKind::NativeExecutable: exts.push_back(".exe"); break;
            case ArtifactKind::BatchScript:      exts.push_back(".bat"); break;
            case ArtifactKind::ShellScript:      exts.push_back(".sh"); break;
        }
    }
    return exts;
}

std::optional<pid_t> Identity::parse_pid(const std::string& text) {
    if (text.empty()) return std::nullopt;
    long long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
        if (value > std::numeric_limits<pid_t>::max()) return std::nullopt;
    }
    if (value == 0) return std::nullopt;
    return static_cast<pid_t>(value);
}

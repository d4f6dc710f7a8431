#include "core/service_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

bool operator==(const AutoRestartPolicy& a, const AutoRestartPolicy& b) {
    return a.logical_name == b.logical_name &&
           a.enabled == b.enabled &&
           a.cpu_threshold_percent == b.cpu_threshold_percent &&
           a.memory_threshold_bytes == b.memory_threshold_bytes &&
           a.queue_threshold_count == b.queue_threshold_count;
}

const char* artifact_kind_label(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::JarLike:          return "JAR";
        case ArtifactKind::NativeExecutable: return "EXE";
        case ArtifactKind::BatchScript:      return "BAT";
        case ArtifactKind::ShellScript:      return "SH";
    }
    return "?";
}

const char* restart_phase_name(RestartPhase phase) {
    switch (phase) {
        case RestartPhase::Idle:        return "idle";
        case RestartPhase::Stopping:    return "stopping";
        case RestartPhase::Delaying:    return "delaying";
        case RestartPhase::Relaunching: return "relaunching";
    }
    return "?";
}

uint64_t mb_to_bytes(double mb) {
    if (!(mb > 0.0)) return 0;
    return static_cast<uint64_t>(std::llround(mb * static_cast<double>(kBytesPerMb)));
}

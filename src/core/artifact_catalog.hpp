#pragma once

#include "core/service_types.hpp"

#include <string>
#include <vector>

struct ArtifactInfo {
    std::string name;               // "billing.jar"
    std::string path;               // "/opt/services/billing/billing.jar"
    double size_mb = 0.0;
    ArtifactKind kind = ArtifactKind::JarLike;
    std::string extension;          // ".jar"
    bool subfolder_layout = false;  // lives in "<folder>/<name>/"
};

class ArtifactCatalog {
public:
    struct ListResult {
        bool success = false;
        std::string error;
        std::vector<ArtifactInfo> artifacts;
    };

    /// Launchable artifacts in folder and in same-named subfolders one level down.
    /// Sorted by type label, then name.
    static ListResult list(const std::string& folder);

    /// Resolve a bare artifact file name ("billing.jar") against a folder,
    /// preferring the subfolder layout. Empty if not found.
    static std::string resolve(const std::string& folder, const std::string& file_name);
};

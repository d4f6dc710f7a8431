#pragma once

#include "core/service_types.hpp"

#include <optional>
#include <string>
#include <vector>

class Identity {
public:
    /// Base filename without extension: "/opt/svc/Billing.jar" -> "Billing".
    /// Pure and total over any non-empty path.
    static std::string logical_name(const std::string& artifact_path);

    /// Case-insensitive logical name comparison
    static bool same_name(const std::string& a, const std::string& b);

    /// Lowercased form, for places that need a plain string key
    static std::string name_key(const std::string& name);

    /// Positive decimal pid that fits pid_t; nullopt for anything else
    static std::optional<pid_t> parse_pid(const std::string& text);

    /// True when the artifact sits in a folder named like itself:
    /// "/srv/billing/billing.jar" -> true, "/srv/tools/billing.jar" -> false
    static bool matches_folder_layout(const std::string& artifact_path);

    /// Kind from the file extension, nullopt for anything unrecognized
    static std::optional<ArtifactKind> kind_from_extension(const std::string& path);

    /// Artifact kinds recognized on the platform this binary was built for
    static const std::vector<ArtifactKind>& platform_artifact_kinds();

    static bool is_platform_kind(ArtifactKind kind);

    /// Lowercased extensions (".jar", ".sh") recognized on this platform
    static std::vector<std::string> platform_extensions();
};

#include "core/artifact_catalog.hpp"
#include "core/identity.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

static bool make_info(const fs::directory_entry& entry, bool subfolder, ArtifactInfo& out) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return false;

    auto kind = Identity::kind_from_extension(entry.path().string());
    if (!kind || !Identity::is_platform_kind(*kind)) return false;

    out.name = entry.path().filename().string();
    out.path = entry.path().string();
    auto size = entry.file_size(ec);
    out.size_mb = ec ? 0.0 : std::round(bytes_to_mb(size) * 100.0) / 100.0;
    out.kind = *kind;
    out.extension = Identity::name_key(entry.path().extension().string());
    out.subfolder_layout = subfolder;
    return true;
}

ArtifactCatalog::ListResult ArtifactCatalog::list(const std::string& folder) {
    ListResult result;

    if (folder.empty()) {
        result.error = "No folder path configured. Please set folder path first.";
        return result;
    }
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        result.error = "Folder does not exist: " + folder;
        return result;
    }

    try {
        for (const auto& entry : fs::directory_iterator(folder)) {
            ArtifactInfo info;
            if (make_info(entry, false, info)) {
                result.artifacts.push_back(std::move(info));
                continue;
            }

            if (!entry.is_directory(ec) || ec) continue;
            std::string dir_name = entry.path().filename().string();
            try {
                for (const auto& inner : fs::directory_iterator(entry.path())) {
                    ArtifactInfo sub;
                    if (!make_info(inner, true, sub)) continue;
                    if (!Identity::same_name(Identity::logical_name(sub.path), dir_name)) continue;
                    result.artifacts.push_back(std::move(sub));
                }
            } catch (const fs::filesystem_error& e) {
                spdlog::debug("Skipping unreadable folder {}: {}", entry.path().string(), e.what());
            }
        }
    } catch (const fs::filesystem_error& e) {
        if (e.code() == std::errc::permission_denied) {
            result.error = "Permission denied accessing folder: " + folder;
        } else {
            result.error = e.what();
        }
        return result;
    }

    std::sort(result.artifacts.begin(), result.artifacts.end(),
              [](const ArtifactInfo& a, const ArtifactInfo& b) {
                  std::string ta = artifact_kind_label(a.kind);
                  std::string tb = artifact_kind_label(b.kind);
                  if (ta != tb) return ta < tb;
                  return a.name < b.name;
              });
    result.success = true;
    return result;
}

std::string ArtifactCatalog::resolve(const std::string& folder, const std::string& file_name) {
    if (folder.empty() || file_name.empty()) return "";

    fs::path nested = fs::path(folder) / Identity::logical_name(file_name) / file_name;
    fs::path flat = fs::path(folder) / file_name;
    std::error_code ec;
    if (fs::is_regular_file(nested, ec)) return nested.lexically_normal().string();
    if (fs::is_regular_file(flat, ec)) return flat.lexically_normal().string();
    return "";
}

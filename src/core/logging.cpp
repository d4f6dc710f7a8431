#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

int Logging::parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logging::init(const AppConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!cfg.log_file.empty()) {
        try {
            fs::path parent = fs::path(cfg.log_file).parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            // 5 MB x 3 files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.log_file, 5 * 1024 * 1024, 3));
        } catch (const std::exception& e) {
            spdlog::warn("Cannot open log file {}: {}", cfg.log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("svcguard", sinks.begin(), sinks.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(parse_level(cfg.log_level)));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

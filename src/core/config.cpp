#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() {
    config_.store_path = default_store_path();
}

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    const char* override_dir = std::getenv("SVCGUARD_CONFIG_DIR");
    if (override_dir && *override_dir) {
        return override_dir;
    }
    if (is_privileged()) {
        return "/etc/svcguard";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/svcguard";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_store_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "monitor_config.json";
    return dir + "/monitor_config.json";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // API section
        if (auto api = root["api"]) {
            config_.api_host = api["host"].as<std::string>(config_.api_host);
            config_.api_port = api["port"].as<int>(config_.api_port);
            config_.api_timeout_ms = api["timeout_ms"].as<int>(config_.api_timeout_ms);
        }

        // Monitor section
        if (auto mon = root["monitor"]) {
            config_.check_interval_sec = mon["check_interval_sec"].as<int>(config_.check_interval_sec);
            config_.error_retry_interval_sec =
                mon["error_retry_interval_sec"].as<int>(config_.error_retry_interval_sec);
            config_.restart_delay_sec = mon["restart_delay_sec"].as<int>(config_.restart_delay_sec);
            config_.queue_restart_delay_sec =
                mon["queue_restart_delay_sec"].as<int>(config_.queue_restart_delay_sec);
            config_.stop_timeout_sec = mon["stop_timeout_sec"].as<int>(config_.stop_timeout_sec);
            config_.kill_timeout_sec = mon["kill_timeout_sec"].as<int>(config_.kill_timeout_sec);
            config_.launch_check_ms = mon["launch_check_ms"].as<int>(config_.launch_check_ms);
        }

        // Store section
        if (auto store = root["store"]) {
            config_.store_path = expand_home(store["path"].as<std::string>(config_.store_path));
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_file = expand_home(logging["file"].as<std::string>(config_.log_file));
        }

        // Launch section
        if (auto launch = root["launch"]) {
            config_.java_binary = launch["java_binary"].as<std::string>(config_.java_binary);
            if (auto args = launch["java_args"]) {
                config_.java_args.clear();
                for (const auto& arg : args) {
                    config_.java_args.push_back(arg.as<std::string>());
                }
            }
        }

        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        spdlog::warn("Ignoring malformed config {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // API section
        out << YAML::Key << "api" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << config_.api_host;
        out << YAML::Key << "port" << YAML::Value << config_.api_port;
        out << YAML::Key << "timeout_ms" << YAML::Value << config_.api_timeout_ms;
        out << YAML::EndMap;

        // Monitor section
        out << YAML::Key << "monitor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "check_interval_sec" << YAML::Value << config_.check_interval_sec;
        out << YAML::Key << "error_retry_interval_sec" << YAML::Value << config_.error_retry_interval_sec;
        out << YAML::Key << "restart_delay_sec" << YAML::Value << config_.restart_delay_sec;
        out << YAML::Key << "queue_restart_delay_sec" << YAML::Value << config_.queue_restart_delay_sec;
        out << YAML::Key << "stop_timeout_sec" << YAML::Value << config_.stop_timeout_sec;
        out << YAML::Key << "kill_timeout_sec" << YAML::Value << config_.kill_timeout_sec;
        out << YAML::Key << "launch_check_ms" << YAML::Value << config_.launch_check_ms;
        out << YAML::EndMap;

        // Store section
        out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config_.store_path;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        // Launch section
        out << YAML::Key << "launch" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "java_binary" << YAML::Value << config_.java_binary;
        out << YAML::Key << "java_args" << YAML::Value << YAML::BeginSeq;
        for (const auto& arg : config_.java_args) {
            out << arg;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

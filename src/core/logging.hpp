#pragma once

#include "core/config.hpp"

#include <string>

class Logging {
public:
    /// Install the default spdlog logger: stderr, plus a rotating file when
    /// cfg.log_file is set. Safe to call more than once.
    static void init(const AppConfig& cfg);

    /// "debug" -> spdlog::level::debug; unknown names map to info
    static int parse_level(const std::string& name);
};

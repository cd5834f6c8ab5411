#pragma once

#include <filesystem>

#include "taskcli/core/logging.hpp"

namespace taskcli {

struct Config {
    // Storage
    std::filesystem::path data_file;

    // Diagnostics
    LogLevel log_level = LogLevel::Warn;
    bool log_json = false;

    // Terminal output
    bool color = true;

    // Load configuration from environment variables
    static Config from_env();

    // $HOME/.task-cli/data.json, or ./.task-cli/data.json when HOME is unset
    static std::filesystem::path default_data_file();
};

} // namespace taskcli

#include "taskcli/core/config.hpp"
#include <cstdlib>
#include <string>

namespace taskcli {

std::filesystem::path Config::default_data_file() {
    std::filesystem::path home = ".";
    if (const char* env_home = std::getenv("HOME"); env_home && *env_home) {
        home = env_home;
    }
    return home / ".task-cli" / "data.json";
}

Config Config::from_env() {
    Config config;

    config.data_file = default_data_file();
    if (const char* data_file = std::getenv("TASK_CLI_DATA_FILE"); data_file && *data_file) {
        config.data_file = data_file;
    }

    if (const char* level = std::getenv("TASK_CLI_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }
    if (const char* json = std::getenv("TASK_CLI_LOG_JSON")) {
        config.log_json = (std::string(json) == "1" || std::string(json) == "true");
    }

    // https://no-color.org: present and not empty
    if (const char* no_color = std::getenv("NO_COLOR"); no_color && *no_color) {
        config.color = false;
    }

    return config;
}

} // namespace taskcli

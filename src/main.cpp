// task-cli - personal task tracker
// Usage: task-cli <command> [argument]

#include "taskcli/taskcli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        // Load configuration from environment
        auto config = taskcli::Config::from_env();
        taskcli::configure_default_logger(config.log_level, config.log_json, config.color);

        taskcli::cli::View view(config.color);
        return taskcli::cli::run(argc, argv, config, view);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return taskcli::cli::ExitCode::Failure;
    }
}

#pragma once

#include "taskcli/core/config.hpp"
#include "taskcli/cli/view.hpp"

namespace taskcli::cli {

enum ExitCode : int {
    Ok = 0,
    Failure = 1
};

// Parse the command line, run at most one command against the task file named
// by config, and report through view. Expected errors never escape: they are
// printed and turned into ExitCode::Failure.
int run(int argc, const char* const* argv, const Config& config, const View& view);

} // namespace taskcli::cli

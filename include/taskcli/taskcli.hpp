#pragma once

// Main include file for task-cli

// Utilities
#include "taskcli/util/expected.hpp"

// Core
#include "taskcli/core/config.hpp"
#include "taskcli/core/error.hpp"
#include "taskcli/core/logging.hpp"

// Tasks
#include "taskcli/model/task.hpp"
#include "taskcli/registry/task_registry.hpp"
#include "taskcli/store/store.hpp"

// Command line
#include "taskcli/cli/app.hpp"
#include "taskcli/cli/view.hpp"

namespace taskcli {

// Version info
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

} // namespace taskcli

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "taskcli/core/error.hpp"
#include "taskcli/util/expected.hpp"

namespace taskcli::model {

// Task timestamps are kept at millisecond precision, the resolution of the data file
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

Timestamp now() noexcept;

// ISO-8601 UTC, e.g. 2024-05-01T12:34:56.789Z
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(std::string_view text);

enum class TaskStatus {
    Todo,
    InProgress,
    Done
};

// Convert TaskStatus to/from its file and command-line form ("todo", "in-progress", "done")
std::string to_string(TaskStatus status);
std::optional<TaskStatus> status_from_string(std::string_view s);

struct Task {
    std::string id;
    TaskStatus status = TaskStatus::Todo;
    std::string description;
    Timestamp created_at{};
    Timestamp updated_at{};

    bool operator==(const Task&) const = default;

    // Serialization
    nlohmann::json to_json() const;
    static expected<Task, Error> from_json(const nlohmann::json& j);
};

// Partial update naming only the mutable fields
struct TaskPatch {
    std::optional<TaskStatus> status;
    std::optional<std::string> description;

    bool empty() const { return !status && !description; }
};

// Overlay the patch on a copy of the task; id and timestamps are left untouched
Task apply_patch(Task task, const TaskPatch& patch);

nlohmann::json to_json_array(const std::vector<Task>& tasks);

} // namespace taskcli::model

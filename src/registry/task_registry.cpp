#include "taskcli/registry/task_registry.hpp"
#include "taskcli/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>

namespace taskcli {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

Error task_not_found(std::string_view id) {
    return Error::not_found("Task ID \"" + std::string(id) + "\" not found!");
}

void log_mutation(std::string message, const model::Task& task) {
    default_logger().log(default_logger()
        .entry(LogLevel::Debug, std::move(message))
        .field("id", task.id)
        .field("status", model::to_string(task.status)));
}

} // anonymous namespace

std::string random_task_id() {
    static std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;

    static constexpr char digits[] = "0123456789abcdef";
    uint32_t value = dist(engine);

    std::string id(8, '0');
    for (auto it = id.rbegin(); it != id.rend(); ++it) {
        *it = digits[value & 0xF];
        value >>= 4;
    }
    return id;
}

TaskRegistry::TaskRegistry(Store store, std::vector<model::Task> tasks, ClockFn clock, IdGenerator generate_id)
    : store_(std::move(store))
    , tasks_(std::move(tasks))
    , clock_(std::move(clock))
    , generate_id_(std::move(generate_id)) {}

expected<TaskRegistry, Error> TaskRegistry::init(Store store, ClockFn clock, IdGenerator generate_id) {
    auto tasks = store.load();
    if (!tasks) {
        return unexpected(tasks.error());
    }
    return TaskRegistry(std::move(store), std::move(*tasks), std::move(clock), std::move(generate_id));
}

expected<model::Task, Error> TaskRegistry::add(std::string_view description) {
    if (is_blank(description)) {
        return unexpected(Error::validation("Description is required!"));
    }

    auto timestamp = clock_();
    model::Task task{
        .id = next_id(),
        .status = model::TaskStatus::Todo,
        .description = std::string(description),
        .created_at = timestamp,
        .updated_at = timestamp
    };

    tasks_.push_back(task);
    if (auto saved = store_.save(tasks_); !saved) {
        tasks_.pop_back();
        return unexpected(saved.error());
    }

    log_mutation("task added", task);
    return task;
}

expected<model::Task, Error> TaskRegistry::update(std::string_view id, const model::TaskPatch& patch) {
    auto it = locate(id);
    if (it == tasks_.end()) {
        return unexpected(task_not_found(id));
    }
    if (patch.description && is_blank(*patch.description)) {
        return unexpected(Error::validation("Description is required!"));
    }

    model::Task previous = *it;
    model::Task updated = model::apply_patch(previous, patch);
    updated.updated_at = std::max(clock_(), previous.updated_at);

    *it = updated;
    if (auto saved = store_.save(tasks_); !saved) {
        *it = std::move(previous);
        return unexpected(saved.error());
    }

    log_mutation("task updated", updated);
    return updated;
}

expected<void, Error> TaskRegistry::remove(std::string_view id) {
    auto previous = tasks_;
    auto initial_size = tasks_.size();

    std::erase_if(tasks_, [id](const model::Task& task) { return task.id == id; });
    if (tasks_.size() == initial_size) {
        return unexpected(task_not_found(id));
    }

    if (auto saved = store_.save(tasks_); !saved) {
        tasks_ = std::move(previous);
        return saved;
    }

    default_logger().log(default_logger()
        .entry(LogLevel::Debug, "task removed")
        .field("id", std::string(id)));
    return {};
}

std::vector<model::Task> TaskRegistry::list(std::optional<std::string_view> filter_status) const {
    if (!filter_status || filter_status->empty()) {
        return tasks_;
    }

    // Unknown filters match nothing rather than failing
    std::vector<model::Task> result;
    for (const auto& task : tasks_) {
        if (model::to_string(task.status) == *filter_status) {
            result.push_back(task);
        }
    }
    return result;
}

std::optional<model::Task> TaskRegistry::find(std::string_view id) const {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const model::Task& task) {
        return task.id == id;
    });
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<model::Task>::iterator TaskRegistry::locate(std::string_view id) {
    return std::find_if(tasks_.begin(), tasks_.end(), [id](const model::Task& task) {
        return task.id == id;
    });
}

std::string TaskRegistry::next_id() const {
    std::string id;
    do {
        id = generate_id_();
    } while (id.empty() || find(id));
    return id;
}

} // namespace taskcli

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "taskcli/core/error.hpp"
#include "taskcli/model/task.hpp"
#include "taskcli/store/store.hpp"
#include "taskcli/util/expected.hpp"

namespace taskcli {

// Random 8-character lowercase hex token
std::string random_task_id();

// ============================================================================
// TaskRegistry
// ============================================================================
//
// Owns the task collection for one invocation. Every successful mutation is
// written back through the Store before returning; if the write fails the
// in-memory collection is restored and the storage error is returned.

class TaskRegistry {
public:
    using ClockFn = std::function<model::Timestamp()>;
    using IdGenerator = std::function<std::string()>;

    static expected<TaskRegistry, Error> init(Store store,
                                              ClockFn clock = model::now,
                                              IdGenerator generate_id = random_task_id);

    // CRUD operations
    expected<model::Task, Error> add(std::string_view description);
    expected<model::Task, Error> update(std::string_view id, const model::TaskPatch& patch);
    expected<void, Error> remove(std::string_view id);

    // Tasks in insertion order; with a filter, only those whose status matches it exactly
    std::vector<model::Task> list(std::optional<std::string_view> filter_status = std::nullopt) const;
    std::optional<model::Task> find(std::string_view id) const;

    size_t size() const { return tasks_.size(); }
    const Store& store() const { return store_; }

private:
    TaskRegistry(Store store, std::vector<model::Task> tasks, ClockFn clock, IdGenerator generate_id);

    std::vector<model::Task>::iterator locate(std::string_view id);
    std::string next_id() const;

    Store store_;
    std::vector<model::Task> tasks_;
    ClockFn clock_;
    IdGenerator generate_id_;
};

} // namespace taskcli

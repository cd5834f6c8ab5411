#include "taskcli/core/error.hpp"
#include <sstream>

namespace taskcli {

// ============================================================================
// TaskError Category
// ============================================================================

namespace {

class TaskErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "task-cli";
    }

    std::string message(int ev) const override {
        switch (static_cast<TaskError>(ev)) {
            case TaskError::Success: return "Success";
            case TaskError::Validation: return "Validation error";
            case TaskError::NotFound: return "Not found";
            case TaskError::Storage: return "Storage error";
            default: return "Unknown task error";
        }
    }
};

const TaskErrorCategory task_category_instance{};

} // anonymous namespace

const std::error_category& task_error_category() noexcept {
    return task_category_instance;
}

std::error_code make_error_code(TaskError e) noexcept {
    return {static_cast<int>(e), task_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

std::error_code Error::code() const noexcept {
    if (is_system()) {
        return std::get<std::error_code>(inner_);
    }
    return make_error_code(std::get<TaskError>(inner_));
}

std::string Error::to_string() const {
    std::ostringstream oss;

    auto ec = code();
    if (is_system()) {
        oss << "SystemError::" << ec.category().name() << ":" << ec.value() << " " << ec.message();
    } else {
        oss << "TaskError::" << ec.message();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace taskcli

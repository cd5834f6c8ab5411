#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <system_error>

namespace taskcli {

// ============================================================================
// Task Errors
// ============================================================================

enum class TaskError {
    Success = 0,
    Validation,     // bad user input, nothing was changed
    NotFound,       // no task with the requested id
    Storage         // the data file could not be read, parsed or written
};

} // namespace taskcli

template<>
struct std::is_error_code_enum<taskcli::TaskError> : std::true_type {};

namespace taskcli {

const std::error_category& task_error_category() noexcept;
std::error_code make_error_code(TaskError e) noexcept;

// ============================================================================
// Error
// ============================================================================
//
// What went wrong plus the message shown to the user. Filesystem failures keep
// the operating system's error_code and count as storage errors.

class Error {
    std::variant<TaskError, std::error_code> inner_;
    std::string message_;

    Error(TaskError e, std::string message)
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message)
        : inner_(ec), message_(std::move(message)) {}

public:
    static Error validation(std::string msg) {
        return Error(TaskError::Validation, std::move(msg));
    }

    static Error not_found(std::string msg) {
        return Error(TaskError::NotFound, std::move(msg));
    }

    static Error storage(std::string msg) {
        return Error(TaskError::Storage, std::move(msg));
    }

    static Error system(std::error_code ec, std::string msg) {
        return Error(ec, std::move(msg));
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    bool is_validation() const noexcept { return code() == TaskError::Validation; }
    bool is_not_found() const noexcept { return code() == TaskError::NotFound; }
    bool is_storage() const noexcept { return is_system() || code() == TaskError::Storage; }

    std::error_code code() const noexcept;

    std::string_view message() const noexcept { return message_; }

    // Kind and cause, for diagnostics: "TaskError::Not found - ..." or "SystemError::generic:13 ..."
    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }
};

} // namespace taskcli

#include "taskcli/cli/view.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskcli::cli {

std::string_view View::status_icon(model::TaskStatus status) noexcept {
    switch (status) {
        case model::TaskStatus::Done: return "✅";
        case model::TaskStatus::InProgress: return "🕐";
        case model::TaskStatus::Todo: return "❌";
    }
    return "❓";
}

std::string View::format_date(model::Timestamp ts) {
    auto time_t_val = model::Clock::to_time_t(ts);
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t_val), "%d/%m/%Y");
    return oss.str();
}

void View::print_list(const std::vector<model::Task>& tasks) const {
    if (tasks.empty()) {
        out_ << "No tasks found!\n";
        return;
    }

    for (const auto& task : tasks) {
        std::string updated;
        if (task.updated_at != task.created_at) {
            updated = "(Updated at: " + format_date(task.updated_at) + ")";
        }

        out_ << status_icon(task.status)
             << color(ansi::dim) << " [" << task.id << "]" << color(ansi::reset) << " "
             << color(ansi::blue) << format_date(task.created_at) << " " << updated << color(ansi::reset) << "\n"
             << "   " << task.description << "\n\n";
    }
}

void View::print_help() const {
    out_ << "\n"
            "Usage: task-cli <command> [argument]\n"
            "\n"
            "Commands:\n"
            "  add, a <description>          Add new task\n"
            "  list, l [filter]              List tasks  (todo, done, in-progress)\n"
            "  update, u <id> <description>  Update description\n"
            "  remove, r <id>                Remove task\n"
            "  mark-done, md <id>            Mark as completed\n"
            "  mark-todo, mt <id>            Mark as pending\n"
            "  mark-in-progress, mi <id>     Mark as in progress\n"
            "  help, h                       Show this help\n";
}

void View::print_error(std::string_view message) const {
    err_ << color(ansi::red) << "Error: " << message << color(ansi::reset) << "\n";
}

void View::print_success(std::string_view message) const {
    out_ << color(ansi::green) << message << color(ansi::reset) << "\n";
}

} // namespace taskcli::cli

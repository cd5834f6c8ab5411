#include "taskcli/model/task.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace taskcli::model {

namespace {

bool read_number(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    const char* first = text.data() + pos;
    const char* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

const std::string* string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return nullptr;
    }
    return it->get_ptr<const std::string*>();
}

} // anonymous namespace

// ============================================================================
// Timestamps
// ============================================================================

Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::string format_timestamp(Timestamp ts) {
    auto day = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{ts - day};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count() << '.'
        << std::setw(3) << tod.subseconds().count() << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS[.fff]Z
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_number(text, 0, 4, year) || !read_number(text, 5, 2, month) ||
        !read_number(text, 8, 2, day) || !read_number(text, 11, 2, hour) ||
        !read_number(text, 14, 2, minute) || !read_number(text, 17, 2, second)) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    size_t pos = 19;
    int millis = 0;
    if (text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return std::nullopt;
    }

    return std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
           std::chrono::seconds{second} + std::chrono::milliseconds{millis};
}

// ============================================================================
// TaskStatus
// ============================================================================

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Todo: return "todo";
        case TaskStatus::InProgress: return "in-progress";
        case TaskStatus::Done: return "done";
    }
    return "todo";
}

std::optional<TaskStatus> status_from_string(std::string_view s) {
    if (s == "todo") return TaskStatus::Todo;
    if (s == "in-progress") return TaskStatus::InProgress;
    if (s == "done") return TaskStatus::Done;
    return std::nullopt;
}

// ============================================================================
// Task
// ============================================================================

nlohmann::json Task::to_json() const {
    return {
        {"id", id},
        {"status", to_string(status)},
        {"description", description},
        {"createdAt", format_timestamp(created_at)},
        {"updatedAt", format_timestamp(updated_at)}
    };
}

expected<Task, Error> Task::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return unexpected(Error::storage("task entry is not an object"));
    }

    const auto* id = string_field(j, "id");
    if (!id || id->empty()) {
        return unexpected(Error::storage("task entry has no id"));
    }

    const auto* status = string_field(j, "status");
    auto parsed_status = status ? status_from_string(*status) : std::nullopt;
    if (!parsed_status) {
        return unexpected(Error::storage("task " + *id + " has an invalid status"));
    }

    const auto* description = string_field(j, "description");
    if (!description || description->empty()) {
        return unexpected(Error::storage("task " + *id + " has no description"));
    }

    const auto* created = string_field(j, "createdAt");
    const auto* updated = string_field(j, "updatedAt");
    auto created_at = created ? parse_timestamp(*created) : std::nullopt;
    auto updated_at = updated ? parse_timestamp(*updated) : std::nullopt;
    if (!created_at || !updated_at) {
        return unexpected(Error::storage("task " + *id + " has an invalid timestamp"));
    }

    Task task;
    task.id = *id;
    task.status = *parsed_status;
    task.description = *description;
    task.created_at = *created_at;
    task.updated_at = *updated_at;
    return task;
}

Task apply_patch(Task task, const TaskPatch& patch) {
    if (patch.status) task.status = *patch.status;
    if (patch.description) task.description = *patch.description;
    return task;
}

nlohmann::json to_json_array(const std::vector<Task>& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& task : tasks) {
        arr.push_back(task.to_json());
    }
    return arr;
}

} // namespace taskcli::model

#include "taskcli/store/store.hpp"
#include "taskcli/core/logging.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <unordered_set>

namespace taskcli {

namespace {

Error load_error(const std::filesystem::path& path, std::string_view cause) {
    return Error::storage("Failed to access data file " + path.string() + ": " + std::string(cause));
}

Error save_error(const std::filesystem::path& path, std::string_view cause) {
    return Error::storage("Failed to save data to " + path.string() + ": " + std::string(cause));
}

Error load_error(const std::filesystem::path& path, std::error_code ec) {
    return Error::system(ec, "Failed to access data file " + path.string() + ": " + ec.message());
}

Error save_error(const std::filesystem::path& path, std::error_code ec, std::string_view what = {}) {
    std::string cause = what.empty() ? ec.message() : std::string(what) + ": " + ec.message();
    return Error::system(ec, "Failed to save data to " + path.string() + ": " + cause);
}

// Leftover temp files are harmless; the next save truncates them
void discard(const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    if (ec) {
        log_warn("could not remove " + temp.string() + ": " + ec.message());
    }
}

} // anonymous namespace

Store::Store(std::filesystem::path path) : path_(std::move(path)) {}

expected<std::vector<model::Task>, Error> Store::load() const {
    std::error_code ec;
    bool present = std::filesystem::exists(path_, ec);
    if (ec) {
        return unexpected(load_error(path_, ec));
    }

    if (!present) {
        if (auto saved = save({}); !saved) {
            return unexpected(saved.error());
        }
        default_logger().log(default_logger()
            .entry(LogLevel::Info, "created empty data file")
            .field("path", path_.string()));
        return std::vector<model::Task>{};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return unexpected(load_error(path_, "cannot open file for reading"));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return unexpected(load_error(path_, "read failed"));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        log_debug("unparseable data file " + path_.string());
        return unexpected(load_error(path_, e.what()));
    }

    if (!document.is_array()) {
        return unexpected(load_error(path_, "expected a JSON array of tasks"));
    }

    std::vector<model::Task> tasks;
    tasks.reserve(document.size());
    std::unordered_set<std::string> ids;

    for (const auto& item : document) {
        auto task = model::Task::from_json(item);
        if (!task) {
            return unexpected(load_error(path_, task.error().message()));
        }
        if (!ids.insert(task->id).second) {
            return unexpected(load_error(path_, "duplicate task id " + task->id));
        }
        tasks.push_back(std::move(*task));
    }

    default_logger().log(default_logger()
        .entry(LogLevel::Debug, "loaded tasks")
        .field("path", path_.string())
        .field("count", tasks.size()));
    return tasks;
}

expected<void, Error> Store::save(const std::vector<model::Task>& tasks) const {
    if (auto dir = ensure_directory(); !dir) {
        return dir;
    }

    std::string content;
    try {
        content = model::to_json_array(tasks).dump(2);
    } catch (const nlohmann::json::exception& e) {
        return unexpected(save_error(path_, e.what()));
    }

    auto temp = path_;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(save_error(path_, "cannot open " + temp.string() + " for writing"));
        }
        out << content << '\n';
        out.flush();
        if (!out) {
            out.close();
            discard(temp);
            return unexpected(save_error(path_, "write failed"));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        discard(temp);
        log_debug("could not replace " + path_.string() + ": " + ec.message());
        return unexpected(save_error(path_, ec));
    }

    default_logger().log(default_logger()
        .entry(LogLevel::Debug, "saved tasks")
        .field("path", path_.string())
        .field("count", tasks.size()));
    return {};
}

expected<void, Error> Store::ensure_directory() const {
    auto dir = path_.parent_path();
    if (dir.empty()) {
        return {};
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return unexpected(save_error(path_, ec, "cannot create directory " + dir.string()));
    }
    return {};
}

} // namespace taskcli

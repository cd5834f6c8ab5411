#pragma once

#include <filesystem>
#include <vector>

#include "taskcli/core/error.hpp"
#include "taskcli/model/task.hpp"
#include "taskcli/util/expected.hpp"

namespace taskcli {

// ============================================================================
// Store
// ============================================================================
//
// Whole-collection persistence in a single JSON file. Every save rewrites the
// full array; the new content is written beside the target and renamed over it.

class Store {
public:
    explicit Store(std::filesystem::path path);

    // Load the collection. A missing file is created holding an empty array.
    expected<std::vector<model::Task>, Error> load() const;

    // Replace the file with the given collection (pretty-printed, 2-space indent)
    expected<void, Error> save(const std::vector<model::Task>& tasks) const;

    const std::filesystem::path& path() const { return path_; }

private:
    expected<void, Error> ensure_directory() const;

    std::filesystem::path path_;
};

} // namespace taskcli

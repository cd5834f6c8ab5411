#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "taskcli/model/task.hpp"

namespace taskcli::cli {

// ============================================================================
// Terminal View
// ============================================================================

namespace ansi {
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* dim    = "\033[90m";
    inline constexpr const char* blue   = "\033[34m";
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* red    = "\033[31m";
}

class View {
    std::ostream& out_;
    std::ostream& err_;
    bool colored_ = true;

    const char* color(const char* code) const { return colored_ ? code : ""; }

public:
    explicit View(bool colored = true, std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out), err_(err), colored_(colored) {}

    void print_list(const std::vector<model::Task>& tasks) const;
    void print_help() const;
    void print_error(std::string_view message) const;
    void print_success(std::string_view message) const;
    void print(std::string_view text) const { out_ << text; }

    static std::string_view status_icon(model::TaskStatus status) noexcept;

    // Local calendar date, dd/mm/yyyy
    static std::string format_date(model::Timestamp ts);
};

} // namespace taskcli::cli

#include "taskcli/cli/app.hpp"
#include "taskcli/taskcli.hpp"

#include <CLI/CLI.hpp> // for App, ParseError

#include <sstream>
#include <string>
#include <vector>

namespace taskcli::cli {

namespace {

struct CommandArgs {
    std::string id;
    std::string filter;
};

// Description words are taken verbatim, dashes included, and joined with single spaces
std::string join_words(const std::vector<std::string>& words) {
    std::ostringstream oss;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << words[i];
    }
    return oss.str();
}

struct Commands {
    CLI::App* add = nullptr;
    CLI::App* list = nullptr;
    CLI::App* update = nullptr;
    CLI::App* remove = nullptr;
    CLI::App* mark_done = nullptr;
    CLI::App* mark_todo = nullptr;
    CLI::App* mark_in_progress = nullptr;
    CLI::App* help = nullptr;
};

Commands register_commands(CLI::App& app, CommandArgs& args) {
    Commands commands;

    commands.add = app.add_subcommand("add", "Add new task")->alias("a");
    commands.add->prefix_command();

    commands.list = app.add_subcommand("list", "List tasks (todo, done, in-progress)")->alias("l");
    commands.list->add_option("filter", args.filter, "Only show tasks with this status");

    commands.update = app.add_subcommand("update", "Update description")->alias("u");
    commands.update->add_option("id", args.id, "Task ID");
    commands.update->prefix_command();

    commands.remove = app.add_subcommand("remove", "Remove task")->alias("r");
    commands.remove->add_option("id", args.id, "Task ID");

    commands.mark_done = app.add_subcommand("mark-done", "Mark as completed")->alias("md");
    commands.mark_done->add_option("id", args.id, "Task ID");

    commands.mark_todo = app.add_subcommand("mark-todo", "Mark as pending")->alias("mt");
    commands.mark_todo->add_option("id", args.id, "Task ID");

    commands.mark_in_progress = app.add_subcommand("mark-in-progress", "Mark as in progress")->alias("mi");
    commands.mark_in_progress->add_option("id", args.id, "Task ID");

    commands.help = app.add_subcommand("help", "Show usage")->alias("h");

    return commands;
}

bool is_known_command(CLI::App& app, const std::string& name) {
    auto matches = app.get_subcommands([&name](CLI::App* sub) { return sub->check_name(name); });
    return !matches.empty();
}

expected<std::string, Error> set_status(TaskRegistry& registry, const CommandArgs& args,
                                        model::TaskStatus status, std::string message) {
    if (args.id.empty()) {
        return unexpected(Error::validation("ID required!"));
    }
    auto task = registry.update(args.id, model::TaskPatch{.status = status});
    if (!task) {
        return unexpected(task.error());
    }
    return message;
}

// Runs one core command and yields the success message to print
expected<std::string, Error> execute(const Commands& commands, TaskRegistry& registry,
                                     const CommandArgs& args, const View& view) {
    if (commands.add->parsed()) {
        auto task = registry.add(join_words(commands.add->remaining()));
        if (!task) return unexpected(task.error());
        return std::string("Task added!");
    }

    if (commands.list->parsed()) {
        view.print_list(registry.list(args.filter));
        return std::string();
    }

    if (commands.update->parsed()) {
        auto description = join_words(commands.update->remaining());
        if (args.id.empty() || description.empty()) {
            return unexpected(Error::validation("ID and description required!"));
        }
        auto task = registry.update(args.id, model::TaskPatch{.description = description});
        if (!task) return unexpected(task.error());
        return std::string("Task updated!");
    }

    if (commands.remove->parsed()) {
        if (args.id.empty()) {
            return unexpected(Error::validation("ID required!"));
        }
        auto removed = registry.remove(args.id);
        if (!removed) return unexpected(removed.error());
        return std::string("Task removed!");
    }

    if (commands.mark_done->parsed()) {
        return set_status(registry, args, model::TaskStatus::Done, "Task marked as done.");
    }

    if (commands.mark_in_progress->parsed()) {
        return set_status(registry, args, model::TaskStatus::InProgress, "Task marked as in progress.");
    }

    if (commands.mark_todo->parsed()) {
        return set_status(registry, args, model::TaskStatus::Todo, "Task marked as to do.");
    }

    return std::string();
}

} // anonymous namespace

int run(int argc, const char* const* argv, const Config& config, const View& view) {
    CLI::App app{"Personal task tracker", "task-cli"};
    app.set_version_flag("--version", VERSION_STRING);
    app.require_subcommand(0, 1);

    CommandArgs args;
    Commands commands = register_commands(app, args);

    if (argc > 1 && argv[1][0] != '-' && !is_known_command(app, argv[1])) {
        view.print_error("Command not found: \"" + std::string(argv[1]) + "\"");
        view.print_help();
        return ExitCode::Failure;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::ostringstream out;
        std::ostringstream err;
        int code = app.exit(e, out, err);
        if (code == 0) {
            // --help and --version
            view.print(out.str());
            return ExitCode::Ok;
        }
        view.print_error(e.what());
        view.print_help();
        return ExitCode::Failure;
    }

    if (app.get_subcommands().empty() || commands.help->parsed()) {
        view.print_help();
        return ExitCode::Ok;
    }

    auto registry = TaskRegistry::init(Store(config.data_file));
    if (!registry) {
        view.print_error(registry.error().message());
        return ExitCode::Failure;
    }

    auto message = execute(commands, *registry, args, view);
    if (!message) {
        log_debug(message.error().to_string());
        view.print_error(message.error().message());
        return ExitCode::Failure;
    }
    if (!message->empty()) {
        view.print_success(*message);
    }
    return ExitCode::Ok;
}

} // namespace taskcli::cli

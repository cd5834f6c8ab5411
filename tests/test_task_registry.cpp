#include <catch2/catch_test_macros.hpp>
#include <taskcli/registry/task_registry.hpp>

#include "temp_dir.hpp"

#include <algorithm>
#include <set>

using namespace taskcli;
using namespace taskcli::model;

namespace {

TaskRegistry open_registry(const std::filesystem::path& path) {
    auto registry = TaskRegistry::init(Store(path));
    REQUIRE(registry.has_value());
    return std::move(*registry);
}

} // namespace

TEST_CASE("TaskRegistry init loads the store", "[registry]") {
    TempDir dir;
    auto path = dir / "data.json";

    SECTION("missing file starts empty") {
        auto registry = open_registry(path);
        CHECK(registry.size() == 0);
        CHECK(registry.list().empty());
        CHECK(std::filesystem::exists(path));
    }

    SECTION("existing tasks are kept in file order") {
        {
            auto registry = open_registry(path);
            REQUIRE(registry.add("first").has_value());
            REQUIRE(registry.add("second").has_value());
        }
        auto registry = open_registry(path);
        auto tasks = registry.list();
        REQUIRE(tasks.size() == 2);
        CHECK(tasks[0].description == "first");
        CHECK(tasks[1].description == "second");
    }

    SECTION("corrupt file is a storage error") {
        write_file(path, "{");
        auto registry = TaskRegistry::init(Store(path));
        REQUIRE(!registry.has_value());
        CHECK(registry.error().is_storage());
    }
}

TEST_CASE("TaskRegistry add", "[registry]") {
    TempDir dir;
    auto registry = open_registry(dir / "data.json");

    SECTION("new tasks start as todo with equal timestamps") {
        auto task = registry.add("Buy milk");
        REQUIRE(task.has_value());
        CHECK(task->status == TaskStatus::Todo);
        CHECK(task->description == "Buy milk");
        CHECK(task->created_at == task->updated_at);
        CHECK(task->id.size() == 8);
        CHECK(std::all_of(task->id.begin(), task->id.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        }));
    }

    SECTION("tasks are appended and persisted") {
        auto first = registry.add("one");
        auto second = registry.add("two");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());

        auto tasks = registry.list();
        REQUIRE(tasks.size() == 2);
        CHECK(tasks[0] == *first);
        CHECK(tasks[1] == *second);

        auto reloaded = Store(dir / "data.json").load();
        REQUIRE(reloaded.has_value());
        CHECK(*reloaded == tasks);
    }

    SECTION("empty or blank descriptions are rejected without writing") {
        auto before = read_file(dir / "data.json");

        auto empty = registry.add("");
        REQUIRE(!empty.has_value());
        CHECK(empty.error().is_validation());
        CHECK(empty.error().message() == "Description is required!");

        auto blank = registry.add("   \t");
        REQUIRE(!blank.has_value());
        CHECK(blank.error().is_validation());

        CHECK(registry.size() == 0);
        CHECK(read_file(dir / "data.json") == before);
    }

    SECTION("ids are pairwise distinct") {
        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i) {
            auto task = registry.add("task " + std::to_string(i));
            REQUIRE(task.has_value());
            ids.insert(task->id);
        }
        CHECK(ids.size() == 200);
    }
}

TEST_CASE("TaskRegistry draws a new id on collision", "[registry]") {
    TempDir dir;
    std::vector<std::string> sequence{"aaaaaaaa", "aaaaaaaa", "", "bbbbbbbb"};
    size_t next = 0;
    auto generator = [&sequence, &next] { return sequence[next++]; };

    auto registry = TaskRegistry::init(Store(dir / "data.json"), model::now, generator);
    REQUIRE(registry.has_value());

    auto first = registry->add("one");
    auto second = registry->add("two");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->id == "aaaaaaaa");
    CHECK(second->id == "bbbbbbbb");
    CHECK(next == 4);
}

TEST_CASE("TaskRegistry update", "[registry]") {
    TempDir dir;
    Timestamp current{std::chrono::milliseconds{1714566896000}};
    auto clock = [&current] { return current; };

    auto registry = TaskRegistry::init(Store(dir / "data.json"), clock);
    REQUIRE(registry.has_value());

    auto created = registry->add("Buy milk");
    REQUIRE(created.has_value());
    REQUIRE(registry->add("Walk dog").has_value());

    SECTION("status change keeps the other fields") {
        current += std::chrono::minutes{5};
        auto updated = registry->update(created->id, TaskPatch{.status = TaskStatus::Done});
        REQUIRE(updated.has_value());
        CHECK(updated->status == TaskStatus::Done);
        CHECK(updated->id == created->id);
        CHECK(updated->description == created->description);
        CHECK(updated->created_at == created->created_at);
        CHECK(updated->updated_at == current);
    }

    SECTION("description edit keeps position and status") {
        current += std::chrono::seconds{1};
        auto updated = registry->update(created->id, TaskPatch{.description = "Buy oat milk"});
        REQUIRE(updated.has_value());
        CHECK(updated->status == TaskStatus::Todo);

        auto tasks = registry->list();
        REQUIRE(tasks.size() == 2);
        CHECK(tasks[0].id == created->id);
        CHECK(tasks[0].description == "Buy oat milk");
        CHECK(tasks[1].description == "Walk dog");
    }

    SECTION("any status may follow any other") {
        for (auto status : {TaskStatus::InProgress, TaskStatus::Done, TaskStatus::Todo,
                            TaskStatus::Done, TaskStatus::InProgress, TaskStatus::Todo}) {
            auto updated = registry->update(created->id, TaskPatch{.status = status});
            REQUIRE(updated.has_value());
            CHECK(updated->status == status);
        }
    }

    SECTION("updatedAt never moves backwards") {
        current -= std::chrono::hours{1};
        auto updated = registry->update(created->id, TaskPatch{.status = TaskStatus::InProgress});
        REQUIRE(updated.has_value());
        CHECK(updated->updated_at == created->updated_at);
        CHECK(updated->updated_at >= updated->created_at);
    }

    SECTION("updates are persisted") {
        REQUIRE(registry->update(created->id, TaskPatch{.status = TaskStatus::Done}).has_value());
        auto reloaded = Store(dir / "data.json").load();
        REQUIRE(reloaded.has_value());
        CHECK(reloaded->front().status == TaskStatus::Done);
    }

    SECTION("unknown id is not found") {
        auto before = registry->list();
        auto updated = registry->update("ffffffff", TaskPatch{.status = TaskStatus::Done});
        REQUIRE(!updated.has_value());
        CHECK(updated.error().is_not_found());
        CHECK(updated.error().message() == "Task ID \"ffffffff\" not found!");
        CHECK(registry->list() == before);
    }

    SECTION("blank description is rejected") {
        auto updated = registry->update(created->id, TaskPatch{.description = " "});
        REQUIRE(!updated.has_value());
        CHECK(updated.error().is_validation());
        CHECK(registry->find(created->id)->description == "Buy milk");
    }
}

TEST_CASE("TaskRegistry remove", "[registry]") {
    TempDir dir;
    auto registry = open_registry(dir / "data.json");

    auto first = registry.add("one");
    auto second = registry.add("two");
    auto third = registry.add("three");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(third.has_value());

    SECTION("removes exactly one task") {
        REQUIRE(registry.remove(second->id).has_value());
        CHECK(registry.size() == 2);
        CHECK(!registry.find(second->id).has_value());

        auto tasks = registry.list();
        CHECK(tasks[0].id == first->id);
        CHECK(tasks[1].id == third->id);

        auto reloaded = Store(dir / "data.json").load();
        REQUIRE(reloaded.has_value());
        CHECK(*reloaded == tasks);
    }

    SECTION("unknown id leaves the collection unchanged") {
        auto before = registry.list();
        auto removed = registry.remove("ffffffff");
        REQUIRE(!removed.has_value());
        CHECK(removed.error().is_not_found());
        CHECK(registry.list() == before);
    }
}

TEST_CASE("TaskRegistry list filters by status", "[registry]") {
    TempDir dir;
    auto registry = open_registry(dir / "data.json");

    auto a = registry.add("a");
    auto b = registry.add("b");
    auto c = registry.add("c");
    auto d = registry.add("d");
    REQUIRE((a && b && c && d));

    REQUIRE(registry.update(a->id, TaskPatch{.status = TaskStatus::Done}).has_value());
    REQUIRE(registry.update(c->id, TaskPatch{.status = TaskStatus::Done}).has_value());
    REQUIRE(registry.update(d->id, TaskPatch{.status = TaskStatus::InProgress}).has_value());

    SECTION("exact status subset in original order") {
        auto done = registry.list("done");
        REQUIRE(done.size() == 2);
        CHECK(done[0].id == a->id);
        CHECK(done[1].id == c->id);

        auto todo = registry.list("todo");
        REQUIRE(todo.size() == 1);
        CHECK(todo[0].id == b->id);

        auto in_progress = registry.list("in-progress");
        REQUIRE(in_progress.size() == 1);
        CHECK(in_progress[0].id == d->id);
    }

    SECTION("no filter returns everything") {
        CHECK(registry.list().size() == 4);
        CHECK(registry.list("").size() == 4);
    }

    SECTION("unrecognized filters match nothing") {
        CHECK(registry.list("finished").empty());
        CHECK(registry.list("DONE").empty());
    }

    SECTION("listing does not write") {
        auto before = std::filesystem::last_write_time(dir / "data.json");
        auto content = read_file(dir / "data.json");
        (void)registry.list("done");
        CHECK(read_file(dir / "data.json") == content);
        CHECK(std::filesystem::last_write_time(dir / "data.json") == before);
    }
}

TEST_CASE("TaskRegistry rolls back when the store cannot be written", "[registry]") {
    TempDir dir;
    auto path = dir / "blocked" / "data.json";
    auto registry = open_registry(path);

    auto task = registry.add("Buy milk");
    REQUIRE(task.has_value());
    auto before = registry.list();

    block_directory(path);

    SECTION("add") {
        auto added = registry.add("Walk dog");
        REQUIRE(!added.has_value());
        CHECK(added.error().is_storage());
        CHECK(registry.list() == before);
    }

    SECTION("update") {
        auto updated = registry.update(task->id, TaskPatch{.status = TaskStatus::Done});
        REQUIRE(!updated.has_value());
        CHECK(updated.error().is_storage());
        CHECK(registry.list() == before);
    }

    SECTION("remove") {
        auto removed = registry.remove(task->id);
        REQUIRE(!removed.has_value());
        CHECK(removed.error().is_storage());
        CHECK(registry.list() == before);
    }
}

TEST_CASE("Task lifecycle scenario", "[registry][scenario]") {
    TempDir dir;
    auto registry = open_registry(dir / "data.json");

    auto t1 = registry.add("Buy milk");
    REQUIRE(t1.has_value());
    CHECK(t1->status == TaskStatus::Todo);

    REQUIRE(registry.update(t1->id, TaskPatch{.status = TaskStatus::Done}).has_value());
    auto done = registry.list("done");
    REQUIRE(done.size() == 1);
    CHECK(done[0].id == t1->id);
    CHECK(done[0].description == "Buy milk");
    CHECK(done[0].status == TaskStatus::Done);

    REQUIRE(registry.remove(t1->id).has_value());
    CHECK(registry.list().empty());

    auto again = registry.remove(t1->id);
    REQUIRE(!again.has_value());
    CHECK(again.error().is_not_found());
}

#include <catch2/catch.hpp>

#include "MemoryStorage.hpp"
#include "TaskQueries.hpp"

namespace {

std::vector<Task> board() {
    return {makeTask("Task 1", "Write SCRIPT", 3, "Todo", "Backend"),
            makeTask("Deploy", "Ship it", 1, "In Progress", "Ops"),
            makeTask("Review", "Read the script diff", 3, "todo", "backend"),
            makeTask("Plan", "Sprint planning", 5, "Todo", "Backend")};
}

QStringList titles(const std::vector<Task> &tasks) {
    QStringList out;
    for (const Task &task : tasks) {
        out << task.title;
    }
    return out;
}

} // END NAMESPACE

TEST_CASE("project filter is exact and case-sensitive") {
    const auto tasks = board();
    CHECK(titles(filterByProject(tasks, "Backend")) ==
          QStringList{"Task 1", "Plan"});
    CHECK(titles(filterByProject(tasks, "backend")) == QStringList{"Review"});
    CHECK(filterByProject(tasks, "Back").empty());
}

TEST_CASE("status filter is exact and case-sensitive") {
    const auto tasks = board();
    CHECK(titles(filterByStatus(tasks, "Todo")) ==
          QStringList{"Task 1", "Plan"});
    CHECK(titles(filterByStatus(tasks, "In Progress")) ==
          QStringList{"Deploy"});
    CHECK(filterByStatus(tasks, "Done").empty());
}

TEST_CASE("priority filter returns exactly the matching priority") {
    const auto tasks = board();
    const auto threes = filterByPriority(tasks, 3);
    CHECK(titles(threes) == QStringList{"Task 1", "Review"});
    for (const Task &task : threes) {
        CHECK(task.priority == 3);
    }
    CHECK(filterByPriority(tasks, 4).empty());
}

TEST_CASE("search matches title or description ignoring case") {
    const auto tasks = board();

    CHECK(titles(searchTasks(tasks, "scri")) ==
          QStringList{"Task 1", "Review"});
    CHECK(titles(searchTasks(tasks, "SCRI")) ==
          QStringList{"Task 1", "Review"});
    CHECK(titles(searchTasks(tasks, "deploy")) == QStringList{"Deploy"});
    CHECK(searchTasks(tasks, "nothing like this").empty());
    CHECK(searchTasks(tasks, "").size() == tasks.size());
}

TEST_CASE("queries are idempotent and leave the collection untouched") {
    const auto tasks = board();

    CHECK(searchTasks(tasks, "script") == searchTasks(tasks, "script"));
    CHECK(filterByProject(tasks, "Backend") ==
          filterByProject(tasks, "Backend"));
    CHECK(filterByPriority(tasks, 3) == filterByPriority(tasks, 3));
    CHECK(tasks == board());
}

TEST_CASE("findFirstByTitle returns the first of duplicate titles") {
    std::vector<Task> tasks = board();
    tasks.push_back(makeTask("Task 1", "Second copy", 9, "Done", "Other"));

    Task *found = findFirstByTitle(tasks, "Task 1");
    REQUIRE(found != nullptr);
    CHECK(found == &tasks.front());
    CHECK(countByTitle(tasks, "Task 1") == 2);

    CHECK(findFirstByTitle(tasks, "task 1") == nullptr);
    CHECK(countByTitle(tasks, "Ghost") == 0);
}

TEST_CASE("removeByTitle drops every exact match") {
    std::vector<Task> tasks = sampleTasks();
    tasks.push_back(makeTask("Task 1", "Duplicate", 4, "Todo", "Project"));

    CHECK(removeByTitle(tasks, "Task 1") == 2);
    CHECK(titles(tasks) == QStringList{"Task 2"});

    CHECK(removeByTitle(tasks, "Ghost") == 0);
    CHECK(titles(tasks) == QStringList{"Task 2"});
}

TEST_CASE("queries on an empty collection return nothing") {
    std::vector<Task> tasks;
    CHECK(filterByProject(tasks, "Project").empty());
    CHECK(filterByStatus(tasks, "Todo").empty());
    CHECK(filterByPriority(tasks, 0).empty());
    CHECK(searchTasks(tasks, "x").empty());
    CHECK(findFirstByTitle(tasks, "x") == nullptr);
    CHECK(removeByTitle(tasks, "x") == 0);
}

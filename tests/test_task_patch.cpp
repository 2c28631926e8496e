#include <catch2/catch.hpp>

#include "MemoryStorage.hpp"
#include "TaskPatch.hpp"
#include "Validation.hpp"

TEST_CASE("priority text must be an integer between 0 and 255") {
    CHECK(parsePriority("0").value() == 0);
    CHECK(parsePriority("3").value() == 3);
    CHECK(parsePriority("255").value() == 255);

    for (const char *bad : {"256", "-1", "abc", "", "1.5", "1000000000000"}) {
        auto parsed = parsePriority(bad);
        INFO("input: " << bad);
        REQUIRE_FALSE(parsed.isOk());
        CHECK(parsed.error().kind() == TaskError::Kind::Validation);
        CHECK(parsed.error().message() == "Invalid priority");
    }
}

TEST_CASE("priority text with surrounding whitespace is rejected") {
    for (const char *bad : {" 5", "5 ", "\t7", " 255\n"}) {
        auto parsed = parsePriority(bad);
        INFO("input: '" << bad << "'");
        REQUIRE_FALSE(parsed.isOk());
        CHECK(parsed.error().kind() == TaskError::Kind::Validation);
    }
}

TEST_CASE("title must be non-empty") {
    CHECK(validateTitle("Task 1").isOk());

    const Status empty = validateTitle("");
    REQUIRE_FALSE(empty.isOk());
    CHECK(empty.error().kind() == TaskError::Kind::Validation);
}

TEST_CASE("patch applies only the supplied fields") {
    Task task = makeTask("Task 1", "Description 1", 1, "Todo", "Project");

    TaskPatch patch;
    patch.description = QString("Updated Description");
    REQUIRE(applyTaskPatch(task, patch).isOk());

    CHECK(task.description == "Updated Description");
    CHECK(task.priority == 1);
    CHECK(task.status == "Todo");
    CHECK(task.project == "Project");
    CHECK(task.title == "Task 1");
}

TEST_CASE("patch can set every optional field at once") {
    Task task = makeTask("Task 1", "Description 1", 1, "Todo", "Project");

    TaskPatch patch;
    patch.description = QString("New");
    patch.priority = QString("42");
    patch.status = QString("Done");
    patch.project = QString("Other");
    REQUIRE(applyTaskPatch(task, patch).isOk());

    CHECK(task == makeTask("Task 1", "New", 42, "Done", "Other"));
}

TEST_CASE("invalid priority rejects the whole patch") {
    const Task original =
        makeTask("Task 1", "Description 1", 1, "Todo", "Project");
    Task task = original;

    TaskPatch patch;
    patch.description = QString("Should not land");
    patch.priority = QString("300");
    patch.status = QString("Done");

    const Status applied = applyTaskPatch(task, patch);
    REQUIRE_FALSE(applied.isOk());
    CHECK(applied.error().kind() == TaskError::Kind::Validation);
    CHECK(task == original);
}

TEST_CASE("empty patch is recognised and changes nothing") {
    TaskPatch patch;
    CHECK(patch.isEmpty());

    Task task = makeTask("Task 1", "Description 1", 1, "Todo", "Project");
    REQUIRE(applyTaskPatch(task, patch).isOk());
    CHECK(task == makeTask("Task 1", "Description 1", 1, "Todo", "Project"));

    patch.status = QString("Done");
    CHECK_FALSE(patch.isEmpty());
}

TEST_CASE("patch may set a field to an empty string") {
    Task task = makeTask("Task 1", "Description 1", 1, "Todo", "Project");

    TaskPatch patch;
    patch.project = QString();
    REQUIRE(applyTaskPatch(task, patch).isOk());
    CHECK(task.project.isEmpty());
}

#include <catch2/catch.hpp>

#include "JsonUtils.hpp"
#include "MemoryStorage.hpp"

TEST_CASE("task list decodes in stored order") {
    const QByteArray json = R"([
        {"title": "Task 1", "description": "Description 1", "priority": 1,
         "status": "Todo", "project": "Project"},
        {"title": "Task 2", "description": "Description 2", "priority": 2,
         "status": "In Progress", "project": "Project"}
    ])";

    auto tasks = fromJsonTaskList(json);
    REQUIRE(tasks.isOk());
    REQUIRE(tasks.value() == sampleTasks());
}

TEST_CASE("task decoding rejects structural mismatches") {
    auto expectDecodeError = [](const QByteArray &json) {
        auto tasks = fromJsonTaskList(json);
        REQUIRE_FALSE(tasks.isOk());
        CHECK(tasks.error().kind() == TaskError::Kind::Decode);
    };

    SECTION("missing key") {
        expectDecodeError(R"([{"title": "T", "description": "D",
                               "priority": 1, "status": "Todo"}])");
    }
    SECTION("wrong type for a string field") {
        expectDecodeError(R"([{"title": 5, "description": "D", "priority": 1,
                               "status": "Todo", "project": "P"}])");
    }
    SECTION("priority given as a string") {
        expectDecodeError(R"([{"title": "T", "description": "D",
                               "priority": "1", "status": "Todo",
                               "project": "P"}])");
    }
    SECTION("priority out of range") {
        expectDecodeError(R"([{"title": "T", "description": "D",
                               "priority": 256, "status": "Todo",
                               "project": "P"}])");
        expectDecodeError(R"([{"title": "T", "description": "D",
                               "priority": -1, "status": "Todo",
                               "project": "P"}])");
    }
    SECTION("fractional priority") {
        expectDecodeError(R"([{"title": "T", "description": "D",
                               "priority": 2.5, "status": "Todo",
                               "project": "P"}])");
    }
    SECTION("top level is not an array") {
        expectDecodeError(R"({"title": "T"})");
    }
    SECTION("array element is not an object") {
        expectDecodeError(R"(["Task 1"])");
    }
    SECTION("malformed JSON") {
        expectDecodeError("[{\"title\": ");
    }
}

TEST_CASE("missing key error names the field") {
    auto tasks = fromJsonTaskList(R"([{"title": "T", "description": "D",
                                       "priority": 1, "project": "P"}])");
    REQUIRE_FALSE(tasks.isOk());
    CHECK(tasks.error().details().value("field").toString() == "status");
    CHECK(tasks.error().message().contains("status"));
}

TEST_CASE("priority bounds 0 and 255 decode") {
    auto tasks = fromJsonTaskList(R"([
        {"title": "Low", "description": "", "priority": 0, "status": "",
         "project": ""},
        {"title": "High", "description": "", "priority": 255, "status": "",
         "project": ""}
    ])");
    REQUIRE(tasks.isOk());
    REQUIRE(tasks.value().size() == 2);
    CHECK(tasks.value()[0].priority == 0);
    CHECK(tasks.value()[1].priority == 255);
}

TEST_CASE("encoded task list is pretty-printed with stable key order") {
    const QString text = QString::fromUtf8(toJsonTaskList(sampleTasks()));

    CHECK(text.startsWith("["));
    CHECK(text.contains("\n    {"));

    const int description = text.indexOf("\"description\"");
    const int priority = text.indexOf("\"priority\"");
    const int project = text.indexOf("\"project\"");
    const int status = text.indexOf("\"status\"");
    const int title = text.indexOf("\"title\"");
    REQUIRE(description >= 0);
    CHECK(description < priority);
    CHECK(priority < project);
    CHECK(project < status);
    CHECK(status < title);

    CHECK(toJsonTaskList(sampleTasks()) == toJsonTaskList(sampleTasks()));
}

TEST_CASE("non-ASCII text survives encoding") {
    const std::vector<Task> tasks{
        makeTask("Задача", "Написать скрипт", 7, "Todo", "Проект")};

    auto decoded = fromJsonTaskList(toJsonTaskList(tasks));
    REQUIRE(decoded.isOk());
    CHECK(decoded.value() == tasks);
}

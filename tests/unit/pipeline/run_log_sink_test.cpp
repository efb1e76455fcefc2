#include <catch2/catch_test_macros.hpp>

#include "common/async_test_helpers.h"
#include "common/test_helpers_catch2.h"

#include <ragline/pipeline/run_log_sink.h>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace ragline::pipeline;
using ragline::test::run_awaitable;

TEST_CASE("MemoryRunLogSink - log queries", "[pipeline][runlog]") {
    MemoryRunLogSink sink;
    run_awaitable([&sink]() -> boost::asio::awaitable<void> {
        for (int i = 0; i < 5; ++i) {
            co_await sink.log("run-a", "step", std::to_string(i));
        }
        co_await sink.log("run-b", "step", "b0");
        co_await sink.log("run-c", "step", "c0");
    }());
    CHECK(sink.entryCount() == 7);

    SECTION("newest first with a per-run limit") {
        auto logs = sink.getLogs({"run-a"}, 3);
        REQUIRE(logs.size() == 3);
        CHECK(logs[0].value == "4");
        CHECK(logs[2].value == "2");
    }

    SECTION("only requested runs are returned") {
        auto logs = sink.getLogs({"run-b", "run-c"});
        REQUIRE(logs.size() == 2);
        CHECK(logs[0].runId == "run-c");
        CHECK(logs[1].runId == "run-b");
    }
}

TEST_CASE("MemoryRunLogSink - run info paging and filter", "[pipeline][runlog]") {
    MemoryRunLogSink sink;
    run_awaitable([&sink]() -> boost::asio::awaitable<void> {
        co_await sink.logRunInfo("r1", RunType::Search, "cli");
        co_await sink.logRunInfo("r2", RunType::Rag, "cli");
        co_await sink.logRunInfo("r3", RunType::Search, "api");
        co_await sink.logRunInfo("r4", RunType::Rag, "api");
    }());

    auto all = sink.getRunInfo();
    REQUIRE(all.size() == 4);
    CHECK(all.front().runId == "r4");

    auto page = sink.getRunInfo(1, 2);
    REQUIRE(page.size() == 2);
    CHECK(page[0].runId == "r3");
    CHECK(page[1].runId == "r2");

    auto searches = sink.getRunInfo(0, 10, RunType::Search);
    REQUIRE(searches.size() == 2);
    CHECK(searches[0].runId == "r3");
    CHECK(searches[1].runId == "r1");
}

TEST_CASE("JsonlRunLogSink - appends one object per line", "[pipeline][runlog]") {
    ragline::test::TempDir dir;
    auto path = dir.path() / "logs" / "runs.jsonl";

    auto opened = JsonlRunLogSink::open(path);
    REQUIRE(opened);
    auto sink = opened.value();
    run_awaitable([sink]() -> boost::asio::awaitable<void> {
        co_await sink->logRunInfo("r1", RunType::Rag, "cli");
        co_await sink->log("r1", "search_query", "what is rrf");
    }());

    std::istringstream lines(ragline::test::read_file(path));
    std::vector<nlohmann::json> rows;
    for (std::string line; std::getline(lines, line);) {
        rows.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["run_type"] == "rag");
    CHECK(rows[0]["actor"] == "cli");
    CHECK(rows[1]["run_id"] == "r1");
    CHECK(rows[1]["key"] == "search_query");
    CHECK(rows[1]["value"] == "what is rrf");
    CHECK(rows[1]["timestamp"].get<std::string>().back() == 'Z');
}

TEST_CASE("JsonlRunLogSink - unwritable path is an IOError", "[pipeline][runlog]") {
    ragline::test::TempDir dir;
    auto blocker = ragline::test::write_file(dir.path() / "file", "x");
    auto opened = JsonlRunLogSink::open(blocker / "nested" / "runs.jsonl");
    REQUIRE_FALSE(opened);
    CHECK(opened.error().code == ragline::ErrorCode::IOError);
}

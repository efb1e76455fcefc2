#include <catch2/catch_test_macros.hpp>

#include "common/async_test_helpers.h"

#include <ragline/pipeline/run_context.h>
#include <ragline/pipeline/run_log_sink.h>

#include <optional>
#include <stdexcept>
#include <string>

using namespace ragline::pipeline;
using ragline::ErrorCode;
using ragline::test::run_awaitable;

TEST_CASE("RunType - string round trip", "[pipeline][run]") {
    for (auto type : {RunType::Ingestion, RunType::Search, RunType::Rag, RunType::Eval,
                      RunType::Other}) {
        auto parsed = parseRunType(runTypeToString(type));
        REQUIRE(parsed);
        CHECK(parsed.value() == type);
    }
    CHECK(parseRunType("batch").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("RunManager - scope registers and releases a run", "[pipeline][run]") {
    RunManager manager;

    SECTION("fresh run gets a minted id") {
        std::string id;
        {
            auto scope = manager.withRun(RunType::Search);
            id = scope.context().runId;
            CHECK(scope.owns());
            CHECK(id.size() == 36);
            CHECK(manager.isActive(id));
            CHECK(manager.runTypeOf(id) == RunType::Search);
            CHECK(manager.activeRunCount() == 1);
        }
        CHECK_FALSE(manager.isActive(id));
        CHECK(manager.activeRunCount() == 0);
    }

    SECTION("released on exception") {
        std::string id;
        try {
            auto scope = manager.withRun(RunType::Rag);
            id = scope.context().runId;
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        CHECK_FALSE(id.empty());
        CHECK_FALSE(manager.isActive(id));
    }

    SECTION("existing context is reused without taking ownership") {
        auto outer = manager.withRun(RunType::Rag);
        {
            auto inner = manager.withRun(std::optional<RunContext>(outer.context()),
                                         RunType::Search);
            CHECK_FALSE(inner.owns());
            CHECK(inner.context().runId == outer.context().runId);
            CHECK(inner.context().runType == RunType::Rag);
        }
        CHECK(manager.isActive(outer.context().runId));
    }

    SECTION("caller-minted id that is not registered is owned by the scope") {
        RunContext ctx{"caller-run", RunType::Eval};
        {
            auto scope = manager.withRun(std::optional<RunContext>(ctx), RunType::Other);
            CHECK(scope.owns());
            CHECK(manager.runTypeOf("caller-run") == RunType::Eval);
        }
        CHECK_FALSE(manager.isActive("caller-run"));
    }

    SECTION("moved scope releases once") {
        auto first = manager.withRun(RunType::Other);
        auto id = first.context().runId;
        {
            auto second = std::move(first);
            CHECK(second.owns());
            CHECK_FALSE(first.owns());
        }
        CHECK_FALSE(manager.isActive(id));
    }
}

TEST_CASE("RunManager - logRunInfo", "[pipeline][run]") {
    auto sink = std::make_shared<MemoryRunLogSink>();
    RunManager manager(sink);

    SECTION("records the active run") {
        auto scope = manager.withRun(RunType::Search);
        run_awaitable(manager.logRunInfo(scope.context(), "tester"));
        auto info = sink->getRunInfo();
        REQUIRE(info.size() == 1);
        CHECK(info[0].runId == scope.context().runId);
        CHECK(info[0].runType == RunType::Search);
        CHECK(info[0].actor == "tester");
    }

    SECTION("fails without an active run") {
        CHECK_THROWS_WITH(run_awaitable(manager.logRunInfo(RunContext{}, "tester")),
                          "no run id set");
        CHECK_THROWS_AS(run_awaitable(manager.logRunInfo(RunContext{"gone", RunType::Rag}, "x")),
                        std::logic_error);
        CHECK(sink->getRunInfo().empty());
    }
}

TEST_CASE("RunManager - sink failures do not fail the run", "[pipeline][run]") {
    auto sink = std::make_shared<ragline::test::RecordingRunLogSink>();
    sink->failRunInfo = true;
    RunManager manager(sink);

    auto scope = manager.withRun(RunType::Rag);
    CHECK_NOTHROW(run_awaitable(manager.logRunInfo(scope.context(), "tester")));
    CHECK(sink->runInfo.empty());
    CHECK(manager.isActive(scope.context().runId));

    // The active-run check is not a sink failure and still throws.
    CHECK_THROWS_AS(run_awaitable(manager.logRunInfo(RunContext{}, "tester")), std::logic_error);
}

#include <catch2/catch_test_macros.hpp>

#include "common/async_test_helpers.h"

#include <ragline/pipeline/rag_pipeline.h>
#include <ragline/pipeline/run_log_sink.h>

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ragline::pipeline;
using ragline::test::FnPipe;
using ragline::test::pass_through;
using ragline::test::PipeCall;
using ragline::test::run_awaitable;

namespace {

struct RagFixture {
    std::shared_ptr<MemoryRunLogSink> sink = std::make_shared<MemoryRunLogSink>();
    std::shared_ptr<RunManager> manager = std::make_shared<RunManager>(sink);
    std::shared_ptr<SearchPipeline> search = std::make_shared<SearchPipeline>(manager);
    std::shared_ptr<Pipeline> generation = std::make_shared<Pipeline>(manager, RunType::Rag);

    std::vector<std::string> finished;
    std::vector<bool> sawStaleState;
    std::vector<RunContext> searchContexts;
    std::map<std::string, int> delaysMs;

    RagFixture() {
        auto body = [this](PipeCall& call, StreamEmitter& emit) -> boost::asio::awaitable<void> {
            while (auto item = co_await call.input.message->next()) {
                auto query = itemValue(*item).get<std::string>();
                searchContexts.push_back(call.run);
                sawStaleState.push_back(call.state->contains("retrieve"));
                if (auto it = delaysMs.find(query); it != delaysMs.end()) {
                    co_await ragline::test::sleep_for(std::chrono::milliseconds(it->second));
                }
                if (query == "explode") {
                    throw std::runtime_error("retriever failed for " + query);
                }
                (void)call.state->publish("retrieve", {{"output", query}});
                finished.push_back(query);
                co_await emit(Value("hit:" + query));
            }
        };
        REQUIRE(search->addVectorSearchPipe(std::make_shared<FnPipe>("retrieve", body)));
        REQUIRE(generation->addPipe(std::make_shared<FnPipe>("answer", pass_through())));
    }
};

std::vector<Value> strings(std::initializer_list<const char*> items) {
    std::vector<Value> out;
    for (const auto* s : items) {
        out.emplace_back(s);
    }
    return out;
}

} // namespace

TEST_CASE("RagPipeline - pairs follow input order, not completion order", "[pipeline][rag]") {
    RagFixture f;
    f.delaysMs = {{"q1", 60}, {"q2", 5}, {"q3", 20}};
    RagPipeline rag(f.search, f.generation, f.manager);

    auto out = run_awaitable(rag.run(makeStream(strings({"q1", "q2", "q3"}))));

    REQUIRE(out.size() == 3);
    CHECK(out[0]["query"] == "q1");
    CHECK(out[1]["query"] == "q2");
    CHECK(out[2]["query"] == "q3");
    CHECK(out[0]["search_results"]["vector_search_results"] == Value::array({"hit:q1"}));
    CHECK_FALSE(out[0]["search_results"].contains("graph_search_results"));

    // The searches ran concurrently: the short ones completed first.
    CHECK(f.finished == std::vector<std::string>{"q2", "q3", "q1"});
}

TEST_CASE("RagPipeline - each query searches against fresh state", "[pipeline][rag]") {
    RagFixture f;
    RagPipeline rag(f.search, f.generation, f.manager);
    run_awaitable(rag.run(makeStream(strings({"a", "b", "c"}))));
    REQUIRE(f.sawStaleState.size() == 3);
    for (bool stale : f.sawStaleState) {
        CHECK_FALSE(stale);
    }
}

TEST_CASE("RagPipeline - one run id across search and generation", "[pipeline][rag]") {
    RagFixture f;
    RagPipeline rag(f.search, f.generation, f.manager);
    RunOptions options;
    options.actor = "tester";
    run_awaitable(rag.run(makeStream(strings({"a", "b"})), options));

    auto info = f.sink->getRunInfo();
    REQUIRE(info.size() == 1);
    CHECK(info[0].runType == RunType::Rag);
    CHECK(info[0].actor == "tester");

    REQUIRE(f.searchContexts.size() == 2);
    for (const auto& ctx : f.searchContexts) {
        CHECK(ctx.runId == info[0].runId);
        CHECK(ctx.runType == RunType::Rag);
    }
    CHECK(f.manager->activeRunCount() == 0);
}

TEST_CASE("RagPipeline - a failed search aborts the run", "[pipeline][rag]") {
    RagFixture f;
    RagPipeline rag(f.search, f.generation, f.manager);

    CHECK_THROWS_WITH(run_awaitable(rag.run(makeStream(strings({"ok", "explode", "later"})))),
                      "retriever failed for explode");
    // Searches already in flight were allowed to finish.
    CHECK(f.finished.size() == 2);
}

TEST_CASE("RagPipeline - streamed output keeps the run open until consumed",
          "[pipeline][rag]") {
    RagFixture f;
    RagPipeline rag(f.search, f.generation, f.manager);

    run_awaitable([&]() -> boost::asio::awaitable<void> {
        auto stream = co_await rag.runStream(makeStream(strings({"s1", "s2"})));
        CHECK(f.manager->activeRunCount() == 1);
        auto first = co_await stream->next();
        REQUIRE(first.has_value());
        CHECK(itemValue(*first)["query"] == "s1");
        while (co_await stream->next()) {
        }
        CHECK(f.manager->activeRunCount() == 0);
    }());
}

TEST_CASE("RagPipeline - requires both pipelines", "[pipeline][rag]") {
    auto search = std::make_shared<SearchPipeline>();
    auto generation = std::make_shared<Pipeline>();
    CHECK_THROWS_AS(RagPipeline(nullptr, generation), std::invalid_argument);
    CHECK_THROWS_AS(RagPipeline(search, nullptr), std::invalid_argument);
    RagPipeline rag(search, generation);
    CHECK(rag.runType() == RunType::Rag);
}

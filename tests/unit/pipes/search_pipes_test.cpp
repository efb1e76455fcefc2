#include <catch2/catch_test_macros.hpp>

#include "common/async_test_helpers.h"

#include <ragline/pipeline/run_log_sink.h>
#include <ragline/pipeline/search_pipeline.h>
#include <ragline/pipes/graph_search_pipe.h>
#include <ragline/pipes/query.h>
#include <ragline/pipes/vector_search_pipe.h>
#include <ragline/providers/in_memory_providers.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ragline;
using pipeline::Value;
using test::run_awaitable;

namespace {

struct Corpus {
    std::shared_ptr<providers::HashEmbeddingProvider> embedder =
        std::make_shared<providers::HashEmbeddingProvider>();
    std::shared_ptr<providers::InMemorySearchProvider> index =
        std::make_shared<providers::InMemorySearchProvider>(embedder);
    std::shared_ptr<providers::InMemoryGraphProvider> graph =
        std::make_shared<providers::InMemoryGraphProvider>();

    Corpus() {
        REQUIRE(index->addDocument({"rrf", "reciprocal rank fusion merges ranked lists", nlohmann::json::object()}));
        REQUIRE(index->addDocument({"bm25", "bm25 scores keyword matches", nlohmann::json::object()}));
        REQUIRE(graph->addEntity({"Rank Fusion", "combining rankings", {"BM25"}}));
        REQUIRE(graph->addEntity({"BM25", "keyword scoring", {}}));
    }
};

// Always fails, to check error propagation out of a branch.
class OfflineSearchProvider final : public providers::SearchProvider {
public:
    boost::asio::awaitable<Result<std::vector<providers::SearchResult>>>
    semanticSearch(const std::vector<float>&, const pipeline::SearchSettings&) override {
        co_return Error{ErrorCode::IOError, "index offline"};
    }
    boost::asio::awaitable<Result<std::vector<providers::SearchResult>>>
    fullTextSearch(const std::string&, const pipeline::SearchSettings&) override {
        co_return Error{ErrorCode::IOError, "index offline"};
    }
    boost::asio::awaitable<Result<std::vector<providers::SearchResult>>>
    hybridSearch(const std::string&, const std::vector<float>&,
                 const pipeline::SearchSettings&) override {
        co_return Error{ErrorCode::IOError, "index offline"};
    }
};

} // namespace

TEST_CASE("extractQuery - accepts strings and query objects", "[pipes][query]") {
    CHECK(pipes::extractQuery(Value("plain")) == "plain");
    CHECK(pipes::extractQuery(Value{{"query", "wrapped"}}) == "wrapped");
    CHECK_THROWS_AS(pipes::extractQuery(Value(42)), std::invalid_argument);
    CHECK_THROWS_AS(pipes::extractQuery(Value{{"q", "x"}}), std::invalid_argument);
}

TEST_CASE("VectorSearchPipe - emits hits and publishes them", "[pipes][vector]") {
    Corpus corpus;
    auto sink = std::make_shared<pipeline::MemoryRunLogSink>();
    auto manager = std::make_shared<pipeline::RunManager>(sink);
    pipeline::Pipeline p(manager, pipeline::RunType::Search);
    REQUIRE(p.addPipe(std::make_shared<pipes::VectorSearchPipe>(corpus.embedder, corpus.index)));

    pipeline::RunSettings settings;
    settings.search.useFullTextSearch = true;
    pipeline::RunOptions options;
    options.settings = std::make_shared<const pipeline::RunSettings>(settings);
    options.state = std::make_shared<pipeline::StateStore>();

    auto out = run_awaitable(p.run(pipeline::makeStream({"rank fusion"}), options));
    REQUIRE(out.size() == 1);
    CHECK(out[0]["id"] == "rrf");
    CHECK(out[0].contains("score"));

    auto published = options.state->read("vector_search", "output");
    REQUIRE(published);
    CHECK(published.value().size() == 1);

    auto info = sink->getRunInfo();
    REQUIRE(info.size() == 1);
    auto logs = sink->getLogs({info[0].runId});
    std::vector<std::string> keys;
    for (const auto& e : logs) {
        keys.push_back(e.key);
    }
    // Entries still queued when the stage finished may have been discarded, never reordered.
    for (const auto& key : keys) {
        CHECK((key == "search_query" || key == "search_results"));
    }
}

TEST_CASE("VectorSearchPipe - semantic and hybrid strategies", "[pipes][vector]") {
    Corpus corpus;
    pipeline::Pipeline p;
    REQUIRE(p.addPipe(std::make_shared<pipes::VectorSearchPipe>(corpus.embedder, corpus.index)));

    pipeline::RunSettings settings;
    settings.search.limit = 1;
    pipeline::RunOptions options;
    options.settings = std::make_shared<const pipeline::RunSettings>(settings);

    auto semantic = run_awaitable(p.run(pipeline::makeStream({"bm25 keyword"}), options));
    REQUIRE(semantic.size() == 1);
    CHECK(semantic[0]["id"] == "bm25");

    settings.search.useHybridSearch = true;
    options.settings = std::make_shared<const pipeline::RunSettings>(settings);
    auto hybrid =
        run_awaitable(p.run(pipeline::makeStream({Value{{"query", "bm25 keyword"}}}), options));
    REQUIRE(hybrid.size() == 1);
    CHECK(hybrid[0]["id"] == "bm25");
    CHECK(hybrid[0]["score"].get<double>() < 1.0);
}

TEST_CASE("VectorSearchPipe - provider errors fail the stage", "[pipes][vector]") {
    pipeline::Pipeline p;
    REQUIRE(p.addPipe(std::make_shared<pipes::VectorSearchPipe>(
        std::make_shared<providers::HashEmbeddingProvider>(),
        std::make_shared<OfflineSearchProvider>())));
    CHECK_THROWS_WITH(run_awaitable(p.run(pipeline::makeStream({"anything"}))),
                      "vector search failed: index offline");

    CHECK_THROWS_AS(pipes::VectorSearchPipe(nullptr, std::make_shared<OfflineSearchProvider>()),
                    std::invalid_argument);
}

TEST_CASE("GraphSearchPipe - local search hits", "[pipes][graph]") {
    Corpus corpus;
    pipeline::Pipeline p;
    REQUIRE(p.addPipe(std::make_shared<pipes::GraphSearchPipe>(corpus.graph)));

    pipeline::RunOptions options;
    options.state = std::make_shared<pipeline::StateStore>();
    auto out = run_awaitable(p.run(pipeline::makeStream({"rank fusion"}), options));
    REQUIRE(out.size() == 2);
    CHECK(out[0]["id"] == "Rank Fusion");
    CHECK(out[1]["id"] == "BM25");
    CHECK(out[1]["metadata"]["type"] == "neighbor");
    CHECK(options.state->contains("graph_search", "output"));
}

TEST_CASE("Search pipes - fan-out over both providers", "[pipes][search]") {
    Corpus corpus;
    pipeline::SearchPipeline search;
    REQUIRE(search.addVectorSearchPipe(
        std::make_shared<pipes::VectorSearchPipe>(corpus.embedder, corpus.index)));
    REQUIRE(search.addGraphSearchPipe(std::make_shared<pipes::GraphSearchPipe>(corpus.graph)));

    pipeline::RunSettings settings;
    settings.search.useGraphSearch = true;
    settings.search.useFullTextSearch = true;
    pipeline::RunOptions options;
    options.settings = std::make_shared<const pipeline::RunSettings>(settings);

    auto result = run_awaitable(search.run(pipeline::makeStream({"rank fusion"}), options));
    REQUIRE(result.vectorResults.has_value());
    REQUIRE(result.graphResults.has_value());
    CHECK(result.vectorResults->front()["id"] == "rrf");
    CHECK(result.graphResults->front()["id"] == "Rank Fusion");
}

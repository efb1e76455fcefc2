#include <ragline/pipes/query.h>
#include <ragline/pipes/vector_search_pipe.h>

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace ragline::pipes {

VectorSearchPipe::VectorSearchPipe(std::shared_ptr<providers::EmbeddingProvider> embedder,
                                   std::shared_ptr<providers::SearchProvider> search,
                                   Config config)
    : Pipe(pipeline::PipeConfig{std::move(config.name), config.maxLogQueueSize}),
      embedder_(std::move(embedder)),
      search_(std::move(search)) {
    if (!embedder_ || !search_) {
        throw std::invalid_argument("VectorSearchPipe requires embedding and search providers");
    }
}

pipeline::StreamPtr VectorSearchPipe::logic(pipeline::PipeInput input,
                                            std::shared_ptr<pipeline::StateStore> state,
                                            pipeline::RunContext runContext,
                                            pipeline::PipeLogger logger) {
    return pipeline::makeGenerator(
        [this, input = std::move(input), state, runContext,
         logger](pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
            const auto& settings = input.settings->search;
            while (auto item = co_await input.message->next()) {
                auto query = extractQuery(pipeline::itemValue(*item));
                logger.log("search_query", query);

                Result<std::vector<providers::SearchResult>> found =
                    std::vector<providers::SearchResult>{};
                if (settings.useHybridSearch) {
                    auto vec = co_await embedder_->embed(query);
                    if (!vec) {
                        throw std::runtime_error("embedding failed: " + vec.error().message);
                    }
                    found = co_await search_->hybridSearch(query, vec.value(), settings);
                } else if (settings.useFullTextSearch) {
                    found = co_await search_->fullTextSearch(query, settings);
                } else {
                    auto vec = co_await embedder_->embed(query);
                    if (!vec) {
                        throw std::runtime_error("embedding failed: " + vec.error().message);
                    }
                    found = co_await search_->semanticSearch(vec.value(), settings);
                }
                if (!found) {
                    throw std::runtime_error("vector search failed: " + found.error().message);
                }

                pipeline::Value results = pipeline::Value::array();
                for (const auto& r : found.value()) {
                    results.push_back(pipeline::Value(r));
                }
                spdlog::debug("[VectorSearchPipe] run {} '{}' -> {} result(s)", runContext.runId,
                              query, results.size());
                logger.log("search_results", results);

                auto published = state->publish(name(), {{"output", results}});
                if (!published) {
                    throw std::runtime_error(published.error().message);
                }
                for (auto& r : results) {
                    co_await emit(std::move(r));
                }
            }
        });
}

} // namespace ragline::pipes

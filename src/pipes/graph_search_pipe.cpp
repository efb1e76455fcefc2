#include <ragline/pipes/graph_search_pipe.h>
#include <ragline/pipes/query.h>

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace ragline::pipes {

GraphSearchPipe::GraphSearchPipe(std::shared_ptr<providers::GraphSearchProvider> graph,
                                 Config config)
    : Pipe(pipeline::PipeConfig{std::move(config.name), config.maxLogQueueSize}),
      graph_(std::move(graph)) {
    if (!graph_) {
        throw std::invalid_argument("GraphSearchPipe requires a graph provider");
    }
}

pipeline::StreamPtr GraphSearchPipe::logic(pipeline::PipeInput input,
                                           std::shared_ptr<pipeline::StateStore> state,
                                           pipeline::RunContext runContext,
                                           pipeline::PipeLogger logger) {
    return pipeline::makeGenerator(
        [this, input = std::move(input), state, runContext,
         logger](pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
            while (auto item = co_await input.message->next()) {
                auto query = extractQuery(pipeline::itemValue(*item));
                logger.log("search_query", query);

                auto found = co_await graph_->localSearch(query, input.settings->search);
                if (!found) {
                    throw std::runtime_error("graph search failed: " + found.error().message);
                }

                pipeline::Value results = pipeline::Value::array();
                for (const auto& r : found.value()) {
                    results.push_back(pipeline::Value(r));
                }
                spdlog::debug("[GraphSearchPipe] run {} '{}' -> {} result(s)", runContext.runId,
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

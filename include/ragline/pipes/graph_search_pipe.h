#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <ragline/pipeline/pipe.h>
#include <ragline/providers/providers.h>

namespace ragline::pipes {

// Graph branch stage: local search per input query, one SearchResult object per hit.
class GraphSearchPipe final : public pipeline::Pipe {
public:
    struct Config {
        std::string name = "graph_search";
        std::size_t maxLogQueueSize = 100;
    };

    GraphSearchPipe(std::shared_ptr<providers::GraphSearchProvider> graph, Config config);
    explicit GraphSearchPipe(std::shared_ptr<providers::GraphSearchProvider> graph)
        : GraphSearchPipe(std::move(graph), Config{}) {}

protected:
    pipeline::StreamPtr logic(pipeline::PipeInput input,
                              std::shared_ptr<pipeline::StateStore> state,
                              pipeline::RunContext runContext, pipeline::PipeLogger logger) override;

private:
    std::shared_ptr<providers::GraphSearchProvider> graph_;
};

} // namespace ragline::pipes

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <ragline/pipeline/pipe.h>
#include <ragline/providers/providers.h>

namespace ragline::pipes {

/**
 * Vector branch stage: each input query is searched with the strategy chosen by the call's
 * SearchSettings (hybrid, full-text, or semantic by default) and every hit is emitted as a
 * SearchResult object. The hits of the last query are published under "output".
 */
class VectorSearchPipe final : public pipeline::Pipe {
public:
    struct Config {
        std::string name = "vector_search";
        std::size_t maxLogQueueSize = 100;
    };

    VectorSearchPipe(std::shared_ptr<providers::EmbeddingProvider> embedder,
                     std::shared_ptr<providers::SearchProvider> search, Config config);
    VectorSearchPipe(std::shared_ptr<providers::EmbeddingProvider> embedder,
                     std::shared_ptr<providers::SearchProvider> search)
        : VectorSearchPipe(std::move(embedder), std::move(search), Config{}) {}

protected:
    pipeline::StreamPtr logic(pipeline::PipeInput input,
                              std::shared_ptr<pipeline::StateStore> state,
                              pipeline::RunContext runContext, pipeline::PipeLogger logger) override;

private:
    std::shared_ptr<providers::EmbeddingProvider> embedder_;
    std::shared_ptr<providers::SearchProvider> search_;
};

} // namespace ragline::pipes

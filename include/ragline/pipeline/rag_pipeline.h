#pragma once

#include <memory>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <ragline/pipeline/pipeline.h>
#include <ragline/pipeline/search_pipeline.h>

namespace ragline::pipeline {

/**
 * @brief Search per query, then generate.
 *
 * Every input query gets its own concurrent SearchPipeline run (with its own state) as soon as
 * it is read. Results are paired with their queries as {"query": q, "search_results": r} and fed
 * to the generation pipeline in input order, whatever order the searches finish in. A failed
 * search is rethrown when its turn comes and aborts the run; searches for later queries are left
 * to finish in the background.
 */
class RagPipeline {
public:
    RagPipeline(std::shared_ptr<SearchPipeline> searchPipeline,
                std::shared_ptr<Pipeline> generationPipeline,
                std::shared_ptr<RunManager> runManager = nullptr);

    RagPipeline(const RagPipeline&) = delete;
    RagPipeline& operator=(const RagPipeline&) = delete;

    boost::asio::awaitable<std::vector<Value>> run(StreamPtr queries, RunOptions options = {});

    boost::asio::awaitable<StreamPtr> runStream(StreamPtr queries, RunOptions options = {});

    RunType runType() const { return RunType::Rag; }
    const std::shared_ptr<SearchPipeline>& searchPipeline() const { return searchPipeline_; }
    const std::shared_ptr<Pipeline>& generationPipeline() const { return generationPipeline_; }

private:
    std::shared_ptr<SearchPipeline> searchPipeline_;
    std::shared_ptr<Pipeline> generationPipeline_;
    std::shared_ptr<RunManager> runManager_;
};

} // namespace ragline::pipeline

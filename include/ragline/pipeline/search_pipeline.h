#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <ragline/core/types.h>
#include <ragline/pipeline/pipeline.h>

namespace ragline::pipeline {

// Joined output of the search branches. A branch that did not run leaves its slot empty.
struct AggregateSearchResult {
    std::optional<std::vector<Value>> vectorResults;
    std::optional<std::vector<Value>> graphResults;
};

void to_json(nlohmann::json& j, const AggregateSearchResult& r);
void from_json(const nlohmann::json& j, AggregateSearchResult& r);

// Queue traffic of one branch during a fan-out run.
struct BranchStats {
    bool enabled = false;
    std::size_t itemsSent = 0;
    std::size_t itemsReceived = 0;
    std::size_t sentinelsSent = 0;
    // End of input signalled by closing the queue instead of a sentinel.
    std::size_t closesSent = 0;
    std::size_t sentinelsObserved = 0;
};

struct FanOutStats {
    std::size_t itemsProduced = 0;
    BranchStats vector;
    BranchStats graph;
};

/**
 * @brief Fan-out/fan-in search: every input item is broadcast to the vector and graph branch
 * pipelines, which run concurrently with each other and with the producer.
 *
 * Each enabled branch reads from its own bounded queue terminated by exactly one sentinel. The
 * sentinel is sent even when the input stream fails, and a branch that stops early closes its
 * queue so the producer never blocks on it. All tasks are awaited before the first failure (in
 * producer, vector, graph order) is rethrown.
 */
class SearchPipeline {
public:
    struct Config {
        std::size_t queueCapacity = 32;
    };

    explicit SearchPipeline(std::shared_ptr<RunManager> runManager = nullptr);
    SearchPipeline(std::shared_ptr<RunManager> runManager, Config config);

    SearchPipeline(const SearchPipeline&) = delete;
    SearchPipeline& operator=(const SearchPipeline&) = delete;

    // Pipe names must be unique across both branches since they share the run's state.
    Result<void> addVectorSearchPipe(std::shared_ptr<Pipe> pipe,
                                     std::vector<UpstreamRef> upstreamRefs = {});
    Result<void> addGraphSearchPipe(std::shared_ptr<Pipe> pipe,
                                    std::vector<UpstreamRef> upstreamRefs = {});

    // A branch runs when its settings flag is on and it has at least one pipe.
    boost::asio::awaitable<AggregateSearchResult> run(StreamPtr input, RunOptions options = {},
                                                      FanOutStats* stats = nullptr);

    bool hasVectorBranch() const { return !vectorPipeline_->empty(); }
    bool hasGraphBranch() const { return !graphPipeline_->empty(); }
    RunType runType() const { return RunType::Search; }
    const Config& config() const { return config_; }
    const std::shared_ptr<RunManager>& runManager() const { return runManager_; }

private:
    Result<void> addBranchPipe(Pipeline& branch, const Pipeline& other, std::shared_ptr<Pipe> pipe,
                               std::vector<UpstreamRef> upstreamRefs);

    std::shared_ptr<RunManager> runManager_;
    Config config_;
    std::shared_ptr<Pipeline> vectorPipeline_;
    std::shared_ptr<Pipeline> graphPipeline_;
};

} // namespace ragline::pipeline

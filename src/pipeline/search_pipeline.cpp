#include <ragline/pipeline/search_pipeline.h>

#include <string>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace ragline::pipeline {

void to_json(nlohmann::json& j, const AggregateSearchResult& r) {
    j = nlohmann::json::object();
    if (r.vectorResults) {
        j["vector_search_results"] = *r.vectorResults;
    }
    if (r.graphResults) {
        j["graph_search_results"] = *r.graphResults;
    }
}

void from_json(const nlohmann::json& j, AggregateSearchResult& r) {
    r.vectorResults.reset();
    r.graphResults.reset();
    if (j.contains("vector_search_results") && j["vector_search_results"].is_array()) {
        r.vectorResults = j["vector_search_results"].get<std::vector<Value>>();
    }
    if (j.contains("graph_search_results") && j["graph_search_results"].is_array()) {
        r.graphResults = j["graph_search_results"].get<std::vector<Value>>();
    }
}

namespace {

// Single-producer/single-consumer queue for one branch. An empty optional is the sentinel.
class BranchQueue {
public:
    using Channel = boost::asio::experimental::channel<void(boost::system::error_code,
                                                            std::optional<StreamItem>)>;

    BranchQueue(boost::asio::any_io_executor executor, std::size_t capacity, BranchStats& stats)
        : channel_(executor, capacity), stats_(stats) {}

    boost::asio::awaitable<void> push(StreamItem item) {
        if (closed_) {
            co_return;
        }
        auto [ec] = co_await channel_.async_send(boost::system::error_code{},
                                                 std::optional<StreamItem>(std::move(item)),
                                                 boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            // Consumer is gone; keep feeding the other branch.
            closed_ = true;
            co_return;
        }
        ++stats_.itemsSent;
    }

    // Ends the branch input exactly once: a sentinel, or a close of the channel when the
    // producer was cancelled or the send fails. The consumer treats both as end of input.
    boost::asio::awaitable<void> finish() {
        if (finished_) {
            co_return;
        }
        finished_ = true;
        if (closed_) {
            co_return;
        }
        if (channel_.try_send(boost::system::error_code{}, std::optional<StreamItem>{})) {
            ++stats_.sentinelsSent;
            co_return;
        }
        auto cs = co_await boost::asio::this_coro::cancellation_state;
        if (cs.cancelled() != boost::asio::cancellation_type::none) {
            spdlog::debug("[SearchPipeline] producer cancelled, closing branch queue");
            endByClose();
            co_return;
        }
        auto [ec] = co_await channel_.async_send(boost::system::error_code{},
                                                 std::optional<StreamItem>{},
                                                 boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            spdlog::debug("[SearchPipeline] sentinel send failed: {}", ec.message());
            endByClose();
            co_return;
        }
        ++stats_.sentinelsSent;
    }

    // Returns nullopt at the sentinel or when the queue was closed.
    boost::asio::awaitable<std::optional<StreamItem>> pop() {
        auto [ec, item] =
            co_await channel_.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec) {
            co_return std::nullopt;
        }
        if (!item) {
            ++stats_.sentinelsObserved;
            co_return std::nullopt;
        }
        ++stats_.itemsReceived;
        co_return item;
    }

    void close() {
        closed_ = true;
        channel_.close();
    }

private:
    void endByClose() {
        ++stats_.closesSent;
        close();
    }

    Channel channel_;
    BranchStats& stats_;
    bool closed_ = false;
    bool finished_ = false;
};

class BranchInputStream final : public AsyncStream {
public:
    explicit BranchInputStream(std::shared_ptr<BranchQueue> queue) : queue_(std::move(queue)) {}

    boost::asio::awaitable<std::optional<StreamItem>> next() override {
        if (done_) {
            co_return std::nullopt;
        }
        auto item = co_await queue_->pop();
        if (!item) {
            done_ = true;
        }
        co_return item;
    }

    boost::asio::awaitable<void> close() override {
        done_ = true;
        queue_->close();
        co_return;
    }

private:
    std::shared_ptr<BranchQueue> queue_;
    bool done_ = false;
};

struct QueueCloser {
    std::shared_ptr<BranchQueue> queue;
    ~QueueCloser() {
        if (queue) {
            queue->close();
        }
    }
};

boost::asio::awaitable<void> produce(StreamPtr input, std::vector<std::shared_ptr<BranchQueue>> queues,
                                     FanOutStats& stats) {
    std::exception_ptr failure;
    try {
        while (auto item = co_await input->next()) {
            ++stats.itemsProduced;
            for (auto& queue : queues) {
                co_await queue->push(*item);
            }
        }
    } catch (...) {
        failure = std::current_exception();
    }
    for (auto& queue : queues) {
        co_await queue->finish();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

boost::asio::awaitable<std::optional<std::vector<Value>>>
runBranch(std::shared_ptr<Pipeline> branch, std::shared_ptr<BranchQueue> queue,
          RunOptions options) {
    if (!queue) {
        co_return std::nullopt;
    }
    QueueCloser closer{queue};
    auto results = co_await branch->run(std::make_shared<BranchInputStream>(queue),
                                        std::move(options));
    co_return std::optional<std::vector<Value>>(std::move(results));
}

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

SearchPipeline::SearchPipeline(std::shared_ptr<RunManager> runManager)
    : SearchPipeline(std::move(runManager), Config{}) {}

SearchPipeline::SearchPipeline(std::shared_ptr<RunManager> runManager, Config config)
    : runManager_(runManager ? std::move(runManager) : std::make_shared<RunManager>()),
      config_(config),
      vectorPipeline_(std::make_shared<Pipeline>(runManager_, RunType::Search)),
      graphPipeline_(std::make_shared<Pipeline>(runManager_, RunType::Search)) {}

Result<void> SearchPipeline::addBranchPipe(Pipeline& branch, const Pipeline& other,
                                           std::shared_ptr<Pipe> pipe,
                                           std::vector<UpstreamRef> upstreamRefs) {
    if (pipe) {
        for (const auto& name : other.pipeNames()) {
            if (name == pipe->name()) {
                return Error{ErrorCode::InvalidArgument,
                             "pipe name already used by the other search branch: " + name};
            }
        }
        spdlog::debug("[SearchPipeline] adding pipe {}", pipe->name());
    }
    return branch.addPipe(std::move(pipe), std::move(upstreamRefs));
}

Result<void> SearchPipeline::addVectorSearchPipe(std::shared_ptr<Pipe> pipe,
                                                 std::vector<UpstreamRef> upstreamRefs) {
    return addBranchPipe(*vectorPipeline_, *graphPipeline_, std::move(pipe),
                         std::move(upstreamRefs));
}

Result<void> SearchPipeline::addGraphSearchPipe(std::shared_ptr<Pipe> pipe,
                                                std::vector<UpstreamRef> upstreamRefs) {
    return addBranchPipe(*graphPipeline_, *vectorPipeline_, std::move(pipe),
                         std::move(upstreamRefs));
}

boost::asio::awaitable<AggregateSearchResult>
SearchPipeline::run(StreamPtr input, RunOptions options, FanOutStats* stats) {
    using namespace boost::asio::experimental;

    auto ex = co_await boost::asio::this_coro::executor;

    auto scope = runManager_->withRun(options.runContext, RunType::Search);
    if (options.logRunInfo) {
        co_await runManager_->logRunInfo(scope.context(), options.actor);
    }

    FanOutStats localStats;
    FanOutStats& fanOut = stats ? *stats : localStats;
    fanOut = FanOutStats{};

    auto settings =
        options.settings ? options.settings : std::make_shared<const RunSettings>();
    fanOut.vector.enabled = settings->search.useVectorSearch && hasVectorBranch();
    fanOut.graph.enabled = settings->search.useGraphSearch && hasGraphBranch();

    std::shared_ptr<BranchQueue> vectorQueue;
    std::shared_ptr<BranchQueue> graphQueue;
    std::vector<std::shared_ptr<BranchQueue>> queues;
    if (fanOut.vector.enabled) {
        vectorQueue = std::make_shared<BranchQueue>(ex, config_.queueCapacity, fanOut.vector);
        queues.push_back(vectorQueue);
    }
    if (fanOut.graph.enabled) {
        graphQueue = std::make_shared<BranchQueue>(ex, config_.queueCapacity, fanOut.graph);
        queues.push_back(graphQueue);
    }

    RunOptions branchOptions;
    branchOptions.state = options.state ? options.state : std::make_shared<StateStore>();
    branchOptions.runContext = scope.context();
    branchOptions.settings = settings;
    branchOptions.logRunInfo = false;
    branchOptions.actor = options.actor;

    spdlog::debug("[SearchPipeline] run {} fan-out vector={} graph={}", scope.context().runId,
                  fanOut.vector.enabled, fanOut.graph.enabled);

    StreamPtr source = input ? std::move(input) : makeStream({});
    auto [order, producerError, vectorError, vectorResults, graphError, graphResults] =
        co_await make_parallel_group(
            co_spawn(ex, produce(std::move(source), std::move(queues), fanOut),
                     boost::asio::deferred),
            co_spawn(ex, runBranch(vectorPipeline_, vectorQueue, branchOptions),
                     boost::asio::deferred),
            co_spawn(ex, runBranch(graphPipeline_, graphQueue, branchOptions),
                     boost::asio::deferred))
            .async_wait(wait_for_all(), boost::asio::use_awaitable);

    std::exception_ptr first;
    const std::pair<const char*, std::exception_ptr> failures[] = {
        {"producer", producerError}, {"vector", vectorError}, {"graph", graphError}};
    for (const auto& [label, error] : failures) {
        if (!error) {
            continue;
        }
        spdlog::warn("[SearchPipeline] run {} {} task failed: {}", scope.context().runId, label,
                     describe(error));
        if (!first) {
            first = error;
        }
    }
    if (first) {
        std::rethrow_exception(first);
    }

    AggregateSearchResult aggregate;
    aggregate.vectorResults = std::move(vectorResults);
    aggregate.graphResults = std::move(graphResults);
    co_return aggregate;
}

} // namespace ragline::pipeline

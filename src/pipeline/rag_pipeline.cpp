#include <ragline/pipeline/rag_pipeline.h>

#include <stdexcept>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace ragline::pipeline {

namespace {

// Carries one search task's outcome back to the pairing loop.
using SearchSlot = boost::asio::experimental::channel<void(
    boost::system::error_code, std::exception_ptr, AggregateSearchResult)>;

struct PendingSearch {
    Value query;
    std::shared_ptr<SearchSlot> slot;
};

} // namespace

RagPipeline::RagPipeline(std::shared_ptr<SearchPipeline> searchPipeline,
                         std::shared_ptr<Pipeline> generationPipeline,
                         std::shared_ptr<RunManager> runManager)
    : searchPipeline_(std::move(searchPipeline)),
      generationPipeline_(std::move(generationPipeline)),
      runManager_(runManager ? std::move(runManager) : std::make_shared<RunManager>()) {
    if (!searchPipeline_ || !generationPipeline_) {
        throw std::invalid_argument("RagPipeline requires search and generation pipelines");
    }
}

boost::asio::awaitable<StreamPtr> RagPipeline::runStream(StreamPtr queries, RunOptions options) {
    auto scope = runManager_->withRun(options.runContext, RunType::Rag);
    if (options.logRunInfo) {
        co_await runManager_->logRunInfo(scope.context(), options.actor);
    }

    auto settings = options.settings ? options.settings : std::make_shared<const RunSettings>();
    auto context = scope.context();
    auto search = searchPipeline_;
    auto actor = options.actor;
    StreamPtr input = queries ? std::move(queries) : makeStream({});

    auto paired = makeGenerator([search, input, context, settings,
                                 actor](StreamEmitter& emit) -> boost::asio::awaitable<void> {
        auto ex = co_await boost::asio::this_coro::executor;

        std::vector<PendingSearch> pending;
        while (auto item = co_await input->next()) {
            PendingSearch entry{itemValue(*item), std::make_shared<SearchSlot>(ex, 1)};

            RunOptions searchOptions;
            searchOptions.state = std::make_shared<StateStore>();
            searchOptions.runContext = context;
            searchOptions.settings = settings;
            searchOptions.logRunInfo = false;
            searchOptions.actor = actor;

            boost::asio::co_spawn(
                ex, search->run(makeStream({entry.query}), std::move(searchOptions)),
                [search, slot = entry.slot](std::exception_ptr error,
                                            AggregateSearchResult result) {
                    slot->try_send(boost::system::error_code{}, error, std::move(result));
                });
            pending.push_back(std::move(entry));
        }

        spdlog::debug("[RagPipeline] run {} scheduled {} search(es)", context.runId,
                      pending.size());

        for (auto& entry : pending) {
            auto [ec, error, result] = co_await entry.slot->async_receive(
                boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec) {
                throw boost::system::system_error(ec);
            }
            if (error) {
                std::rethrow_exception(error);
            }
            co_await emit(Value{{"query", entry.query}, {"search_results", result}});
        }
    });

    RunOptions generationOptions;
    generationOptions.state = options.state ? options.state : std::make_shared<StateStore>();
    generationOptions.runContext = context;
    generationOptions.settings = settings;
    generationOptions.logRunInfo = false;
    generationOptions.actor = options.actor;

    auto output = co_await generationPipeline_->runStream(std::move(paired),
                                                          std::move(generationOptions));
    co_return attachRunScope(std::move(output), runManager_, std::move(scope));
}

boost::asio::awaitable<std::vector<Value>> RagPipeline::run(StreamPtr queries,
                                                            RunOptions options) {
    auto stream = co_await runStream(std::move(queries), std::move(options));
    co_return co_await flatten(std::move(stream));
}

} // namespace ragline::pipeline

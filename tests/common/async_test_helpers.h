// Helpers for driving coroutine-based APIs from Catch2 test bodies.

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <ragline/pipeline/pipe.h>
#include <ragline/pipeline/run_log_sink.h>
#include <ragline/pipeline/stream.h>

namespace ragline::test {

/**
 * @brief Runs an awaitable to completion on a private io_context and returns its result.
 *
 * The context runs until every task spawned from it has finished, so background work started
 * by the code under test is complete when this returns. Exceptions are rethrown.
 */
template <typename T> T run_awaitable(boost::asio::awaitable<T> task) {
    boost::asio::io_context io;
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) {
            result.emplace(std::move(value));
        }
    });
    io.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*result);
}

inline void run_awaitable(boost::asio::awaitable<void> task) {
    boost::asio::io_context io;
    std::exception_ptr error;
    boost::asio::co_spawn(io, std::move(task), [&](std::exception_ptr e) { error = e; });
    io.run();
    if (error) {
        std::rethrow_exception(error);
    }
}

inline boost::asio::awaitable<void> sleep_for(std::chrono::milliseconds delay) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, delay);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

// Everything one invocation of a FnPipe sees.
struct PipeCall {
    pipeline::PipeInput input;
    std::shared_ptr<pipeline::StateStore> state;
    pipeline::RunContext run;
    pipeline::PipeLogger logger;
};

using PipeBody = std::function<boost::asio::awaitable<void>(PipeCall&, pipeline::StreamEmitter&)>;

/**
 * @brief Pipe whose logic is a test-supplied coroutine body run as a generator.
 */
class FnPipe final : public pipeline::Pipe {
public:
    FnPipe(std::string name, PipeBody body, std::size_t maxLogQueueSize = 100,
           std::shared_ptr<pipeline::RunLogSink> sink = nullptr)
        : Pipe(pipeline::PipeConfig{std::move(name), maxLogQueueSize}, std::move(sink)),
          body_(std::move(body)) {}

    int invocations() const { return invocations_; }
    const std::vector<pipeline::RunContext>& contexts() const { return contexts_; }

protected:
    pipeline::StreamPtr logic(pipeline::PipeInput input,
                              std::shared_ptr<pipeline::StateStore> state,
                              pipeline::RunContext runContext,
                              pipeline::PipeLogger logger) override {
        ++invocations_;
        contexts_.push_back(runContext);
        auto call = std::make_shared<PipeCall>(
            PipeCall{std::move(input), std::move(state), std::move(runContext), std::move(logger)});
        return pipeline::makeGenerator(
            [body = body_, call](pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
                co_await body(*call, emit);
            });
    }

private:
    PipeBody body_;
    int invocations_ = 0;
    std::vector<pipeline::RunContext> contexts_;
};

// Forwards every input item unchanged.
inline PipeBody pass_through() {
    return [](PipeCall& call, pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
        while (auto item = co_await call.input.message->next()) {
            co_await emit(std::move(*item));
        }
    };
}

// Emits fn(value) for every input value.
inline PipeBody map_values(std::function<pipeline::Value(const pipeline::Value&, PipeCall&)> fn) {
    return [fn](PipeCall& call, pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
        while (auto item = co_await call.input.message->next()) {
            co_await emit(fn(pipeline::itemValue(*item), call));
        }
    };
}

/**
 * @brief Sink that records entries and can be told to fail or stall.
 */
class RecordingRunLogSink final : public pipeline::RunLogSink {
public:
    boost::asio::awaitable<void> log(const std::string& runId, const std::string& key,
                                     const std::string& value) override {
        if (delay.count() > 0) {
            co_await sleep_for(delay);
        }
        if (failOnKey && *failOnKey == key) {
            throw std::runtime_error("sink rejected " + key);
        }
        entries.push_back({runId, key, value});
    }

    boost::asio::awaitable<void> logRunInfo(const std::string& runId, pipeline::RunType runType,
                                            const std::string& actor) override {
        if (failRunInfo) {
            throw std::runtime_error("run info store unavailable");
        }
        runInfo.push_back({runId, std::string(pipeline::runTypeToString(runType)), actor});
        co_return;
    }

    struct Entry {
        std::string runId;
        std::string key;
        std::string value;
    };

    std::vector<Entry> entries;
    std::vector<Entry> runInfo;
    std::optional<std::string> failOnKey;
    bool failRunInfo = false;
    std::chrono::milliseconds delay{0};
};

} // namespace ragline::test

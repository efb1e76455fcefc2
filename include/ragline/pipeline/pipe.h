#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <ragline/core/types.h>
#include <ragline/pipeline/run_context.h>
#include <ragline/pipeline/run_settings.h>
#include <ragline/pipeline/state_store.h>
#include <ragline/pipeline/stream.h>

namespace ragline::pipeline {

class RunLogSink;

struct PipeConfig {
    // Unique within a pipeline; keys state entries and log attribution.
    std::string name;
    // Log entries beyond this many queued ones are dropped, never waited on.
    std::size_t maxLogQueueSize = 100;
};

/**
 * @brief Input envelope handed to a pipe invocation.
 *
 * `message` is the preceding stage's output (or the external input for the first pipe);
 * `fields` holds values bound from earlier stages' published state.
 */
struct PipeInput {
    StreamPtr message;
    std::map<std::string, Value> fields;
    std::shared_ptr<const RunSettings> settings;

    bool hasField(const std::string& name) const { return fields.find(name) != fields.end(); }
    Result<Value> field(const std::string& name) const;
};

// Snapshot of run-log accounting for a pipe (summed over its invocations).
struct PipeLogStats {
    std::uint64_t accepted = 0;
    std::uint64_t dropped = 0;
    std::uint64_t delivered = 0;
    std::uint64_t discarded = 0;
    std::uint64_t sinkFailures = 0;
};

namespace detail {

struct PipeLogCounters {
    std::atomic<std::uint64_t> accepted{0};
    std::atomic<std::uint64_t> dropped{0};
    std::atomic<std::uint64_t> delivered{0};
    std::atomic<std::uint64_t> discarded{0};
    std::atomic<std::uint64_t> sinkFailures{0};
};

class PipeLogSession;

} // namespace detail

/**
 * @brief Run-scoped logging handle passed to Pipe::logic.
 *
 * log() never blocks: the entry is queued for the background drain or dropped (and counted)
 * when the queue is full or the invocation has already been torn down.
 */
class PipeLogger {
public:
    PipeLogger() = default;
    explicit PipeLogger(std::shared_ptr<detail::PipeLogSession> session)
        : session_(std::move(session)) {}

    bool log(std::string key, std::string value) const;
    bool log(std::string key, const char* value) const;
    bool log(std::string key, const Value& value) const;

private:
    std::shared_ptr<detail::PipeLogSession> session_;
};

/**
 * @brief A named processing stage with a lazy stream contract.
 *
 * run() opens the invocation's log channel, calls logic() and wraps the returned stream so that
 * the log channel is drained and its drain task stopped on every exit path: exhaustion, an
 * exception from the logic, close(), or the stream being dropped. Exceptions from logic()
 * propagate unchanged.
 */
class Pipe {
public:
    using Config = PipeConfig;

    explicit Pipe(PipeConfig config, std::shared_ptr<RunLogSink> sink = nullptr);
    virtual ~Pipe() = default;

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    const std::string& name() const { return config_.name; }
    const PipeConfig& config() const { return config_; }

    void setLogSink(std::shared_ptr<RunLogSink> sink) { sink_ = std::move(sink); }
    const std::shared_ptr<RunLogSink>& logSink() const { return sink_; }

    boost::asio::awaitable<StreamPtr> run(PipeInput input, std::shared_ptr<StateStore> state,
                                          RunContext runContext);

    PipeLogStats logStats() const;
    std::uint64_t droppedLogEntries() const { return counters_->dropped.load(); }

protected:
    // Must return a lazy stream: no item should be computed before the first pull.
    virtual StreamPtr logic(PipeInput input, std::shared_ptr<StateStore> state,
                            RunContext runContext, PipeLogger logger) = 0;

private:
    PipeConfig config_;
    std::shared_ptr<RunLogSink> sink_;
    std::shared_ptr<detail::PipeLogCounters> counters_;
};

} // namespace ragline::pipeline

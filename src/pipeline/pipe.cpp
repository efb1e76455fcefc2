#include <ragline/pipeline/pipe.h>

#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <ragline/pipeline/run_log_sink.h>

namespace ragline::pipeline {

namespace detail {

struct PipeLogEntry {
    std::string key;
    std::string value;
};

/**
 * One invocation's log channel: a bounded queue plus the task that drains it into the sink.
 * Teardown discards whatever is still queued, closes the queue and stops the drain task.
 */
class PipeLogSession : public std::enable_shared_from_this<PipeLogSession> {
public:
    using Channel =
        boost::asio::experimental::channel<void(boost::system::error_code, PipeLogEntry)>;
    using DoneChannel = boost::asio::experimental::channel<void(boost::system::error_code)>;

    PipeLogSession(boost::asio::any_io_executor executor, std::size_t capacity,
                   std::shared_ptr<RunLogSink> sink, RunContext context, std::string pipeName,
                   std::shared_ptr<PipeLogCounters> counters)
        : executor_(executor),
          capacity_(capacity),
          channel_(executor, capacity),
          done_(executor, 1),
          sink_(std::move(sink)),
          context_(std::move(context)),
          pipeName_(std::move(pipeName)),
          counters_(std::move(counters)) {}

    void start() {
        if (!sink_ || capacity_ == 0) {
            return;
        }
        started_ = true;
        boost::asio::co_spawn(
            executor_, drain(shared_from_this()),
            boost::asio::bind_cancellation_slot(
                cancel_.slot(), [self = shared_from_this()](std::exception_ptr error) {
                    if (error) {
                        spdlog::debug("[Pipe] {} log drain for run {} ended by exception",
                                      self->pipeName_, self->context_.runId);
                    }
                    self->done_.try_send(boost::system::error_code{});
                }));
    }

    bool tryLog(std::string key, std::string value) {
        if (!started_ || closed_) {
            ++counters_->dropped;
            return false;
        }
        if (!channel_.try_send(boost::system::error_code{},
                               PipeLogEntry{std::move(key), std::move(value)})) {
            ++counters_->dropped;
            return false;
        }
        ++counters_->accepted;
        return true;
    }

    boost::asio::awaitable<void> shutdown() {
        if (closed_) {
            co_return;
        }
        closed_ = true;
        discardPending();
        channel_.close();
        if (!started_) {
            co_return;
        }
        cancel_.emit(boost::asio::cancellation_type::terminal);
        // Also reached after the caller was cancelled; the drain task must still be awaited.
        const bool throwing = co_await boost::asio::this_coro::throw_if_cancelled();
        co_await boost::asio::this_coro::throw_if_cancelled(false);
        auto [ec] = co_await done_.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        co_await boost::asio::this_coro::throw_if_cancelled(throwing);
        if (ec) {
            spdlog::debug("[Pipe] {} log drain shutdown: {}", pipeName_, ec.message());
        }
    }

    // Synchronous teardown for streams dropped without being exhausted or closed.
    void abandon() {
        if (closed_) {
            return;
        }
        closed_ = true;
        discardPending();
        channel_.close();
        if (started_) {
            cancel_.emit(boost::asio::cancellation_type::terminal);
        }
    }

private:
    static boost::asio::awaitable<void> drain(std::shared_ptr<PipeLogSession> self) {
        for (;;) {
            auto [ec, entry] = co_await self->channel_.async_receive(
                boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec) {
                co_return;
            }
            bool aborted = false;
            try {
                co_await self->sink_->log(self->context_.runId, entry.key, entry.value);
                ++self->counters_->delivered;
            } catch (const boost::system::system_error& e) {
                if (e.code() == boost::asio::error::operation_aborted) {
                    aborted = true;
                } else {
                    ++self->counters_->sinkFailures;
                    spdlog::debug("[Pipe] {} run log sink failed: {}", self->pipeName_,
                                  e.what());
                }
            } catch (const std::exception& e) {
                ++self->counters_->sinkFailures;
                spdlog::debug("[Pipe] {} run log sink failed: {}", self->pipeName_, e.what());
            }
            if (aborted) {
                ++self->counters_->discarded;
                co_return;
            }
        }
    }

    void discardPending() {
        while (channel_.try_receive(
            [this](boost::system::error_code, PipeLogEntry) { ++counters_->discarded; })) {
        }
    }

    boost::asio::any_io_executor executor_;
    std::size_t capacity_;
    Channel channel_;
    DoneChannel done_;
    boost::asio::cancellation_signal cancel_;
    std::shared_ptr<RunLogSink> sink_;
    RunContext context_;
    std::string pipeName_;
    std::shared_ptr<PipeLogCounters> counters_;
    bool started_ = false;
    bool closed_ = false;
};

} // namespace detail

namespace {

// Ties the log session's lifetime to the pipe's output stream.
class PipeOutputStream final : public AsyncStream {
public:
    PipeOutputStream(StreamPtr inner, std::shared_ptr<detail::PipeLogSession> session)
        : inner_(std::move(inner)), session_(std::move(session)) {}

    ~PipeOutputStream() override {
        if (!finished_) {
            session_->abandon();
        }
    }

    boost::asio::awaitable<std::optional<StreamItem>> next() override {
        if (finished_) {
            co_return std::nullopt;
        }
        std::optional<StreamItem> item;
        std::exception_ptr failure;
        try {
            item = co_await inner_->next();
        } catch (...) {
            failure = std::current_exception();
        }
        if (failure || !item) {
            finished_ = true;
            co_await session_->shutdown();
            if (failure) {
                std::rethrow_exception(failure);
            }
            co_return std::nullopt;
        }
        co_return item;
    }

    boost::asio::awaitable<void> close() override {
        if (finished_) {
            co_return;
        }
        finished_ = true;
        std::exception_ptr failure;
        try {
            co_await inner_->close();
        } catch (...) {
            failure = std::current_exception();
        }
        co_await session_->shutdown();
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

private:
    StreamPtr inner_;
    std::shared_ptr<detail::PipeLogSession> session_;
    bool finished_ = false;
};

} // namespace

Result<Value> PipeInput::field(const std::string& name) const {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return Error{ErrorCode::NotFound, "input field not bound: " + name};
    }
    return it->second;
}

bool PipeLogger::log(std::string key, std::string value) const {
    if (!session_) {
        return false;
    }
    return session_->tryLog(std::move(key), std::move(value));
}

bool PipeLogger::log(std::string key, const char* value) const {
    return log(std::move(key), std::string(value ? value : ""));
}

bool PipeLogger::log(std::string key, const Value& value) const {
    return log(std::move(key), value.is_string() ? value.get<std::string>() : value.dump());
}

Pipe::Pipe(PipeConfig config, std::shared_ptr<RunLogSink> sink)
    : config_(std::move(config)),
      sink_(std::move(sink)),
      counters_(std::make_shared<detail::PipeLogCounters>()) {}

boost::asio::awaitable<StreamPtr> Pipe::run(PipeInput input, std::shared_ptr<StateStore> state,
                                            RunContext runContext) {
    auto executor = co_await boost::asio::this_coro::executor;
    if (!state) {
        state = std::make_shared<StateStore>();
    }
    if (!input.settings) {
        input.settings = std::make_shared<RunSettings>();
    }
    if (!input.message) {
        input.message = makeStream({});
    }

    auto session = std::make_shared<detail::PipeLogSession>(
        executor, config_.maxLogQueueSize, sink_, runContext, config_.name, counters_);
    session->start();

    StreamPtr output;
    std::exception_ptr failure;
    try {
        output = logic(std::move(input), std::move(state), runContext, PipeLogger(session));
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure || !output) {
        co_await session->shutdown();
        if (failure) {
            std::rethrow_exception(failure);
        }
        co_return makeStream({});
    }
    co_return std::make_shared<PipeOutputStream>(std::move(output), std::move(session));
}

PipeLogStats Pipe::logStats() const {
    PipeLogStats stats;
    stats.accepted = counters_->accepted.load();
    stats.dropped = counters_->dropped.load();
    stats.delivered = counters_->delivered.load();
    stats.discarded = counters_->discarded.load();
    stats.sinkFailures = counters_->sinkFailures.load();
    return stats;
}

} // namespace ragline::pipeline

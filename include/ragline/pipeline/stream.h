#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace ragline::pipeline {

using Value = nlohmann::json;

class AsyncStream;
using StreamPtr = std::shared_ptr<AsyncStream>;

// A stream yields either plain values or nested streams. Nested streams are flattened
// when a pipeline run is materialized into a list.
using StreamItem = std::variant<Value, StreamPtr>;

/**
 * @brief Lazy, pull-based asynchronous sequence.
 *
 * A stream is consumed by a single reader. next() returns std::nullopt once the stream is
 * exhausted; exceptions raised by the producer surface from next(). close() releases any work
 * still pending behind an unfinished stream (early termination by the consumer).
 */
class AsyncStream {
public:
    virtual ~AsyncStream() = default;

    virtual boost::asio::awaitable<std::optional<StreamItem>> next() = 0;

    virtual boost::asio::awaitable<void> close() { co_return; }
};

inline bool isStream(const StreamItem& item) {
    return std::holds_alternative<StreamPtr>(item);
}

// Returns the value held by an item; throws std::invalid_argument for nested streams.
const Value& itemValue(const StreamItem& item);

/**
 * @brief Stream over an in-memory sequence of items.
 */
class VectorStream final : public AsyncStream {
public:
    explicit VectorStream(std::vector<StreamItem> items) : items_(std::move(items)) {}

    boost::asio::awaitable<std::optional<StreamItem>> next() override;

    std::size_t remaining() const { return items_.size() - position_; }

private:
    std::vector<StreamItem> items_;
    std::size_t position_ = 0;
};

StreamPtr makeStream(std::vector<Value> values);
StreamPtr makeItemStream(std::vector<StreamItem> items);

namespace detail {
struct GeneratorState;
} // namespace detail

/**
 * @brief Handle given to a generator body; co_await emit(item) hands one item to the reader.
 *
 * emit() suspends until the reader pulls the item. If the reader closes or drops the stream,
 * emit() throws boost::system::system_error so the producer unwinds through its own scopes.
 */
class StreamEmitter {
public:
    explicit StreamEmitter(std::shared_ptr<detail::GeneratorState> state)
        : state_(std::move(state)) {}

    boost::asio::awaitable<void> operator()(StreamItem item);

private:
    std::shared_ptr<detail::GeneratorState> state_;
};

using GeneratorBody = std::function<boost::asio::awaitable<void>(StreamEmitter&)>;

/**
 * @brief Stream whose items are produced by a coroutine body.
 *
 * The body is started on the first next() (never before) on the caller's executor, and runs at
 * most one item ahead of the reader.
 */
class GeneratorStream final : public AsyncStream {
public:
    explicit GeneratorStream(GeneratorBody body);
    ~GeneratorStream() override;

    GeneratorStream(const GeneratorStream&) = delete;
    GeneratorStream& operator=(const GeneratorStream&) = delete;

    boost::asio::awaitable<std::optional<StreamItem>> next() override;
    boost::asio::awaitable<void> close() override;

private:
    GeneratorBody body_;
    std::shared_ptr<detail::GeneratorState> state_;
    bool started_ = false;
    bool finished_ = false;
};

StreamPtr makeGenerator(GeneratorBody body);

/**
 * @brief Memoizing wrapper that lets a stage output be read by several cursors.
 *
 * materialize() drives the source to completion and keeps every item, so forcing an upstream
 * stage to finish never steals items from the stage that consumes it. Cursors replay buffered
 * items first and then pull from the source on demand. Pulls must not overlap.
 */
class ReplayableStream : public std::enable_shared_from_this<ReplayableStream> {
public:
    explicit ReplayableStream(StreamPtr source) : source_(std::move(source)) {}

    StreamPtr cursor();

    boost::asio::awaitable<void> materialize();

    boost::asio::awaitable<std::optional<StreamItem>> itemAt(std::size_t index);

    bool exhausted() const { return exhausted_; }
    std::size_t buffered() const { return buffer_.size(); }

private:
    boost::asio::awaitable<bool> pullOne();

    StreamPtr source_;
    std::vector<StreamItem> buffer_;
    std::exception_ptr error_;
    bool exhausted_ = false;
    bool pulling_ = false;
};

// Drains a stream without flattening nested streams.
boost::asio::awaitable<std::vector<StreamItem>> collect(StreamPtr stream);

// Drains a stream into a flat ordered list, recursively expanding nested streams.
boost::asio::awaitable<std::vector<Value>> flatten(StreamPtr stream);

} // namespace ragline::pipeline

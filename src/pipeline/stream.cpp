#include <ragline/pipeline/stream.h>

#include <iterator>
#include <stdexcept>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ragline::pipeline {

namespace detail {

using ItemChannel =
    boost::asio::experimental::channel<void(boost::system::error_code, StreamItem)>;

struct GeneratorState {
    // Unbuffered: a send completes only when the reader takes the item.
    std::optional<ItemChannel> channel;
    std::exception_ptr error;
    bool cancelled = false;
};

} // namespace detail

const Value& itemValue(const StreamItem& item) {
    if (const auto* value = std::get_if<Value>(&item)) {
        return *value;
    }
    throw std::invalid_argument("stream item is a nested stream, expected a value");
}

boost::asio::awaitable<std::optional<StreamItem>> VectorStream::next() {
    if (position_ >= items_.size()) {
        co_return std::nullopt;
    }
    co_return std::optional<StreamItem>(std::move(items_[position_++]));
}

StreamPtr makeStream(std::vector<Value> values) {
    std::vector<StreamItem> items;
    items.reserve(values.size());
    for (auto& v : values) {
        items.emplace_back(std::move(v));
    }
    return std::make_shared<VectorStream>(std::move(items));
}

StreamPtr makeItemStream(std::vector<StreamItem> items) {
    return std::make_shared<VectorStream>(std::move(items));
}

boost::asio::awaitable<void> StreamEmitter::operator()(StreamItem item) {
    if (!state_->channel || state_->cancelled) {
        throw boost::system::system_error(boost::asio::experimental::error::channel_closed);
    }
    co_await state_->channel->async_send(boost::system::error_code{}, std::move(item),
                                         boost::asio::use_awaitable);
}

GeneratorStream::GeneratorStream(GeneratorBody body)
    : body_(std::move(body)), state_(std::make_shared<detail::GeneratorState>()) {}

GeneratorStream::~GeneratorStream() {
    if (!finished_ && state_->channel) {
        state_->cancelled = true;
        state_->channel->close();
    }
}

boost::asio::awaitable<std::optional<StreamItem>> GeneratorStream::next() {
    if (finished_) {
        co_return std::nullopt;
    }

    if (!started_) {
        started_ = true;
        auto executor = co_await boost::asio::this_coro::executor;
        state_->channel.emplace(executor, 0);
        boost::asio::co_spawn(
            executor,
            [state = state_, body = std::move(body_)]() -> boost::asio::awaitable<void> {
                StreamEmitter emit(state);
                co_await body(emit);
            },
            [state = state_](std::exception_ptr error) {
                if (error && !state->cancelled) {
                    state->error = error;
                }
                state->channel->close();
            });
    }

    auto [ec, item] =
        co_await state_->channel->async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec == boost::asio::error::operation_aborted) {
        // The reader was cancelled; the producer is still live and close() releases it.
        throw boost::system::system_error(ec);
    }
    if (ec) {
        finished_ = true;
        if (auto error = std::exchange(state_->error, nullptr)) {
            std::rethrow_exception(error);
        }
        co_return std::nullopt;
    }
    co_return std::optional<StreamItem>(std::move(item));
}

boost::asio::awaitable<void> GeneratorStream::close() {
    if (finished_) {
        co_return;
    }
    finished_ = true;
    if (!state_->channel) {
        // Never started, so the body never ran.
        co_return;
    }
    state_->cancelled = true;
    state_->channel->close();
    // Give the producer one turn to observe the closed channel and unwind. close() is also
    // called on the cancellation exit path, so the yield must not throw.
    auto executor = co_await boost::asio::this_coro::executor;
    const bool throwing = co_await boost::asio::this_coro::throw_if_cancelled();
    co_await boost::asio::this_coro::throw_if_cancelled(false);
    co_await boost::asio::post(executor, boost::asio::use_awaitable);
    co_await boost::asio::this_coro::throw_if_cancelled(throwing);
}

StreamPtr makeGenerator(GeneratorBody body) {
    return std::make_shared<GeneratorStream>(std::move(body));
}

namespace {

class ReplayCursor final : public AsyncStream {
public:
    explicit ReplayCursor(std::shared_ptr<ReplayableStream> source) : source_(std::move(source)) {}

    boost::asio::awaitable<std::optional<StreamItem>> next() override {
        auto item = co_await source_->itemAt(position_);
        if (item) {
            ++position_;
        }
        co_return item;
    }

private:
    std::shared_ptr<ReplayableStream> source_;
    std::size_t position_ = 0;
};

} // namespace

StreamPtr ReplayableStream::cursor() {
    return std::make_shared<ReplayCursor>(shared_from_this());
}

boost::asio::awaitable<bool> ReplayableStream::pullOne() {
    if (exhausted_) {
        co_return false;
    }
    if (pulling_) {
        throw std::logic_error("ReplayableStream: overlapping pulls on a shared stage output");
    }

    pulling_ = true;
    std::optional<StreamItem> item;
    try {
        item = co_await source_->next();
    } catch (...) {
        error_ = std::current_exception();
    }
    pulling_ = false;

    if (error_ || !item) {
        exhausted_ = true;
        source_.reset();
        co_return false;
    }
    buffer_.push_back(std::move(*item));
    co_return true;
}

boost::asio::awaitable<std::optional<StreamItem>> ReplayableStream::itemAt(std::size_t index) {
    while (index >= buffer_.size()) {
        if (!co_await pullOne()) {
            if (error_) {
                std::rethrow_exception(error_);
            }
            co_return std::nullopt;
        }
    }
    co_return std::optional<StreamItem>(buffer_[index]);
}

boost::asio::awaitable<void> ReplayableStream::materialize() {
    while (co_await pullOne()) {
    }
    if (error_) {
        std::rethrow_exception(error_);
    }
}

boost::asio::awaitable<std::vector<StreamItem>> collect(StreamPtr stream) {
    std::vector<StreamItem> out;
    while (auto item = co_await stream->next()) {
        out.push_back(std::move(*item));
    }
    co_return out;
}

boost::asio::awaitable<std::vector<Value>> flatten(StreamPtr stream) {
    std::vector<Value> out;
    while (auto item = co_await stream->next()) {
        if (auto* nested = std::get_if<StreamPtr>(&*item)) {
            if (!*nested) {
                continue;
            }
            auto inner = co_await flatten(*nested);
            out.insert(out.end(), std::make_move_iterator(inner.begin()),
                       std::make_move_iterator(inner.end()));
        } else {
            out.push_back(std::move(std::get<Value>(*item)));
        }
    }
    co_return out;
}

} // namespace ragline::pipeline

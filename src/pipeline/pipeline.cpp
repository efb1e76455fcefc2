#include <ragline/pipeline/pipeline.h>
#include <ragline/pipeline/run_log_sink.h>

#include <algorithm>
#include <exception>
#include <map>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace ragline::pipeline {

namespace {

// Per-invocation wiring shared by every stage of one run.
struct RunWiring {
    std::shared_ptr<StateStore> state;
    RunContext context;
    std::shared_ptr<const RunSettings> settings;
    std::map<std::string, std::shared_ptr<ReplayableStream>> outputs;
    bool failureLogged = false;
};

class StageStream final : public AsyncStream {
public:
    StageStream(std::shared_ptr<Pipe> pipe, std::vector<UpstreamRef> refs, StreamPtr upstream,
                std::shared_ptr<RunWiring> wiring)
        : pipe_(std::move(pipe)),
          refs_(std::move(refs)),
          upstream_(std::move(upstream)),
          wiring_(std::move(wiring)) {}

    boost::asio::awaitable<std::optional<StreamItem>> next() override {
        try {
            if (!output_) {
                co_await start();
            }
            co_return co_await output_->next();
        } catch (const std::exception& e) {
            // Inner stages fail first, so the first stage to see the error names the culprit.
            if (!wiring_->failureLogged) {
                wiring_->failureLogged = true;
                spdlog::error("[Pipeline] run {} failed in pipe '{}': {}", wiring_->context.runId,
                              pipe_->name(), e.what());
            }
            throw;
        }
    }

    boost::asio::awaitable<void> close() override {
        if (closed_) {
            co_return;
        }
        closed_ = true;
        std::exception_ptr failure;
        if (output_) {
            try {
                co_await output_->close();
            } catch (...) {
                failure = std::current_exception();
            }
        }
        if (upstream_) {
            try {
                co_await upstream_->close();
            } catch (...) {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

private:
    boost::asio::awaitable<void> start() {
        PipeInput input;
        input.message = upstream_;
        input.settings = wiring_->settings;

        // refs_ is ordered latest source first; consecutive refs share a source.
        for (std::size_t i = 0; i < refs_.size();) {
            const auto& from = refs_[i].fromStage;
            auto source = wiring_->outputs.find(from);
            if (source == wiring_->outputs.end()) {
                throw PipelineException(ErrorCode::InvalidState,
                                        "output of stage '" + from + "' is not registered");
            }
            co_await source->second->materialize();

            for (; i < refs_.size() && refs_[i].fromStage == from; ++i) {
                const auto& ref = refs_[i];
                if (input.hasField(ref.inputField)) {
                    continue;
                }
                if (!wiring_->state->contains(from, ref.outputField)) {
                    throw PipelineException(ErrorCode::InvalidArgument,
                                            "stage '" + from + "' did not publish field '" +
                                                ref.outputField + "' required by '" +
                                                pipe_->name() + "'");
                }
                auto value = wiring_->state->read(from, ref.outputField);
                if (!value) {
                    throw PipelineException(value.error().code, value.error().message);
                }
                input.fields.emplace(ref.inputField, std::move(value).value());
            }
        }

        output_ = co_await pipe_->run(std::move(input), wiring_->state, wiring_->context);
    }

    std::shared_ptr<Pipe> pipe_;
    std::vector<UpstreamRef> refs_;
    StreamPtr upstream_;
    std::shared_ptr<RunWiring> wiring_;
    StreamPtr output_;
    bool closed_ = false;
};

// Keeps the run registered while the caller consumes a streamed result.
class RunScopedStream final : public AsyncStream {
public:
    RunScopedStream(StreamPtr inner, std::shared_ptr<RunManager> manager, RunManager::Scope scope)
        : inner_(std::move(inner)), manager_(std::move(manager)), scope_(std::move(scope)) {}

    boost::asio::awaitable<std::optional<StreamItem>> next() override {
        if (!scope_) {
            co_return std::nullopt;
        }
        std::optional<StreamItem> item;
        try {
            item = co_await inner_->next();
        } catch (const std::exception&) {
            scope_.reset();
            throw;
        }
        if (!item) {
            scope_.reset();
        }
        co_return item;
    }

    boost::asio::awaitable<void> close() override {
        if (!scope_) {
            co_return;
        }
        // Moved out so the run ends even when the inner close throws.
        auto scope = std::exchange(scope_, std::nullopt);
        co_await inner_->close();
    }

private:
    StreamPtr inner_;
    std::shared_ptr<RunManager> manager_;
    std::optional<RunManager::Scope> scope_;
};

} // namespace

StreamPtr attachRunScope(StreamPtr inner, std::shared_ptr<RunManager> manager,
                         RunManager::Scope scope) {
    return std::make_shared<RunScopedStream>(std::move(inner), std::move(manager),
                                             std::move(scope));
}

Pipeline::Pipeline(std::shared_ptr<RunManager> runManager, RunType runType)
    : runManager_(runManager ? std::move(runManager) : std::make_shared<RunManager>()),
      runType_(runType) {}

Result<void> Pipeline::addPipe(std::shared_ptr<Pipe> pipe, std::vector<UpstreamRef> upstreamRefs) {
    if (!pipe) {
        return Error{ErrorCode::InvalidArgument, "pipe is null"};
    }
    if (pipe->name().empty()) {
        return Error{ErrorCode::InvalidArgument, "pipe name is empty"};
    }
    if (positions_.count(pipe->name())) {
        return Error{ErrorCode::InvalidArgument, "duplicate pipe name: " + pipe->name()};
    }
    for (const auto& ref : upstreamRefs) {
        if (!positions_.count(ref.fromStage)) {
            return Error{ErrorCode::InvalidArgument, "pipe '" + pipe->name() +
                                                         "' references unknown earlier stage '" +
                                                         ref.fromStage + "'"};
        }
        if (ref.inputField.empty() || ref.outputField.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "upstream ref from '" + ref.fromStage + "' needs both field names"};
        }
    }

    std::stable_sort(upstreamRefs.begin(), upstreamRefs.end(),
                     [this](const UpstreamRef& a, const UpstreamRef& b) {
                         return positions_.at(a.fromStage) > positions_.at(b.fromStage);
                     });
    for (const auto& ref : upstreamRefs) {
        stages_[positions_.at(ref.fromStage)].referenced = true;
    }

    if (!pipe->logSink() && runManager_->sink()) {
        pipe->setLogSink(runManager_->sink());
    }
    positions_.emplace(pipe->name(), stages_.size());
    stages_.push_back(Stage{std::move(pipe), std::move(upstreamRefs), false});
    return {};
}

std::vector<std::string> Pipeline::pipeNames() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage.pipe->name());
    }
    return names;
}

boost::asio::awaitable<StreamPtr> Pipeline::runStream(StreamPtr input, RunOptions options) {
    auto scope = runManager_->withRun(options.runContext, runType_);
    if (options.logRunInfo) {
        co_await runManager_->logRunInfo(scope.context(), options.actor);
    }

    auto wiring = std::make_shared<RunWiring>();
    wiring->state = options.state ? std::move(options.state) : std::make_shared<StateStore>();
    wiring->context = scope.context();
    wiring->settings =
        options.settings ? std::move(options.settings) : std::make_shared<const RunSettings>();

    StreamPtr current = input ? std::move(input) : makeStream({});
    for (const auto& stage : stages_) {
        auto stream = std::make_shared<StageStream>(stage.pipe, stage.refs, std::move(current),
                                                    wiring);
        if (stage.referenced) {
            auto memo = std::make_shared<ReplayableStream>(std::move(stream));
            wiring->outputs.emplace(stage.pipe->name(), memo);
            current = memo->cursor();
        } else {
            current = std::move(stream);
        }
    }

    spdlog::debug("[Pipeline] run {} wired {} stage(s)", wiring->context.runId, stages_.size());
    co_return attachRunScope(std::move(current), runManager_, std::move(scope));
}

boost::asio::awaitable<std::vector<Value>> Pipeline::run(StreamPtr input, RunOptions options) {
    auto stream = co_await runStream(std::move(input), std::move(options));
    co_return co_await flatten(std::move(stream));
}

} // namespace ragline::pipeline

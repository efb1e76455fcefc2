#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <ragline/core/types.h>
#include <ragline/pipeline/pipe.h>
#include <ragline/pipeline/run_context.h>
#include <ragline/pipeline/run_settings.h>
#include <ragline/pipeline/state_store.h>
#include <ragline/pipeline/stream.h>

namespace ragline::pipeline {

// "Before running this stage, bind `fromStage`'s published `outputField` to `inputField`."
struct UpstreamRef {
    std::string fromStage;
    std::string inputField;
    std::string outputField;
};

struct RunOptions {
    // Shared run state; a fresh store is created when empty.
    std::shared_ptr<StateStore> state;
    // Caller's run, reused instead of opening a new one.
    std::optional<RunContext> runContext;
    std::shared_ptr<const RunSettings> settings;
    bool logRunInfo = true;
    std::string actor = "system";
};

// Raised when a run cannot be wired up, as opposed to a failure inside a pipe's logic.
class PipelineException : public std::runtime_error {
public:
    PipelineException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Wraps a streamed result so the run stays registered until the stream ends, is closed or dropped.
StreamPtr attachRunScope(StreamPtr inner, std::shared_ptr<RunManager> manager,
                         RunManager::Scope scope);

/**
 * @brief Linear composition of pipes with side-channel (UpstreamRef) dependencies.
 *
 * Stages are composed lazily: every stage is started by the first pull on its output, so the
 * last stage drives production of the whole chain. A stage that declares UpstreamRefs forces the
 * referenced stages to completion before it starts; their outputs are memoized so that the stage
 * consuming them directly still sees every item.
 *
 * Refs are resolved in descending order of the referenced stage's position and the first binding
 * of an input field is kept, so when two stages publish the same field the later one wins.
 */
class Pipeline {
public:
    explicit Pipeline(std::shared_ptr<RunManager> runManager = nullptr,
                      RunType runType = RunType::Other);
    virtual ~Pipeline() = default;

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // InvalidArgument on a duplicate pipe name or a ref to a stage that is not already added.
    Result<void> addPipe(std::shared_ptr<Pipe> pipe, std::vector<UpstreamRef> upstreamRefs = {});

    // Runs to completion and returns the last stage's output with nested streams flattened.
    boost::asio::awaitable<std::vector<Value>> run(StreamPtr input, RunOptions options = {});

    // Returns the last stage's raw output. The run stays registered until the stream is
    // exhausted, closed or dropped.
    boost::asio::awaitable<StreamPtr> runStream(StreamPtr input, RunOptions options = {});

    std::size_t size() const { return stages_.size(); }
    bool empty() const { return stages_.empty(); }
    RunType runType() const { return runType_; }
    const std::shared_ptr<RunManager>& runManager() const { return runManager_; }
    std::vector<std::string> pipeNames() const;

private:
    struct Stage {
        std::shared_ptr<Pipe> pipe;
        // Sorted by the referenced stage's position, latest first.
        std::vector<UpstreamRef> refs;
        // Some later stage reads this one through a ref; its output must be memoized.
        bool referenced = false;
    };

    std::shared_ptr<RunManager> runManager_;
    RunType runType_;
    std::vector<Stage> stages_;
    std::unordered_map<std::string, std::size_t> positions_;
};

} // namespace ragline::pipeline

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>
#include <ragline/core/types.h>

namespace ragline::pipeline {

class RunLogSink;

enum class RunType { Ingestion, Search, Rag, Eval, Other };

constexpr const char* runTypeToString(RunType type) {
    switch (type) {
        case RunType::Ingestion: return "ingestion";
        case RunType::Search: return "search";
        case RunType::Rag: return "rag";
        case RunType::Eval: return "eval";
        case RunType::Other: return "other";
    }
    return "other";
}

Result<RunType> parseRunType(std::string_view name);

// Identifies one logical run. Passed explicitly to every pipe and log call.
struct RunContext {
    std::string runId;
    RunType runType = RunType::Other;
};

/**
 * @brief Registry of active runs.
 *
 * withRun() returns a scope object; the run stays registered for the scope's lifetime and is
 * released by its destructor on every exit path. A scope built from a caller-supplied context
 * that is already active reuses it and leaves the registration to the owner.
 */
class RunManager {
public:
    class Scope {
    public:
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope(Scope&& other) noexcept;
        Scope& operator=(Scope&&) = delete;
        ~Scope();

        const RunContext& context() const { return context_; }
        bool owns() const { return owner_ != nullptr; }

    private:
        friend class RunManager;
        Scope(RunManager* owner, RunContext context) : owner_(owner), context_(std::move(context)) {}

        RunManager* owner_;
        RunContext context_;
    };

    explicit RunManager(std::shared_ptr<RunLogSink> sink = nullptr);

    RunManager(const RunManager&) = delete;
    RunManager& operator=(const RunManager&) = delete;

    // Mints a run id when none is given.
    Scope withRun(RunType type, std::optional<std::string> runId = std::nullopt);

    // Reuses an existing context when supplied, otherwise starts a fresh run of `type`.
    Scope withRun(const std::optional<RunContext>& existing, RunType type);

    // Records run info with the sink. Throws std::logic_error("no run id set") when the
    // context is not an active run.
    boost::asio::awaitable<void> logRunInfo(const RunContext& context, const std::string& actor);

    bool isActive(const std::string& runId) const;
    std::optional<RunType> runTypeOf(const std::string& runId) const;
    std::size_t activeRunCount() const;

    const std::shared_ptr<RunLogSink>& sink() const { return sink_; }

private:
    void release(const std::string& runId);

    std::shared_ptr<RunLogSink> sink_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunType> runs_;
};

} // namespace ragline::pipeline

#include <ragline/core/uuid.h>
#include <ragline/pipeline/run_context.h>
#include <ragline/pipeline/run_log_sink.h>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace ragline::pipeline {

Result<RunType> parseRunType(std::string_view name) {
    if (name == "ingestion")
        return RunType::Ingestion;
    if (name == "search")
        return RunType::Search;
    if (name == "rag")
        return RunType::Rag;
    if (name == "eval")
        return RunType::Eval;
    if (name == "other")
        return RunType::Other;
    return Error{ErrorCode::InvalidArgument, "unknown run type: " + std::string(name)};
}

RunManager::Scope::Scope(Scope&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), context_(std::move(other.context_)) {}

RunManager::Scope::~Scope() {
    if (owner_) {
        owner_->release(context_.runId);
    }
}

RunManager::RunManager(std::shared_ptr<RunLogSink> sink) : sink_(std::move(sink)) {}

RunManager::Scope RunManager::withRun(RunType type, std::optional<std::string> runId) {
    RunContext context{runId ? std::move(*runId) : core::generateUUID(), type};

    std::lock_guard<std::mutex> lk(mutex_);
    auto [it, inserted] = runs_.emplace(context.runId, type);
    if (!inserted) {
        // Someone else registered this id; they release it.
        context.runType = it->second;
        return Scope(nullptr, std::move(context));
    }
    spdlog::debug("[RunManager] run {} started ({})", context.runId, runTypeToString(type));
    return Scope(this, std::move(context));
}

RunManager::Scope RunManager::withRun(const std::optional<RunContext>& existing, RunType type) {
    if (!existing || existing->runId.empty()) {
        return withRun(type);
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (runs_.find(existing->runId) != runs_.end()) {
            return Scope(nullptr, *existing);
        }
    }
    // A caller-minted id that is not registered yet: this scope owns the registration.
    return withRun(existing->runType, existing->runId);
}

boost::asio::awaitable<void> RunManager::logRunInfo(const RunContext& context,
                                                    const std::string& actor) {
    if (context.runId.empty() || !isActive(context.runId)) {
        throw std::logic_error("no run id set");
    }
    if (!sink_) {
        co_return;
    }
    try {
        co_await sink_->logRunInfo(context.runId, context.runType, actor);
    } catch (const std::exception& e) {
        // Run logging never decides whether the run itself proceeds.
        spdlog::warn("[RunManager] failed to record run info for {}: {}", context.runId,
                     e.what());
    }
}

bool RunManager::isActive(const std::string& runId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return runs_.find(runId) != runs_.end();
}

std::optional<RunType> RunManager::runTypeOf(const std::string& runId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = runs_.find(runId);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t RunManager::activeRunCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return runs_.size();
}

void RunManager::release(const std::string& runId) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (runs_.erase(runId) > 0) {
        spdlog::debug("[RunManager] run {} released", runId);
    }
}

} // namespace ragline::pipeline

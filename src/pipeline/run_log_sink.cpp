#include <ragline/pipeline/run_log_sink.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ragline::pipeline {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() %
        1000000;

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros << 'Z';
    return oss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// MemoryRunLogSink
// ---------------------------------------------------------------------------

boost::asio::awaitable<void> MemoryRunLogSink::log(const std::string& runId,
                                                   const std::string& key,
                                                   const std::string& value) {
    std::lock_guard<std::mutex> lk(mutex_);
    entries_.push_back({std::chrono::system_clock::now(), runId, key, value});
    co_return;
}

boost::asio::awaitable<void> MemoryRunLogSink::logRunInfo(const std::string& runId,
                                                          RunType runType,
                                                          const std::string& actor) {
    std::lock_guard<std::mutex> lk(mutex_);
    runInfo_.push_back({std::chrono::system_clock::now(), runId, runType, actor});
    co_return;
}

std::vector<RunLogEntry> MemoryRunLogSink::getLogs(const std::vector<std::string>& runIds,
                                                   std::size_t limitPerRun) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::unordered_map<std::string, std::size_t> taken;
    for (const auto& id : runIds) {
        taken.emplace(id, 0);
    }

    std::vector<RunLogEntry> out;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        auto t = taken.find(it->runId);
        if (t == taken.end() || t->second >= limitPerRun) {
            continue;
        }
        ++t->second;
        out.push_back(*it);
    }
    return out;
}

std::vector<RunInfoEntry> MemoryRunLogSink::getRunInfo(std::size_t offset, std::size_t limit,
                                                       std::optional<RunType> runTypeFilter) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<RunInfoEntry> out;
    std::size_t skipped = 0;
    for (auto it = runInfo_.rbegin(); it != runInfo_.rend() && out.size() < limit; ++it) {
        if (runTypeFilter && it->runType != *runTypeFilter) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        out.push_back(*it);
    }
    return out;
}

std::size_t MemoryRunLogSink::entryCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

// ---------------------------------------------------------------------------
// SpdlogRunLogSink
// ---------------------------------------------------------------------------

SpdlogRunLogSink::SpdlogRunLogSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

boost::asio::awaitable<void> SpdlogRunLogSink::log(const std::string& runId,
                                                   const std::string& key,
                                                   const std::string& value) {
    logger_->info("[run {}] {}={}", runId, key, value);
    co_return;
}

boost::asio::awaitable<void> SpdlogRunLogSink::logRunInfo(const std::string& runId,
                                                          RunType runType,
                                                          const std::string& actor) {
    logger_->info("[run {}] started type={} actor={}", runId, runTypeToString(runType), actor);
    co_return;
}

// ---------------------------------------------------------------------------
// JsonlRunLogSink
// ---------------------------------------------------------------------------

Result<std::shared_ptr<JsonlRunLogSink>>
JsonlRunLogSink::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "cannot create run log directory " +
                                                 path.parent_path().string() + ": " +
                                                 ec.message()};
        }
    }
    std::ofstream out(path, std::ios::app);
    if (!out) {
        return Error{ErrorCode::IOError, "cannot open run log file " + path.string()};
    }
    return std::shared_ptr<JsonlRunLogSink>(new JsonlRunLogSink(path, std::move(out)));
}

void JsonlRunLogSink::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lk(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("failed writing run log file " + path_.string());
    }
}

boost::asio::awaitable<void> JsonlRunLogSink::log(const std::string& runId,
                                                  const std::string& key,
                                                  const std::string& value) {
    nlohmann::json j{{"timestamp", formatTimestamp(std::chrono::system_clock::now())},
                     {"run_id", runId},
                     {"key", key},
                     {"value", value}};
    writeLine(j.dump());
    co_return;
}

boost::asio::awaitable<void> JsonlRunLogSink::logRunInfo(const std::string& runId,
                                                         RunType runType,
                                                         const std::string& actor) {
    nlohmann::json j{{"timestamp", formatTimestamp(std::chrono::system_clock::now())},
                     {"run_id", runId},
                     {"run_type", runTypeToString(runType)},
                     {"actor", actor}};
    writeLine(j.dump());
    co_return;
}

} // namespace ragline::pipeline

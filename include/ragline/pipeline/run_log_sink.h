#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <ragline/core/types.h>
#include <ragline/pipeline/run_context.h>

namespace spdlog {
class logger;
}

namespace ragline::pipeline {

struct RunLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string runId;
    std::string key;
    std::string value;
};

struct RunInfoEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string runId;
    RunType runType = RunType::Other;
    std::string actor;
};

/**
 * @brief Destination for run-scoped key/value logs.
 *
 * Calls are fire-and-forget from the pipeline's point of view: a pipe forwards entries from a
 * bounded queue and swallows sink failures after counting them.
 */
class RunLogSink {
public:
    virtual ~RunLogSink() = default;

    virtual boost::asio::awaitable<void> log(const std::string& runId, const std::string& key,
                                             const std::string& value) = 0;

    virtual boost::asio::awaitable<void> logRunInfo(const std::string& runId, RunType runType,
                                                    const std::string& actor) = 0;
};

/**
 * @brief In-memory sink with simple query support.
 */
class MemoryRunLogSink final : public RunLogSink {
public:
    boost::asio::awaitable<void> log(const std::string& runId, const std::string& key,
                                     const std::string& value) override;
    boost::asio::awaitable<void> logRunInfo(const std::string& runId, RunType runType,
                                            const std::string& actor) override;

    // Newest first, at most limitPerRun entries for each requested run.
    std::vector<RunLogEntry> getLogs(const std::vector<std::string>& runIds,
                                     std::size_t limitPerRun = 100) const;

    // Newest first.
    std::vector<RunInfoEntry> getRunInfo(std::size_t offset = 0, std::size_t limit = 100,
                                         std::optional<RunType> runTypeFilter = std::nullopt) const;

    std::size_t entryCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<RunLogEntry> entries_;
    std::vector<RunInfoEntry> runInfo_;
};

/**
 * @brief Forwards run logs to an spdlog logger (the default logger when none is given).
 */
class SpdlogRunLogSink final : public RunLogSink {
public:
    explicit SpdlogRunLogSink(std::shared_ptr<spdlog::logger> logger = nullptr);

    boost::asio::awaitable<void> log(const std::string& runId, const std::string& key,
                                     const std::string& value) override;
    boost::asio::awaitable<void> logRunInfo(const std::string& runId, RunType runType,
                                            const std::string& actor) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Appends one JSON object per line to a file.
 */
class JsonlRunLogSink final : public RunLogSink {
public:
    static Result<std::shared_ptr<JsonlRunLogSink>> open(const std::filesystem::path& path);

    boost::asio::awaitable<void> log(const std::string& runId, const std::string& key,
                                     const std::string& value) override;
    boost::asio::awaitable<void> logRunInfo(const std::string& runId, RunType runType,
                                            const std::string& actor) override;

    const std::filesystem::path& path() const { return path_; }

private:
    JsonlRunLogSink(std::filesystem::path path, std::ofstream out)
        : path_(std::move(path)), out_(std::move(out)) {}

    void writeLine(const std::string& line);

    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
};

} // namespace ragline::pipeline

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include <ragline/config/config_helpers.h>
#include <ragline/core/types.h>
#include <ragline/pipeline/run_settings.h>

namespace ragline::pipeline {
class RunLogSink;
}

namespace ragline::config {

struct RunLoggingConfig {
    // memory | spdlog | jsonl
    std::string provider = "memory";
    // Output file for the jsonl provider.
    std::filesystem::path path;
};

struct PipelineConfig {
    std::size_t maxLogQueueSize = 100;
    std::size_t branchQueueCapacity = 32;
    std::string logLevel = "info";
    RunLoggingConfig runLogging;
    pipeline::SearchSettings search;
    pipeline::GenerationConfig generation;
};

// Applies the [pipeline], [run_logging], [search] and [generation] sections over the defaults.
// Unknown keys are ignored; malformed values fail with ParseError naming section.key.
Result<PipelineConfig> parse_pipeline_config(const ConfigMap& raw);

Result<PipelineConfig> load_pipeline_config(const std::filesystem::path& config_path);

/**
 * Resolves the effective configuration: the file from get_config_path(override_path) when it
 * exists (an explicitly named file must exist), defaults otherwise, then RAGLINE_LOG_LEVEL.
 */
Result<PipelineConfig> resolve_pipeline_config(const std::string& override_path = "");

Result<std::shared_ptr<pipeline::RunLogSink>> make_run_log_sink(const RunLoggingConfig& config);

} // namespace ragline::config

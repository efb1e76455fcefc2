#include <ragline/config/pipeline_config.h>
#include <ragline/pipeline/run_log_sink.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>

namespace ragline::config {

namespace {

const std::string* lookup(const ConfigMap& raw, const std::string& section,
                          const std::string& key) {
    auto sec = raw.find(section);
    if (sec == raw.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

Error badValue(const std::string& section, const std::string& key, const std::string& value,
               const char* expected) {
    return Error{ErrorCode::ParseError,
                 section + "." + key + ": expected " + expected + ", got '" + value + "'"};
}

Result<void> readSize(const ConfigMap& raw, const std::string& section, const std::string& key,
                      std::size_t& out) {
    const auto* value = lookup(raw, section, key);
    if (!value) {
        return {};
    }
    std::size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return badValue(section, key, *value, "a non-negative integer");
    }
    out = parsed;
    return {};
}

Result<void> readInt(const ConfigMap& raw, const std::string& section, const std::string& key,
                     int& out) {
    const auto* value = lookup(raw, section, key);
    if (!value) {
        return {};
    }
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return badValue(section, key, *value, "an integer");
    }
    out = parsed;
    return {};
}

Result<void> readDouble(const ConfigMap& raw, const std::string& section, const std::string& key,
                        double& out) {
    const auto* value = lookup(raw, section, key);
    if (!value) {
        return {};
    }
    char* end = nullptr;
    double parsed = std::strtod(value->c_str(), &end);
    if (value->empty() || end != value->c_str() + value->size()) {
        return badValue(section, key, *value, "a number");
    }
    out = parsed;
    return {};
}

Result<void> readBool(const ConfigMap& raw, const std::string& section, const std::string& key,
                      bool& out) {
    const auto* value = lookup(raw, section, key);
    if (!value) {
        return {};
    }
    auto parsed = parse_bool(*value);
    if (!parsed) {
        return badValue(section, key, *value, "a boolean");
    }
    out = *parsed;
    return {};
}

bool isLogLevel(const std::string& level) {
    static constexpr std::array<const char*, 9> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

} // namespace

Result<PipelineConfig> parse_pipeline_config(const ConfigMap& raw) {
    PipelineConfig cfg;

    for (auto r : {readSize(raw, "pipeline", "max_log_queue_size", cfg.maxLogQueueSize),
                   readSize(raw, "pipeline", "branch_queue_capacity", cfg.branchQueueCapacity),
                   readSize(raw, "search", "limit", cfg.search.limit),
                   readBool(raw, "search", "vector_enabled", cfg.search.useVectorSearch),
                   readBool(raw, "search", "graph_enabled", cfg.search.useGraphSearch),
                   readBool(raw, "search", "fulltext", cfg.search.useFullTextSearch),
                   readBool(raw, "search", "hybrid", cfg.search.useHybridSearch),
                   readDouble(raw, "search", "semantic_weight", cfg.search.semanticWeight),
                   readDouble(raw, "search", "fulltext_weight", cfg.search.fullTextWeight),
                   readInt(raw, "search", "rrf_k", cfg.search.rrfK),
                   readDouble(raw, "generation", "temperature", cfg.generation.temperature),
                   readInt(raw, "generation", "max_tokens", cfg.generation.maxTokens),
                   readBool(raw, "generation", "stream", cfg.generation.stream)}) {
        if (!r) {
            return r.error();
        }
    }

    if (const auto* level = lookup(raw, "pipeline", "log_level")) {
        if (!isLogLevel(*level)) {
            return badValue("pipeline", "log_level", *level, "a log level");
        }
        cfg.logLevel = *level;
    }
    if (const auto* model = lookup(raw, "generation", "model"); model && !model->empty()) {
        cfg.generation.model = *model;
    }
    if (const auto* provider = lookup(raw, "run_logging", "provider")) {
        if (*provider != "memory" && *provider != "spdlog" && *provider != "jsonl") {
            return badValue("run_logging", "provider", *provider, "memory, spdlog or jsonl");
        }
        cfg.runLogging.provider = *provider;
    }
    if (const auto* path = lookup(raw, "run_logging", "path"); path && !path->empty()) {
        cfg.runLogging.path = expand_tilde(*path);
    }
    if (cfg.runLogging.provider == "jsonl" && cfg.runLogging.path.empty()) {
        cfg.runLogging.path = get_config_dir() / "runs.jsonl";
    }
    if (cfg.branchQueueCapacity == 0) {
        return badValue("pipeline", "branch_queue_capacity", "0", "a positive integer");
    }

    return cfg;
}

Result<PipelineConfig> load_pipeline_config(const std::filesystem::path& config_path) {
    auto raw = parse_config_file(config_path);
    if (!raw) {
        return raw.error();
    }
    return parse_pipeline_config(raw.value());
}

Result<PipelineConfig> resolve_pipeline_config(const std::string& override_path) {
    auto path = get_config_path(override_path);
    const char* env = std::getenv("RAGLINE_CONFIG");
    bool explicitPath = !override_path.empty() || (env && *env);

    Result<PipelineConfig> cfg = PipelineConfig{};
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] loading {}", path.string());
        cfg = load_pipeline_config(path);
    } else if (explicitPath) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }
    if (!cfg) {
        return cfg;
    }

    auto resolved = std::move(cfg).value();
    if (const char* level = std::getenv("RAGLINE_LOG_LEVEL"); level && *level) {
        if (!isLogLevel(level)) {
            return Error{ErrorCode::ParseError,
                         std::string("RAGLINE_LOG_LEVEL: unknown log level '") + level + "'"};
        }
        resolved.logLevel = level;
    }
    return resolved;
}

Result<std::shared_ptr<pipeline::RunLogSink>> make_run_log_sink(const RunLoggingConfig& config) {
    if (config.provider == "memory") {
        return std::shared_ptr<pipeline::RunLogSink>(
            std::make_shared<pipeline::MemoryRunLogSink>());
    }
    if (config.provider == "spdlog") {
        return std::shared_ptr<pipeline::RunLogSink>(
            std::make_shared<pipeline::SpdlogRunLogSink>());
    }
    if (config.provider == "jsonl") {
        auto sink = pipeline::JsonlRunLogSink::open(config.path);
        if (!sink) {
            return sink.error();
        }
        return std::shared_ptr<pipeline::RunLogSink>(std::move(sink).value());
    }
    return Error{ErrorCode::InvalidArgument, "unknown run log provider: " + config.provider};
}

} // namespace ragline::config

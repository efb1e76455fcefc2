#include <ragline/config/pipeline_config.h>
#include <ragline/pipeline/rag_pipeline.h>
#include <ragline/pipeline/run_log_sink.h>
#include <ragline/pipeline/search_pipeline.h>
#include <ragline/pipes/graph_search_pipe.h>
#include <ragline/pipes/rag_generation_pipe.h>
#include <ragline/pipes/vector_search_pipe.h>
#include <ragline/providers/in_memory_providers.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace ragline;

struct CommonOptions {
    std::string configPath;
    std::string logLevel;
    std::string corpusPath;
    std::string graphPath;
    std::optional<std::size_t> limit;
    bool noVector = false;
    bool fullText = false;
    bool hybrid = false;
    std::vector<std::string> filters;
    std::vector<std::string> queries;
};

struct RagOptions {
    bool stream = false;
    std::string model;
    std::optional<int> maxTokens;
};

void setup_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("ragline");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

Result<pipeline::RunSettings> make_settings(const config::PipelineConfig& cfg,
                                            const CommonOptions& opts) {
    pipeline::RunSettings settings;
    settings.search = cfg.search;
    settings.generation = cfg.generation;
    if (opts.limit) {
        settings.search.limit = *opts.limit;
    }
    if (opts.noVector) {
        settings.search.useVectorSearch = false;
    }
    if (!opts.graphPath.empty()) {
        settings.search.useGraphSearch = true;
    }
    settings.search.useFullTextSearch = settings.search.useFullTextSearch || opts.fullText;
    settings.search.useHybridSearch = settings.search.useHybridSearch || opts.hybrid;
    for (const auto& filter : opts.filters) {
        auto eq = filter.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::InvalidArgument, "filter must be key=value: " + filter};
        }
        auto value = filter.substr(eq + 1);
        auto parsed = nlohmann::json::parse(value, nullptr, false);
        settings.search.filters[filter.substr(0, eq)] =
            parsed.is_discarded() ? nlohmann::json(value) : parsed;
    }
    return settings;
}

Result<std::shared_ptr<pipeline::SearchPipeline>>
build_search_pipeline(const config::PipelineConfig& cfg, const CommonOptions& opts,
                      std::shared_ptr<pipeline::RunManager> runManager) {
    auto embedder = std::make_shared<providers::HashEmbeddingProvider>();
    auto index = std::make_shared<providers::InMemorySearchProvider>(embedder);

    if (!opts.corpusPath.empty()) {
        auto docs = providers::loadJsonlCorpus(opts.corpusPath);
        if (!docs) {
            return docs.error();
        }
        for (auto& doc : std::move(docs).value()) {
            auto added = index->addDocument(std::move(doc));
            if (!added) {
                return added.error();
            }
        }
        spdlog::info("Loaded {} document(s) from {}", index->size(), opts.corpusPath);
    }

    auto search = std::make_shared<pipeline::SearchPipeline>(
        runManager, pipeline::SearchPipeline::Config{cfg.branchQueueCapacity});

    pipes::VectorSearchPipe::Config vectorCfg;
    vectorCfg.maxLogQueueSize = cfg.maxLogQueueSize;
    auto added = search->addVectorSearchPipe(
        std::make_shared<pipes::VectorSearchPipe>(embedder, index, vectorCfg));
    if (!added) {
        return added.error();
    }

    if (!opts.graphPath.empty()) {
        auto graph = providers::InMemoryGraphProvider::fromFile(opts.graphPath);
        if (!graph) {
            return graph.error();
        }
        spdlog::info("Loaded {} graph entit(ies) from {}", graph.value()->size(), opts.graphPath);
        pipes::GraphSearchPipe::Config graphCfg;
        graphCfg.maxLogQueueSize = cfg.maxLogQueueSize;
        added = search->addGraphSearchPipe(
            std::make_shared<pipes::GraphSearchPipe>(graph.value(), graphCfg));
        if (!added) {
            return added.error();
        }
    }
    return search;
}

boost::asio::awaitable<int> run_search(config::PipelineConfig cfg, CommonOptions opts) {
    auto sink = config::make_run_log_sink(cfg.runLogging);
    if (!sink) {
        spdlog::error("Run log sink: {}", sink.error().message);
        co_return 1;
    }
    auto runManager = std::make_shared<pipeline::RunManager>(sink.value());
    auto search = build_search_pipeline(cfg, opts, runManager);
    if (!search) {
        spdlog::error("{}", search.error().message);
        co_return 1;
    }
    auto settings = make_settings(cfg, opts);
    if (!settings) {
        spdlog::error("{}", settings.error().message);
        co_return 1;
    }

    std::vector<pipeline::Value> queries(opts.queries.begin(), opts.queries.end());
    pipeline::RunOptions runOptions;
    runOptions.settings = std::make_shared<const pipeline::RunSettings>(settings.value());
    runOptions.actor = "cli";

    auto aggregate =
        co_await search.value()->run(pipeline::makeStream(std::move(queries)), runOptions);
    std::cout << nlohmann::json(aggregate).dump(2) << std::endl;
    co_return 0;
}

boost::asio::awaitable<int> run_rag(config::PipelineConfig cfg, CommonOptions opts,
                                    RagOptions ragOpts) {
    auto sink = config::make_run_log_sink(cfg.runLogging);
    if (!sink) {
        spdlog::error("Run log sink: {}", sink.error().message);
        co_return 1;
    }
    auto runManager = std::make_shared<pipeline::RunManager>(sink.value());
    auto search = build_search_pipeline(cfg, opts, runManager);
    if (!search) {
        spdlog::error("{}", search.error().message);
        co_return 1;
    }
    auto settings = make_settings(cfg, opts);
    if (!settings) {
        spdlog::error("{}", settings.error().message);
        co_return 1;
    }
    auto runSettings = std::move(settings).value();
    if (ragOpts.stream) {
        runSettings.generation.stream = true;
    }
    if (!ragOpts.model.empty()) {
        runSettings.generation.model = ragOpts.model;
    }
    if (ragOpts.maxTokens) {
        runSettings.generation.maxTokens = *ragOpts.maxTokens;
    }

    auto generation = std::make_shared<pipeline::Pipeline>(runManager, pipeline::RunType::Rag);
    pipes::RagGenerationPipe::Config genCfg;
    genCfg.maxLogQueueSize = cfg.maxLogQueueSize;
    auto added = generation->addPipe(std::make_shared<pipes::RagGenerationPipe>(
        std::make_shared<providers::ExtractiveLlmProvider>(), genCfg));
    if (!added) {
        spdlog::error("{}", added.error().message);
        co_return 1;
    }

    pipeline::RagPipeline rag(search.value(), generation, runManager);
    std::vector<pipeline::Value> queries(opts.queries.begin(), opts.queries.end());
    pipeline::RunOptions runOptions;
    runOptions.settings = std::make_shared<const pipeline::RunSettings>(runSettings);
    runOptions.actor = "cli";

    if (!runSettings.generation.stream) {
        auto results = co_await rag.run(pipeline::makeStream(std::move(queries)), runOptions);
        std::cout << nlohmann::json(results).dump(2) << std::endl;
        co_return 0;
    }

    auto stream = co_await rag.runStream(pipeline::makeStream(std::move(queries)), runOptions);
    while (auto item = co_await stream->next()) {
        const auto& value = pipeline::itemValue(*item);
        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            std::cout << text;
            if (!text.empty() && text.front() == '<') {
                std::cout << '\n';
            }
        } else {
            std::cout << value.dump() << '\n';
        }
        std::cout.flush();
    }
    std::cout << std::endl;
    co_return 0;
}

void add_common_options(CLI::App* cmd, CommonOptions& opts) {
    cmd->add_option("--corpus", opts.corpusPath, "JSONL corpus, one {\"id\",\"text\"} per line")
        ->check(CLI::ExistingFile);
    cmd->add_option("--graph", opts.graphPath, "Entity graph JSON; enables graph search")
        ->check(CLI::ExistingFile);
    cmd->add_option("--limit", opts.limit, "Maximum results per branch");
    cmd->add_flag("--no-vector", opts.noVector, "Disable the vector search branch");
    cmd->add_flag("--fulltext", opts.fullText, "Use full-text matching in the vector branch");
    cmd->add_flag("--hybrid", opts.hybrid, "Fuse semantic and full-text rankings");
    cmd->add_option("--filter", opts.filters, "Metadata filter key=value (repeatable)");
    cmd->add_option("queries", opts.queries, "Query text(s)")->required();
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ragline - retrieval-augmented generation pipelines"};
    app.require_subcommand(1);

    CommonOptions opts;
    RagOptions ragOpts;
    app.add_option("--config", opts.configPath, "Configuration file path");
    app.add_option("--log-level", opts.logLevel, "Log level (trace/debug/info/warn/error)");

    auto* searchCmd = app.add_subcommand("search", "Run the fan-out search pipeline");
    add_common_options(searchCmd, opts);

    auto* ragCmd = app.add_subcommand("rag", "Search each query and generate an answer");
    add_common_options(ragCmd, opts);
    ragCmd->add_flag("--stream", ragOpts.stream, "Stream marker-delimited output");
    ragCmd->add_option("--model", ragOpts.model, "Generation model name");
    ragCmd->add_option("--max-tokens", ragOpts.maxTokens, "Maximum answer length in words");

    CLI11_PARSE(app, argc, argv);

    auto cfg = ragline::config::resolve_pipeline_config(opts.configPath);
    if (!cfg) {
        std::cerr << "Config error: " << cfg.error().message << std::endl;
        return 1;
    }
    auto config = std::move(cfg).value();
    if (!opts.logLevel.empty()) {
        config.logLevel = opts.logLevel;
    }
    setup_logging(config.logLevel);

    boost::asio::io_context io;
    int exitCode = 1;
    auto onDone = [&exitCode](std::exception_ptr error, int rc) {
        if (!error) {
            exitCode = rc;
            return;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            spdlog::error("Run failed: {}", e.what());
        }
    };

    if (searchCmd->parsed()) {
        boost::asio::co_spawn(io, run_search(config, opts), onDone);
    } else {
        boost::asio::co_spawn(io, run_rag(config, opts, ragOpts), onDone);
    }
    io.run();
    spdlog::shutdown();
    return exitCode;
}

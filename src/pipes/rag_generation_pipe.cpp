#include <ragline/pipes/rag_generation_pipe.h>

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace ragline::pipes {

namespace {

std::string marker(const char* name, bool closing) {
    return std::string(closing ? "</" : "<") + name + ">";
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

} // namespace

RagGenerationPipe::RagGenerationPipe(std::shared_ptr<providers::LlmProvider> llm, Config config)
    : Pipe(pipeline::PipeConfig{config.name, config.maxLogQueueSize}),
      llm_(std::move(llm)),
      config_(std::move(config)) {
    if (!llm_) {
        throw std::invalid_argument("RagGenerationPipe requires an LLM provider");
    }
}

std::string RagGenerationPipe::formatContext(const pipeline::Value& searchResults) {
    std::string context;
    std::size_t n = 0;
    auto append = [&](const std::string& line) {
        if (!context.empty()) {
            context += '\n';
        }
        context += "[" + std::to_string(++n) + "] " + line;
    };

    if (!searchResults.is_object()) {
        return context;
    }
    if (auto it = searchResults.find("vector_search_results");
        it != searchResults.end() && it->is_array()) {
        for (const auto& r : *it) {
            append(r.value("text", std::string{}));
        }
    }
    if (auto it = searchResults.find("graph_search_results");
        it != searchResults.end() && it->is_array()) {
        for (const auto& r : *it) {
            append(r.value("id", std::string{}) + ": " + r.value("text", std::string{}));
        }
    }
    return context;
}

std::string RagGenerationPipe::renderPrompt(const std::string& tmpl, const std::string& query,
                                            const std::string& context) {
    std::string prompt = tmpl;
    // Context first so a query containing "{context}" is left alone.
    replaceAll(prompt, "{context}", context);
    replaceAll(prompt, "{query}", query);
    return prompt;
}

pipeline::StreamPtr RagGenerationPipe::logic(pipeline::PipeInput input,
                                             std::shared_ptr<pipeline::StateStore> state,
                                             pipeline::RunContext runContext,
                                             pipeline::PipeLogger logger) {
    return pipeline::makeGenerator([this, input = std::move(input), state, runContext,
                                    logger](pipeline::StreamEmitter& emit)
                                       -> boost::asio::awaitable<void> {
        const auto& generation = input.settings->generation;
        while (auto item = co_await input.message->next()) {
            const auto& pair = pipeline::itemValue(*item);
            if (!pair.is_object() || !pair.contains("query") || !pair["query"].is_string()) {
                throw std::invalid_argument("expected a {query, search_results} pair, got: " +
                                            pair.dump());
            }
            auto query = pair["query"].get<std::string>();
            auto searchResults = pair.value("search_results", pipeline::Value::object());
            auto context = formatContext(searchResults);
            auto prompt = renderPrompt(generation.taskPromptOverride
                                           ? *generation.taskPromptOverride
                                           : config_.taskPrompt,
                                       query, context);
            std::vector<providers::Message> messages{{"system", config_.systemPrompt},
                                                     {"user", prompt}};

            if (generation.stream) {
                co_await emit(pipeline::Value(marker(kSearchMarker, false)));
                co_await emit(searchResults);
                co_await emit(pipeline::Value(marker(kSearchMarker, true)));
                co_await emit(pipeline::Value(marker(kCompletionMarker, false)));
                std::string text;
                auto chunks = llm_->completeStream(messages, generation);
                while (auto chunk = co_await chunks->next()) {
                    const auto& value = pipeline::itemValue(*chunk);
                    if (value.is_string()) {
                        text += value.get<std::string>();
                    }
                    co_await emit(value);
                }
                co_await emit(pipeline::Value(marker(kCompletionMarker, true)));
                logger.log("llm_response", text);
                auto published =
                    state->publish(name(), {{"output", {{"query", query}, {"completion", text}}}});
                if (!published) {
                    throw std::runtime_error(published.error().message);
                }
                continue;
            }

            auto completion = co_await llm_->complete(messages, generation);
            if (!completion) {
                throw std::runtime_error("completion failed: " + completion.error().message);
            }
            pipeline::Value completionJson = completion.value();
            logger.log("llm_response", completionJson);
            spdlog::debug("[RagGenerationPipe] run {} answered '{}'", runContext.runId, query);

            pipeline::Value output{{"query", query},
                                   {"search_results", searchResults},
                                   {"context", context},
                                   {"completion", completionJson}};
            auto published = state->publish(name(), {{"output", output}});
            if (!published) {
                throw std::runtime_error(published.error().message);
            }
            co_await emit(std::move(output));
        }
    });
}

} // namespace ragline::pipes

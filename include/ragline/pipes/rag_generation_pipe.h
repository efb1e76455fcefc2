#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <ragline/pipeline/pipe.h>
#include <ragline/providers/providers.h>

namespace ragline::pipes {

/**
 * Generation stage of the RAG pipeline. Consumes {"query", "search_results"} pairs, renders the
 * retrieved hits as a numbered context block and asks the LLM provider for an answer.
 *
 * With GenerationConfig::stream off, one {"query", "search_results", "context", "completion"}
 * object is emitted per pair. With it on, the pair is emitted as a marker-delimited sequence:
 * "<search>", the search results, "</search>", "<completion>", the text chunks, "</completion>".
 */
class RagGenerationPipe final : public pipeline::Pipe {
public:
    static constexpr const char* kSearchMarker = "search";
    static constexpr const char* kCompletionMarker = "completion";

    struct Config {
        std::string name = "rag_generation";
        std::size_t maxLogQueueSize = 100;
        std::string systemPrompt = "You are a helpful assistant.";
        // {query} and {context} are substituted.
        std::string taskPrompt = "## Task:\n"
                                 "Answer the query using the numbered context items.\n\n"
                                 "### Query:\n{query}\n\n"
                                 "### Context:\n{context}\n\n"
                                 "## Response:\n";
    };

    RagGenerationPipe(std::shared_ptr<providers::LlmProvider> llm, Config config);
    explicit RagGenerationPipe(std::shared_ptr<providers::LlmProvider> llm)
        : RagGenerationPipe(std::move(llm), Config{}) {}

    // "[n] text" per hit, vector hits first, then graph hits as "[n] name: description".
    static std::string formatContext(const pipeline::Value& searchResults);

    static std::string renderPrompt(const std::string& tmpl, const std::string& query,
                                    const std::string& context);

protected:
    pipeline::StreamPtr logic(pipeline::PipeInput input,
                              std::shared_ptr<pipeline::StateStore> state,
                              pipeline::RunContext runContext, pipeline::PipeLogger logger) override;

private:
    std::shared_ptr<providers::LlmProvider> llm_;
    Config config_;
};

} // namespace ragline::pipes

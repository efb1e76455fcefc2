#include <ragline/pipeline/run_settings.h>

namespace ragline::pipeline {

void to_json(nlohmann::json& j, const SearchSettings& s) {
    j = nlohmann::json{{"use_vector_search", s.useVectorSearch},
                       {"use_graph_search", s.useGraphSearch},
                       {"use_fulltext_search", s.useFullTextSearch},
                       {"use_hybrid_search", s.useHybridSearch},
                       {"limit", s.limit},
                       {"filters", s.filters},
                       {"semantic_weight", s.semanticWeight},
                       {"fulltext_weight", s.fullTextWeight},
                       {"rrf_k", s.rrfK}};
}

void from_json(const nlohmann::json& j, SearchSettings& s) {
    SearchSettings defaults;
    s.useVectorSearch = j.value("use_vector_search", defaults.useVectorSearch);
    s.useGraphSearch = j.value("use_graph_search", defaults.useGraphSearch);
    s.useFullTextSearch = j.value("use_fulltext_search", defaults.useFullTextSearch);
    s.useHybridSearch = j.value("use_hybrid_search", defaults.useHybridSearch);
    s.limit = j.value("limit", defaults.limit);
    s.filters = j.value("filters", nlohmann::json::object());
    s.semanticWeight = j.value("semantic_weight", defaults.semanticWeight);
    s.fullTextWeight = j.value("fulltext_weight", defaults.fullTextWeight);
    s.rrfK = j.value("rrf_k", defaults.rrfK);
}

void to_json(nlohmann::json& j, const GenerationConfig& c) {
    j = nlohmann::json{{"model", c.model},
                       {"temperature", c.temperature},
                       {"max_tokens", c.maxTokens},
                       {"stream", c.stream}};
    if (c.taskPromptOverride) {
        j["task_prompt_override"] = *c.taskPromptOverride;
    }
}

void from_json(const nlohmann::json& j, GenerationConfig& c) {
    GenerationConfig defaults;
    c.model = j.value("model", defaults.model);
    c.temperature = j.value("temperature", defaults.temperature);
    c.maxTokens = j.value("max_tokens", defaults.maxTokens);
    c.stream = j.value("stream", defaults.stream);
    if (j.contains("task_prompt_override") && j["task_prompt_override"].is_string()) {
        c.taskPromptOverride = j["task_prompt_override"].get<std::string>();
    } else {
        c.taskPromptOverride.reset();
    }
}

} // namespace ragline::pipeline

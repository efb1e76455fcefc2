#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ragline::pipeline {

// Per-call retrieval settings read by search branch pipes.
struct SearchSettings {
    bool useVectorSearch = true;
    bool useGraphSearch = false;
    // Vector branch strategy: semantic by default, full-text or hybrid on request.
    bool useFullTextSearch = false;
    bool useHybridSearch = false;
    std::size_t limit = 10;
    // Metadata equality filters: {"key": value, ...}
    nlohmann::json filters = nlohmann::json::object();
    double semanticWeight = 5.0;
    double fullTextWeight = 1.0;
    int rrfK = 60;
};

// Per-call LLM settings read by the generation pipe.
struct GenerationConfig {
    std::string model = "extractive";
    double temperature = 0.1;
    int maxTokens = 1024;
    bool stream = false;
    std::optional<std::string> taskPromptOverride;
};

struct RunSettings {
    SearchSettings search;
    GenerationConfig generation;
};

void to_json(nlohmann::json& j, const SearchSettings& s);
void from_json(const nlohmann::json& j, SearchSettings& s);
void to_json(nlohmann::json& j, const GenerationConfig& c);
void from_json(const nlohmann::json& j, GenerationConfig& c);

} // namespace ragline::pipeline

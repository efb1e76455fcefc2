#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <ragline/core/types.h>
#include <ragline/pipeline/run_settings.h>
#include <ragline/pipeline/stream.h>

namespace ragline::providers {

struct SearchResult {
    std::string id;
    double score = 0.0;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const SearchResult& r);
void from_json(const nlohmann::json& j, SearchResult& r);

struct Message {
    std::string role;
    std::string content;
};

void to_json(nlohmann::json& j, const Message& m);

struct Completion {
    std::string model;
    std::string content;
    std::string finishReason = "stop";
};

void to_json(nlohmann::json& j, const Completion& c);
void from_json(const nlohmann::json& j, Completion& c);

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual boost::asio::awaitable<Result<std::vector<float>>> embed(const std::string& text) = 0;

    virtual std::size_t dimension() const = 0;
};

/**
 * Retrieval backend for the vector branch. Implementations honour settings.limit and
 * settings.filters; results come back best first.
 */
class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    virtual boost::asio::awaitable<Result<std::vector<SearchResult>>>
    semanticSearch(const std::vector<float>& queryVector,
                   const pipeline::SearchSettings& settings) = 0;

    virtual boost::asio::awaitable<Result<std::vector<SearchResult>>>
    fullTextSearch(const std::string& queryText, const pipeline::SearchSettings& settings) = 0;

    virtual boost::asio::awaitable<Result<std::vector<SearchResult>>>
    hybridSearch(const std::string& queryText, const std::vector<float>& queryVector,
                 const pipeline::SearchSettings& settings) = 0;
};

class GraphSearchProvider {
public:
    virtual ~GraphSearchProvider() = default;

    virtual boost::asio::awaitable<Result<std::vector<SearchResult>>>
    localSearch(const std::string& query, const pipeline::SearchSettings& settings) = 0;
};

class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    virtual boost::asio::awaitable<Result<Completion>>
    complete(const std::vector<Message>& messages, const pipeline::GenerationConfig& config) = 0;

    // Lazy stream of text chunks (JSON strings).
    virtual pipeline::StreamPtr completeStream(const std::vector<Message>& messages,
                                               const pipeline::GenerationConfig& config) = 0;
};

} // namespace ragline::providers

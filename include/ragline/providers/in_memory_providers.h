#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <ragline/providers/providers.h>

namespace ragline::providers {

// Lowercased alphanumeric tokens.
std::vector<std::string> tokenize(const std::string& text);

/**
 * Deterministic hashed bag-of-words embedding, L2-normalized. Same text, same vector.
 */
class HashEmbeddingProvider final : public EmbeddingProvider {
public:
    explicit HashEmbeddingProvider(std::size_t dimension = 256) : dimension_(dimension) {}

    boost::asio::awaitable<Result<std::vector<float>>> embed(const std::string& text) override;

    std::size_t dimension() const override { return dimension_; }

    std::vector<float> embedSync(const std::string& text) const;

private:
    std::size_t dimension_;
};

struct Document {
    std::string id;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
};

// One {"id": ..., "text": ..., "metadata": {...}} object per line; blank lines are skipped.
Result<std::vector<Document>> loadJsonlCorpus(const std::filesystem::path& path);

/**
 * Brute-force document index: cosine similarity for semantic search, token overlap for
 * full-text search, and weighted reciprocal rank fusion of both for hybrid search.
 */
class InMemorySearchProvider final : public SearchProvider {
public:
    explicit InMemorySearchProvider(std::shared_ptr<HashEmbeddingProvider> embedder);

    // Replaces a document with the same id.
    Result<void> addDocument(Document doc);
    std::size_t size() const;

    boost::asio::awaitable<Result<std::vector<SearchResult>>>
    semanticSearch(const std::vector<float>& queryVector,
                   const pipeline::SearchSettings& settings) override;

    boost::asio::awaitable<Result<std::vector<SearchResult>>>
    fullTextSearch(const std::string& queryText, const pipeline::SearchSettings& settings) override;

    boost::asio::awaitable<Result<std::vector<SearchResult>>>
    hybridSearch(const std::string& queryText, const std::vector<float>& queryVector,
                 const pipeline::SearchSettings& settings) override;

private:
    struct Entry {
        Document doc;
        std::vector<float> vector;
    };

    static bool matchesFilters(const Document& doc, const nlohmann::json& filters);

    std::shared_ptr<HashEmbeddingProvider> embedder_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/**
 * Entity graph for local search: entities whose names share tokens with the query, followed
 * by their direct neighbours at half the score.
 */
class InMemoryGraphProvider final : public GraphSearchProvider {
public:
    struct Entity {
        std::string name;
        std::string description;
        std::vector<std::string> related;
    };

    Result<void> addEntity(Entity entity);
    std::size_t size() const;

    // {"entities": [{"name": ..., "description": ..., "related": [...]}, ...]}
    static Result<std::shared_ptr<InMemoryGraphProvider>> fromJson(const nlohmann::json& j);
    static Result<std::shared_ptr<InMemoryGraphProvider>>
    fromFile(const std::filesystem::path& path);

    boost::asio::awaitable<Result<std::vector<SearchResult>>>
    localSearch(const std::string& query, const pipeline::SearchSettings& settings) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entity> entities_;
};

/**
 * Answers with the leading numbered lines of the "### Context:" block in the last user
 * message, truncated to maxTokens words. Streaming yields the same text word by word.
 */
class ExtractiveLlmProvider final : public LlmProvider {
public:
    explicit ExtractiveLlmProvider(std::size_t maxContextLines = 3)
        : maxContextLines_(maxContextLines) {}

    boost::asio::awaitable<Result<Completion>>
    complete(const std::vector<Message>& messages,
             const pipeline::GenerationConfig& config) override;

    pipeline::StreamPtr completeStream(const std::vector<Message>& messages,
                                       const pipeline::GenerationConfig& config) override;

    std::string answer(const std::vector<Message>& messages,
                       const pipeline::GenerationConfig& config) const;

private:
    std::size_t maxContextLines_;
};

} // namespace ragline::providers

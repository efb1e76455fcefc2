#include <ragline/core/uuid.h>
#include <ragline/providers/in_memory_providers.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace ragline::providers {

namespace {

void sortAndLimit(std::vector<SearchResult>& results, std::size_t limit) {
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         if (a.score != b.score) {
                             return a.score > b.score;
                         }
                         return a.id < b.id;
                     });
    if (results.size() > limit) {
        results.resize(limit);
    }
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// ---------------------------------------------------------------------------
// HashEmbeddingProvider
// ---------------------------------------------------------------------------

std::vector<float> HashEmbeddingProvider::embedSync(const std::string& text) const {
    std::vector<float> vec(dimension_, 0.0f);
    if (dimension_ == 0) {
        return vec;
    }
    for (const auto& token : tokenize(text)) {
        vec[core::fnv1a(token) % dimension_] += 1.0f;
    }
    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

boost::asio::awaitable<Result<std::vector<float>>>
HashEmbeddingProvider::embed(const std::string& text) {
    if (dimension_ == 0) {
        co_return Error{ErrorCode::InvalidState, "embedding dimension is zero"};
    }
    co_return embedSync(text);
}

// ---------------------------------------------------------------------------
// Corpus loading
// ---------------------------------------------------------------------------

Result<std::vector<Document>> loadJsonlCorpus(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open corpus file: " + path.string()};
    }
    std::vector<Document> docs;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("text") ||
            !j["text"].is_string()) {
            return Error{ErrorCode::ParseError, path.string() + ":" + std::to_string(lineNo) +
                                                    ": expected an object with a text field"};
        }
        Document doc;
        doc.text = j["text"].get<std::string>();
        if (j.contains("id") && j["id"].is_string()) {
            doc.id = j["id"].get<std::string>();
        } else if (j.contains("id") && j["id"].is_number_integer()) {
            doc.id = std::to_string(j["id"].get<long long>());
        } else {
            doc.id = "doc-" + std::to_string(lineNo);
        }
        doc.metadata = j.value("metadata", nlohmann::json::object());
        docs.push_back(std::move(doc));
    }
    return docs;
}

// ---------------------------------------------------------------------------
// InMemorySearchProvider
// ---------------------------------------------------------------------------

InMemorySearchProvider::InMemorySearchProvider(std::shared_ptr<HashEmbeddingProvider> embedder)
    : embedder_(embedder ? std::move(embedder) : std::make_shared<HashEmbeddingProvider>()) {}

Result<void> InMemorySearchProvider::addDocument(Document doc) {
    if (doc.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "document id is empty"};
    }
    if (!doc.metadata.is_object()) {
        return Error{ErrorCode::InvalidArgument, "document metadata must be an object: " + doc.id};
    }
    auto vec = embedder_->embedSync(doc.text);
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.doc.id == doc.id; });
    if (it != entries_.end()) {
        it->doc = std::move(doc);
        it->vector = std::move(vec);
    } else {
        entries_.push_back(Entry{std::move(doc), std::move(vec)});
    }
    return {};
}

std::size_t InMemorySearchProvider::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

bool InMemorySearchProvider::matchesFilters(const Document& doc, const nlohmann::json& filters) {
    if (!filters.is_object()) {
        return true;
    }
    for (auto it = filters.begin(); it != filters.end(); ++it) {
        if (!doc.metadata.contains(it.key()) || doc.metadata[it.key()] != it.value()) {
            return false;
        }
    }
    return true;
}

boost::asio::awaitable<Result<std::vector<SearchResult>>>
InMemorySearchProvider::semanticSearch(const std::vector<float>& queryVector,
                                       const pipeline::SearchSettings& settings) {
    if (queryVector.size() != embedder_->dimension()) {
        co_return Error{ErrorCode::InvalidArgument,
                        "query vector has dimension " + std::to_string(queryVector.size()) +
                            ", index uses " + std::to_string(embedder_->dimension())};
    }
    std::vector<SearchResult> results;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& entry : entries_) {
            if (!matchesFilters(entry.doc, settings.filters)) {
                continue;
            }
            double dot = 0.0;
            for (std::size_t i = 0; i < queryVector.size(); ++i) {
                dot += static_cast<double>(queryVector[i]) * entry.vector[i];
            }
            results.push_back({entry.doc.id, dot, entry.doc.text, entry.doc.metadata});
        }
    }
    sortAndLimit(results, settings.limit);
    co_return results;
}

boost::asio::awaitable<Result<std::vector<SearchResult>>>
InMemorySearchProvider::fullTextSearch(const std::string& queryText,
                                       const pipeline::SearchSettings& settings) {
    auto tokens = tokenize(queryText);
    std::set<std::string> queryTokens(tokens.begin(), tokens.end());
    std::vector<SearchResult> results;
    if (queryTokens.empty()) {
        co_return results;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& entry : entries_) {
            if (!matchesFilters(entry.doc, settings.filters)) {
                continue;
            }
            auto docTokens = tokenize(entry.doc.text);
            std::set<std::string> docSet(docTokens.begin(), docTokens.end());
            std::size_t matched = 0;
            for (const auto& t : queryTokens) {
                matched += docSet.count(t);
            }
            if (matched == 0) {
                continue;
            }
            results.push_back({entry.doc.id,
                               static_cast<double>(matched) / static_cast<double>(queryTokens.size()),
                               entry.doc.text, entry.doc.metadata});
        }
    }
    sortAndLimit(results, settings.limit);
    co_return results;
}

boost::asio::awaitable<Result<std::vector<SearchResult>>>
InMemorySearchProvider::hybridSearch(const std::string& queryText,
                                     const std::vector<float>& queryVector,
                                     const pipeline::SearchSettings& settings) {
    auto wide = settings;
    wide.limit = std::max<std::size_t>(settings.limit * 2, settings.limit);

    auto semantic = co_await semanticSearch(queryVector, wide);
    if (!semantic) {
        co_return semantic.error();
    }
    auto fullText = co_await fullTextSearch(queryText, wide);
    if (!fullText) {
        co_return fullText.error();
    }

    const double k = static_cast<double>(settings.rrfK);
    std::unordered_map<std::string, double> rrfScores;
    std::unordered_map<std::string, SearchResult> resultMap;

    const auto& semanticResults = semantic.value();
    for (std::size_t i = 0; i < semanticResults.size(); ++i) {
        const auto& sr = semanticResults[i];
        rrfScores[sr.id] += settings.semanticWeight / (k + static_cast<double>(i + 1));
        resultMap[sr.id] = sr;
    }
    const auto& fullTextResults = fullText.value();
    for (std::size_t i = 0; i < fullTextResults.size(); ++i) {
        const auto& sr = fullTextResults[i];
        rrfScores[sr.id] += settings.fullTextWeight / (k + static_cast<double>(i + 1));
        resultMap.emplace(sr.id, sr);
    }

    std::vector<SearchResult> fused;
    fused.reserve(resultMap.size());
    for (auto& [id, sr] : resultMap) {
        sr.score = rrfScores[id];
        fused.push_back(std::move(sr));
    }
    sortAndLimit(fused, settings.limit);

    spdlog::debug("[InMemorySearchProvider] hybrid: {} semantic + {} full-text -> {} fused",
                  semanticResults.size(), fullTextResults.size(), fused.size());
    co_return fused;
}

// ---------------------------------------------------------------------------
// InMemoryGraphProvider
// ---------------------------------------------------------------------------

Result<void> InMemoryGraphProvider::addEntity(Entity entity) {
    if (entity.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "entity name is empty"};
    }
    std::lock_guard<std::mutex> lk(mutex_);
    entities_[entity.name] = std::move(entity);
    return {};
}

std::size_t InMemoryGraphProvider::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entities_.size();
}

Result<std::shared_ptr<InMemoryGraphProvider>>
InMemoryGraphProvider::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("entities") || !j["entities"].is_array()) {
        return Error{ErrorCode::ParseError, "graph document needs an \"entities\" array"};
    }
    auto graph = std::make_shared<InMemoryGraphProvider>();
    for (const auto& e : j["entities"]) {
        if (!e.is_object() || !e.contains("name") || !e["name"].is_string()) {
            return Error{ErrorCode::ParseError, "graph entity without a name"};
        }
        Entity entity;
        entity.name = e["name"].get<std::string>();
        entity.description = e.value("description", std::string{});
        if (e.contains("related") && e["related"].is_array()) {
            for (const auto& r : e["related"]) {
                if (r.is_string()) {
                    entity.related.push_back(r.get<std::string>());
                }
            }
        }
        auto added = graph->addEntity(std::move(entity));
        if (!added) {
            return added.error();
        }
    }
    return graph;
}

Result<std::shared_ptr<InMemoryGraphProvider>>
InMemoryGraphProvider::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open graph file: " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::ParseError, "Invalid JSON in graph file: " + path.string()};
    }
    return fromJson(j);
}

boost::asio::awaitable<Result<std::vector<SearchResult>>>
InMemoryGraphProvider::localSearch(const std::string& query,
                                   const pipeline::SearchSettings& settings) {
    auto tokens = tokenize(query);
    std::set<std::string> queryTokens(tokens.begin(), tokens.end());

    std::vector<SearchResult> results;
    std::map<std::string, double> neighbours;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [name, entity] : entities_) {
            auto nameTokens = tokenize(name);
            if (nameTokens.empty()) {
                continue;
            }
            std::size_t matched = 0;
            for (const auto& t : nameTokens) {
                matched += queryTokens.count(t);
            }
            if (matched == 0) {
                continue;
            }
            double score = static_cast<double>(matched) / static_cast<double>(nameTokens.size());
            results.push_back({name, score, entity.description,
                               nlohmann::json{{"type", "entity"}, {"related", entity.related}}});
            for (const auto& rel : entity.related) {
                auto& best = neighbours[rel];
                best = std::max(best, score * 0.5);
            }
        }
        for (const auto& [rel, score] : neighbours) {
            bool direct = std::any_of(results.begin(), results.end(),
                                      [&](const SearchResult& r) { return r.id == rel; });
            auto it = entities_.find(rel);
            if (direct || it == entities_.end()) {
                continue;
            }
            results.push_back({rel, score, it->second.description,
                               nlohmann::json{{"type", "neighbor"}}});
        }
    }
    sortAndLimit(results, settings.limit);
    co_return results;
}

// ---------------------------------------------------------------------------
// ExtractiveLlmProvider
// ---------------------------------------------------------------------------

std::string ExtractiveLlmProvider::answer(const std::vector<Message>& messages,
                                          const pipeline::GenerationConfig& config) const {
    const Message* user = nullptr;
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (it->role == "user") {
            user = &*it;
            break;
        }
    }

    std::vector<std::string> picked;
    if (user) {
        std::istringstream in(user->content);
        std::string line;
        bool inContext = false;
        while (std::getline(in, line) && picked.size() < maxContextLines_) {
            if (line.rfind("### Context:", 0) == 0) {
                inContext = true;
                continue;
            }
            if (inContext && line.rfind("##", 0) == 0) {
                break;
            }
            if (!inContext || line.empty() || line.front() != '[') {
                continue;
            }
            auto close = line.find(']');
            if (close == std::string::npos) {
                continue;
            }
            auto text = line.substr(close + 1);
            auto start = text.find_first_not_of(' ');
            if (start != std::string::npos) {
                picked.push_back(text.substr(start));
            }
        }
    }
    if (picked.empty()) {
        return "No relevant context found.";
    }

    std::string joined;
    for (const auto& p : picked) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += p;
    }
    if (config.maxTokens <= 0) {
        return joined;
    }
    auto words = splitWords(joined);
    if (words.size() <= static_cast<std::size_t>(config.maxTokens)) {
        return joined;
    }
    words.resize(static_cast<std::size_t>(config.maxTokens));
    std::string truncated;
    for (const auto& w : words) {
        if (!truncated.empty()) {
            truncated += ' ';
        }
        truncated += w;
    }
    return truncated;
}

boost::asio::awaitable<Result<Completion>>
ExtractiveLlmProvider::complete(const std::vector<Message>& messages,
                                const pipeline::GenerationConfig& config) {
    if (messages.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "no messages to complete"};
    }
    Completion completion;
    completion.model = config.model;
    completion.content = answer(messages, config);
    auto words = splitWords(completion.content);
    completion.finishReason =
        config.maxTokens > 0 && words.size() >= static_cast<std::size_t>(config.maxTokens)
            ? "length"
            : "stop";
    co_return completion;
}

pipeline::StreamPtr ExtractiveLlmProvider::completeStream(const std::vector<Message>& messages,
                                                          const pipeline::GenerationConfig& config) {
    return pipeline::makeGenerator(
        [this, messages, config](pipeline::StreamEmitter& emit) -> boost::asio::awaitable<void> {
            if (messages.empty()) {
                throw std::invalid_argument("no messages to complete");
            }
            auto words = splitWords(answer(messages, config));
            for (std::size_t i = 0; i < words.size(); ++i) {
                co_await emit(pipeline::Value(i + 1 < words.size() ? words[i] + " " : words[i]));
            }
        });
}

} // namespace ragline::providers

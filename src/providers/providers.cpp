#include <ragline/providers/providers.h>

namespace ragline::providers {

void to_json(nlohmann::json& j, const SearchResult& r) {
    j = nlohmann::json{{"id", r.id}, {"score", r.score}, {"text", r.text}, {"metadata", r.metadata}};
}

void from_json(const nlohmann::json& j, SearchResult& r) {
    r.id = j.value("id", std::string{});
    r.score = j.value("score", 0.0);
    r.text = j.value("text", std::string{});
    r.metadata = j.value("metadata", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{{"role", m.role}, {"content", m.content}};
}

void to_json(nlohmann::json& j, const Completion& c) {
    j = nlohmann::json{{"model", c.model}, {"content", c.content}, {"finish_reason", c.finishReason}};
}

void from_json(const nlohmann::json& j, Completion& c) {
    c.model = j.value("model", std::string{});
    c.content = j.value("content", std::string{});
    c.finishReason = j.value("finish_reason", std::string{"stop"});
}

} // namespace ragline::providers

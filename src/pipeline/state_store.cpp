#include <ragline/pipeline/state_store.h>

#include <algorithm>

namespace ragline::pipeline {

Result<void> StateStore::publish(const std::string& stage, const nlohmann::json& fields) {
    if (stage.empty()) {
        return Error{ErrorCode::InvalidArgument, "stage name must not be empty"};
    }
    if (!fields.is_object()) {
        return Error{ErrorCode::InvalidArgument,
                     "published fields for stage '" + stage + "' must be a JSON object"};
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto& entry = stages_[stage];
    if (!entry.is_object()) {
        entry = nlohmann::json::object();
    }
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        entry[it.key()] = it.value();
    }
    return Result<void>();
}

Result<nlohmann::json> StateStore::read(const std::string& stage, const std::string& field,
                                        const nlohmann::json& defaultValue) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = stages_.find(stage);
    if (it == stages_.end()) {
        return Error{ErrorCode::NotFound, "stage not found: " + stage};
    }
    auto fieldIt = it->second.find(field);
    if (fieldIt == it->second.end()) {
        return defaultValue;
    }
    return *fieldIt;
}

Result<nlohmann::json> StateStore::readAll(const std::string& stage) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = stages_.find(stage);
    if (it == stages_.end()) {
        return Error{ErrorCode::NotFound, "stage not found: " + stage};
    }
    return it->second;
}

Result<void> StateStore::erase(const std::string& stage, const std::optional<std::string>& field) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = stages_.find(stage);
    if (it == stages_.end()) {
        return Error{ErrorCode::NotFound, "stage not found: " + stage};
    }
    if (!field) {
        stages_.erase(it);
        return Result<void>();
    }
    if (it->second.erase(*field) == 0) {
        return Error{ErrorCode::NotFound,
                     "field '" + *field + "' not found in stage '" + stage + "'"};
    }
    return Result<void>();
}

bool StateStore::contains(const std::string& stage) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stages_.find(stage) != stages_.end();
}

bool StateStore::contains(const std::string& stage, const std::string& field) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = stages_.find(stage);
    return it != stages_.end() && it->second.contains(field);
}

std::vector<std::string> StateStore::stages() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& [name, _] : stages_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t StateStore::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stages_.size();
}

} // namespace ragline::pipeline

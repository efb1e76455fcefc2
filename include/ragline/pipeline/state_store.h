#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>
#include <ragline/core/types.h>

namespace ragline::pipeline {

/**
 * @brief Per-run mapping of stage name -> named output fields.
 *
 * A stage appears in the store once it has published at least once during the run. All
 * operations take a single store-wide mutex; stages only ever write their own entry.
 */
class StateStore {
public:
    StateStore() = default;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Merge-writes the fields of a JSON object into the stage's entry (last write wins per key).
    Result<void> publish(const std::string& stage, const nlohmann::json& fields);

    // NotFound if the stage never published; the default when only the field is missing.
    Result<nlohmann::json> read(const std::string& stage, const std::string& field,
                                const nlohmann::json& defaultValue = nullptr) const;

    // Whole-stage snapshot of everything the stage published.
    Result<nlohmann::json> readAll(const std::string& stage) const;

    // Removes a single field, or the whole stage entry when field is not given.
    Result<void> erase(const std::string& stage,
                       const std::optional<std::string>& field = std::nullopt);

    bool contains(const std::string& stage) const;
    bool contains(const std::string& stage, const std::string& field) const;

    std::vector<std::string> stages() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> stages_;
};

} // namespace ragline::pipeline

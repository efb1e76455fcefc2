#pragma once

#include <stdexcept>
#include <string>

#include <ragline/pipeline/stream.h>

namespace ragline::pipes {

// Accepts a bare string or an object with a string "query" member.
inline std::string extractQuery(const pipeline::Value& item) {
    if (item.is_string()) {
        return item.get<std::string>();
    }
    if (item.is_object() && item.contains("query") && item["query"].is_string()) {
        return item["query"].get<std::string>();
    }
    throw std::invalid_argument("expected a query string, got: " + item.dump());
}

} // namespace ragline::pipes

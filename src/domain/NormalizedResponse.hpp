/**
 * @file NormalizedResponse.hpp
 * @brief Canonical form of a downstream responder's payload.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentrouter::domain {

struct SourceRef {
    std::string title;
    std::string url;

    bool operator==(const SourceRef& other) const {
        return title == other.title && url == other.url;
    }
};

/**
 * @struct NormalizedResponse
 * @brief Answer text, canonical sources and whatever else the responder returned.
 */
struct NormalizedResponse {
    std::string answerText;
    std::vector<SourceRef> sources;
    nlohmann::json extraFields = nlohmann::json::object();

    bool operator==(const NormalizedResponse& other) const {
        return answerText == other.answerText && sources == other.sources && extraFields == other.extraFields;
    }
};

} // namespace agentrouter::domain

/**
 * @file DocumentParser.hpp
 * @brief Turns raw stored objects into domain documents.
 */

#pragma once
#include <optional>
#include "domain/Document.hpp"

namespace agentrouter::infrastructure {

class DocumentParser {
public:
    /**
     * @brief Parses one JSON object with `titre|title`, `contenu|content|body` and `source_url|url`.
     * @return nullopt (and a log line) for objects that are not JSON or lack body or URL.
     */
    static std::optional<domain::Document> Parse(const domain::StoredObject& object);
};

} // namespace agentrouter::infrastructure

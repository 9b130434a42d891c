/**
 * @file DocumentParser.cpp
 * @brief Implementation of DocumentParser.
 */

#include "infrastructure/DocumentParser.hpp"
#include <iostream>
#include <initializer_list>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agentrouter::infrastructure {

namespace {

std::string FirstString(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // namespace

std::optional<domain::Document> DocumentParser::Parse(const domain::StoredObject& object) {
    json j = json::parse(object.rawBytes, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "[DocumentParser] " << object.id << " is not a JSON object, skipped." << std::endl;
        return std::nullopt;
    }

    domain::Document doc;
    doc.title = FirstString(j, {"titre", "title", "titre_source"});
    doc.bodyText = FirstString(j, {"contenu", "content", "body"});
    doc.sourceUrl = FirstString(j, {"source_url", "url"});

    if (doc.bodyText.empty() || doc.sourceUrl.empty()) {
        std::cerr << "[DocumentParser] " << object.id << " has no body or source URL, skipped." << std::endl;
        return std::nullopt;
    }

    doc.id = domain::DeriveDocumentId(doc.sourceUrl);
    doc.sizeChars = doc.bodyText.size();

    auto emb = j.find("embedding");
    if (emb != j.end() && emb->is_array() && !emb->empty()) {
        try {
            doc.embedding = emb->get<std::vector<float>>();
        } catch (const json::exception& e) {
            std::cerr << "[DocumentParser] Ignoring bad embedding in " << object.id << ": " << e.what() << std::endl;
        }
    }
    return doc;
}

} // namespace agentrouter::infrastructure

/**
 * @file ResponseNormalizer.cpp
 * @brief Implementation of ResponseNormalizer.
 */

#include "application/ResponseNormalizer.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <iostream>
#include <set>
#include <utility>

using json = nlohmann::json;

namespace agentrouter::application {

namespace {

const char* const kSourceAliases[] = {"sources", "sources_officielles", "references", "documents_sources"};
const char* const kAnswerAliases[] = {"reponse", "answer", "response"};
const char* const kTitleKeys[] = {"titre", "title", "name"};
const char* const kUrlKeys[] = {"url", "lien", "link", "uri"};

template <std::size_t N>
std::string FirstString(const json& item, const char* const (&keys)[N]) {
    for (const char* key : keys) {
        auto it = item.find(key);
        if (it != item.end() && it->is_string()) return it->get<std::string>();
    }
    return "";
}

} // namespace

bool ResponseNormalizer::IsInertHandoff(const json& handoff) {
    if (handoff.is_null()) return true;
    if (!handoff.is_object()) return false;

    auto needed = handoff.find("needed");
    if (needed != handoff.end() && needed->is_boolean() && !needed->get<bool>()) return true;

    auto suggested = handoff.find("suggested_agent");
    bool neededTrue = needed != handoff.end() && needed->is_boolean() && needed->get<bool>();
    return !neededTrue && suggested != handoff.end() && suggested->is_string() && suggested->get<std::string>() == "none";
}

json ResponseNormalizer::CollectSources(const json& payload) {
    json sources = json::array();
    std::set<std::pair<std::string, std::string>> seen;

    for (const char* alias : kSourceAliases) {
        auto it = payload.find(alias);
        if (it == payload.end() || !it->is_array()) continue;

        for (const auto& item : *it) {
            std::string title, url;
            if (item.is_string()) {
                url = item.get<std::string>();
            } else if (item.is_object()) {
                title = FirstString(item, kTitleKeys);
                url = FirstString(item, kUrlKeys);
            }
            if (title.empty() && url.empty()) continue;
            if (!seen.emplace(title, url).second) continue;
            sources.push_back({{"title", title}, {"url", url}});
        }
    }
    return sources;
}

json ResponseNormalizer::cleanPayload(json payload) const {
    if (!payload.is_object()) return payload;

    auto handoff = payload.find("handoff");
    if (handoff != payload.end() && IsInertHandoff(*handoff)) {
        payload.erase(handoff);
    }

    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (it->is_string()) {
            *it = domain::TextUtils::StripCodeFence(it->get<std::string>());
        }
    }

    bool hasSources = false;
    for (const char* alias : kSourceAliases) hasSources = hasSources || payload.contains(alias);
    if (hasSources) {
        json sources = CollectSources(payload);
        for (const char* alias : kSourceAliases) payload.erase(alias);
        payload["sources"] = std::move(sources);
    }
    return payload;
}

domain::NormalizedResponse ResponseNormalizer::normalizeJson(const json& payload) const {
    domain::NormalizedResponse result;

    if (!payload.is_object()) {
        if (payload.is_string()) {
            result.answerText = domain::TextUtils::StripCodeFence(payload.get<std::string>());
        } else {
            std::cerr << "[ResponseNormalizer] " << domain::ErrorKindName(domain::ErrorKind::MalformedResponse)
                      << ": payload is not an object, keeping it as text." << std::endl;
            result.answerText = payload.dump();
        }
        return result;
    }

    json cleaned = cleanPayload(payload);

    for (const char* alias : kAnswerAliases) {
        auto it = cleaned.find(alias);
        if (it == cleaned.end()) continue;
        result.answerText = it->is_string() ? it->get<std::string>() : it->dump();
        cleaned.erase(it);
        break;
    }

    auto sources = cleaned.find("sources");
    if (sources != cleaned.end()) {
        for (const auto& item : *sources) {
            result.sources.push_back({item.value("title", ""), item.value("url", "")});
        }
        cleaned.erase(sources);
    }

    result.extraFields = std::move(cleaned);
    return result;
}

domain::NormalizedResponse ResponseNormalizer::normalize(const std::string& rawBody) const {
    json payload = json::parse(rawBody, nullptr, false);
    if (payload.is_discarded()) {
        std::string unfenced = domain::TextUtils::StripCodeFence(rawBody);
        if (unfenced != rawBody) {
            payload = json::parse(unfenced, nullptr, false);
        }
        if (payload.is_discarded()) {
            std::cerr << "[ResponseNormalizer] " << domain::ErrorKindName(domain::ErrorKind::MalformedResponse)
                      << ": body is not JSON, wrapping it as answer text." << std::endl;
            domain::NormalizedResponse result;
            result.answerText = unfenced;
            return result;
        }
    }
    return normalizeJson(payload);
}

json ResponseNormalizer::ToJson(const domain::NormalizedResponse& response) {
    json out = response.extraFields.is_object() ? response.extraFields : json::object();
    out["reponse"] = response.answerText;
    json sources = json::array();
    for (const auto& src : response.sources) {
        sources.push_back({{"title", src.title}, {"url", src.url}});
    }
    out["sources"] = std::move(sources);
    return out;
}

} // namespace agentrouter::application

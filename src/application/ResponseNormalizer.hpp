/**
 * @file ResponseNormalizer.hpp
 * @brief Canonicalizes heterogeneous responder payloads.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/NormalizedResponse.hpp"

namespace agentrouter::application {

/**
 * @class ResponseNormalizer
 * @brief Strips control metadata from a responder payload and extracts answer and sources.
 *
 * Idempotent: normalize(ToJson(normalize(x)).dump()) == normalize(x).
 */
class ResponseNormalizer {
public:
    /** @brief Non-JSON bodies become the answer text with no sources. */
    domain::NormalizedResponse normalize(const std::string& rawBody) const;

    domain::NormalizedResponse normalizeJson(const nlohmann::json& payload) const;

    /**
     * @brief Payload-level cleanup, keeping the payload's own shape:
     * inert handoff removal, fence stripping of top-level strings and
     * collapsing of source aliases into `sources: [{title, url}]`.
     */
    nlohmann::json cleanPayload(nlohmann::json payload) const;

    /** @brief Canonical payload: extra fields plus `reponse` and `sources`. */
    static nlohmann::json ToJson(const domain::NormalizedResponse& response);

private:
    static bool IsInertHandoff(const nlohmann::json& handoff);
    static nlohmann::json CollectSources(const nlohmann::json& payload);
};

} // namespace agentrouter::application

/**
 * @file Document.cpp
 * @brief Document id derivation.
 */

#include "domain/Document.hpp"
#include "domain/TextUtils.hpp"

namespace agentrouter::domain {

std::string DeriveDocumentId(const std::string& sourceUrl) {
    // Strip scheme, authority, query and fragment: keep the path only.
    std::string path = sourceUrl;
    auto schemePos = path.find("://");
    if (schemePos != std::string::npos) {
        auto slash = path.find('/', schemePos + 3);
        path = (slash == std::string::npos) ? std::string() : path.substr(slash);
    }
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) path.erase(cut);

    while (!path.empty() && path.back() == '/') path.pop_back();
    auto lastSlash = path.find_last_of('/');
    std::string segment = (lastSlash == std::string::npos) ? path : path.substr(lastSlash + 1);

    // "page.html" -> "page"
    auto dot = segment.find_last_of('.');
    if (dot != std::string::npos && dot > 0) segment.erase(dot);

    if (segment.empty()) {
        return TextUtils::Fnv1aHex(sourceUrl).substr(0, 8);
    }
    return segment;
}

} // namespace agentrouter::domain

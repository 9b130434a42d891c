/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentrouter::application {

ContextAssembler::ContextAssembler(ContextOptions options) : m_options(options) {}

namespace {

// Tags and link parts longer than this are treated as plain text.
constexpr std::size_t kMaxMarkupSpan = 256;

bool StartsWithNoCase(const std::string& s, std::size_t pos, const char* prefix) {
    for (std::size_t k = 0; prefix[k]; ++k) {
        if (pos + k >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + k])) != prefix[k]) return false;
    }
    return true;
}

std::size_t FindWithin(const std::string& s, char c, std::size_t from, std::size_t span) {
    std::size_t end = std::min(s.size(), from + span);
    for (std::size_t k = from; k < end; ++k) {
        if (s[k] == c) return k;
    }
    return std::string::npos;
}

bool IsAnchorTag(const std::string& s, std::size_t open) {
    std::size_t name = open + 1;
    if (name < s.size() && s[name] == '/') ++name;
    if (name >= s.size() || std::tolower(static_cast<unsigned char>(s[name])) != 'a') return false;
    char next = name + 1 < s.size() ? s[name + 1] : '\0';
    return next == '>' || std::isspace(static_cast<unsigned char>(next));
}

} // namespace

std::string ContextAssembler::CleanBody(const std::string& body) {
    std::string out;
    out.reserve(body.size());

    std::size_t i = 0;
    while (i < body.size()) {
        char c = body[i];

        if (c == '[') {
            // [text](url) -> text
            std::size_t close = FindWithin(body, ']', i + 1, kMaxMarkupSpan);
            if (close != std::string::npos && close + 1 < body.size() && body[close + 1] == '(') {
                std::size_t paren = FindWithin(body, ')', close + 2, kMaxMarkupSpan * 2);
                if (paren != std::string::npos) {
                    out.append(body, i + 1, close - i - 1);
                    i = paren + 1;
                    continue;
                }
            }
        } else if (c == '<') {
            std::size_t close = FindWithin(body, '>', i + 1, kMaxMarkupSpan);
            std::size_t reopen = FindWithin(body, '<', i + 1, kMaxMarkupSpan);
            if (close != std::string::npos && close > i + 1 && (reopen == std::string::npos || reopen > close)) {
                // Anchors keep their text glued to the surroundings; other tags become a space.
                if (!IsAnchorTag(body, i)) out += ' ';
                i = close + 1;
                continue;
            }
        } else if (StartsWithNoCase(body, i, "http://") || StartsWithNoCase(body, i, "https://") ||
                   StartsWithNoCase(body, i, "www.")) {
            while (i < body.size() && !std::isspace(static_cast<unsigned char>(body[i])) &&
                   body[i] != ')' && body[i] != ']' && body[i] != '>') {
                ++i;
            }
            continue;
        }

        out += c;
        ++i;
    }
    return domain::TextUtils::CollapseWhitespace(out);
}

std::string ContextAssembler::truncateBody(const std::string& body, std::size_t limit) const {
    if (body.size() <= limit) return body;

    std::string cut = domain::TextUtils::Utf8Prefix(body, limit);
    auto lastDot = cut.rfind('.');
    if (lastDot != std::string::npos && static_cast<double>(lastDot) >= m_options.sentenceCutRatio * limit) {
        return cut.substr(0, lastDot + 1);
    }
    std::size_t room = limit > 3 ? limit - 3 : 0;
    return domain::TextUtils::Utf8Prefix(body, room) + "...";
}

std::string ContextAssembler::renderBlock(std::size_t index, const domain::Document& doc, const std::string& body) {
    std::stringstream ss;
    ss << "--- Document " << index << " ---\n"
       << "Titre: " << doc.title << "\n"
       << "Source: " << doc.sourceUrl << "\n"
       << "Contenu:\n" << body << "\n\n";
    return ss.str();
}

std::string ContextAssembler::assemble(const std::vector<domain::ScoredDocument>& documents, std::size_t maxTotalChars) const {
    if (documents.empty()) {
        return kNoDocuments;
    }

    std::string out;
    for (std::size_t i = 0; i < documents.size(); ++i) {
        const auto& doc = documents[i].document;
        std::size_t window = std::max(m_options.docBodyChars, m_options.docBodyFallbackChars) * kCleanWindowFactor;
        std::string body = CleanBody(domain::TextUtils::Utf8Prefix(doc.bodyText, window));
        std::size_t remaining = maxTotalChars - out.size();

        bool placed = false;
        for (std::size_t limit : {m_options.docBodyChars, m_options.docBodyFallbackChars}) {
            std::string block = renderBlock(i + 1, doc, truncateBody(body, limit));
            if (block.size() <= remaining) {
                out += block;
                placed = true;
                break;
            }
        }

        if (!placed) {
            if (out.empty()) {
                // Budget too small for even one block: keep what fits of the first one.
                std::string block = renderBlock(i + 1, doc, truncateBody(body, m_options.docBodyFallbackChars));
                out = domain::TextUtils::Utf8Prefix(block, maxTotalChars);
            }
            break;
        }
    }
    return out;
}

} // namespace agentrouter::application

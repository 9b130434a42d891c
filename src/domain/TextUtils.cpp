/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */

#include "domain/TextUtils.hpp"
#include <cctype>
#include <cstdio>

namespace agentrouter::domain {

namespace {

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool IsWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

} // namespace

std::string TextUtils::ToLowerAscii(const std::string& text) {
    std::string out = text;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) ch = static_cast<char>(std::tolower(c));
    }
    return out;
}

std::string TextUtils::Trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::string TextUtils::CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::size_t TextUtils::Utf8Floor(const std::string& text, std::size_t pos) {
    if (pos >= text.size()) return text.size();
    while (pos > 0 && IsContinuationByte(static_cast<unsigned char>(text[pos]))) {
        --pos;
    }
    return pos;
}

std::string TextUtils::Utf8Prefix(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    return text.substr(0, Utf8Floor(text, maxBytes));
}

std::string TextUtils::Utf8Suffix(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    std::size_t start = text.size() - maxBytes;
    while (start < text.size() && IsContinuationByte(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return text.substr(start);
}

std::string TextUtils::Fnv1aHex(const std::string& text) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

std::vector<std::string> TextUtils::Words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        if (IsWordByte(static_cast<unsigned char>(ch))) {
            current.push_back(ch);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

std::size_t TextUtils::CountOccurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

std::string TextUtils::StripCodeFence(const std::string& text) {
    static const std::string kFence = "```";
    std::string current = text;
    bool changed = true;
    while (changed) {
        changed = false;
        std::string trimmed = Trim(current);
        if (trimmed.compare(0, kFence.size(), kFence) == 0) {
            auto eol = trimmed.find('\n');
            if (eol == std::string::npos) {
                // Single line: drop the marker and an inline language tag.
                std::size_t pos = kFence.size();
                while (pos < trimmed.size() && std::isalnum(static_cast<unsigned char>(trimmed[pos]))) ++pos;
                trimmed = trimmed.substr(pos);
            } else {
                trimmed = trimmed.substr(eol + 1);
            }
            changed = true;
        }
        if (trimmed.size() >= kFence.size() &&
            trimmed.compare(trimmed.size() - kFence.size(), kFence.size(), kFence) == 0) {
            trimmed.erase(trimmed.size() - kFence.size());
            changed = true;
        }
        if (changed) current = Trim(trimmed);
    }
    return current;
}

} // namespace agentrouter::domain

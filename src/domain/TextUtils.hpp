/**
 * @file TextUtils.hpp
 * @brief Byte-oriented string helpers shared by the retrieval and routing code.
 *
 * All lengths are byte lengths of UTF-8 text. Cutting helpers never split a
 * multi-byte sequence.
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace agentrouter::domain {

class TextUtils {
public:
    /** @brief ASCII lower-casing; UTF-8 multi-byte sequences are copied unchanged. */
    static std::string ToLowerAscii(const std::string& text);

    static std::string Trim(const std::string& text);

    /** @brief Collapses every run of whitespace into one space and trims. */
    static std::string CollapseWhitespace(const std::string& text);

    /** @brief Largest position <= pos that starts a UTF-8 code point. */
    static std::size_t Utf8Floor(const std::string& text, std::size_t pos);

    /** @brief First `maxBytes` bytes, shortened to a code point boundary. */
    static std::string Utf8Prefix(const std::string& text, std::size_t maxBytes);

    /** @brief Last `maxBytes` bytes, shortened to a code point boundary. */
    static std::string Utf8Suffix(const std::string& text, std::size_t maxBytes);

    /** @brief 64-bit FNV-1a digest, as 16 lower-case hex digits. */
    static std::string Fnv1aHex(const std::string& text);

    /**
     * @brief Splits lower-cased text into word tokens.
     * ASCII letters/digits and any UTF-8 byte are word characters; everything
     * else separates words.
     */
    static std::vector<std::string> Words(const std::string& text);

    /** @brief Counts non-overlapping occurrences of needle in haystack. */
    static std::size_t CountOccurrences(const std::string& haystack, const std::string& needle);

    /**
     * @brief Removes markdown code-fence markers (``` with optional language tag)
     * at the start and end of the text, repeatedly. Text without a fence is
     * returned unchanged.
     */
    static std::string StripCodeFence(const std::string& text);
};

} // namespace agentrouter::domain

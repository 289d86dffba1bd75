#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textarea {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

inline std::string encodeUtf8(std::uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out = "\xEF\xBF\xBD";
    }
    return out;
}

/**
 * Split UTF-8 content into one string per codepoint.
 * Invalid bytes become U+FFFD.
 */
inline std::vector<std::string> splitCodepoints(std::string_view content) {
    std::vector<std::string> glyphs;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        if (cp == 0xFFFD && byteLen == 1) {
            glyphs.push_back(encodeUtf8(cp));
        } else {
            glyphs.emplace_back(content.substr(pos, byteLen));
        }
        pos += byteLen;
    }
    return glyphs;
}

// Counts the same units splitCodepoints produces: each invalid byte is one
inline std::uint32_t codepointCount(std::string_view content) {
    std::uint32_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        count++;
    }
    return count;
}

// =============================================================================
// Codepoint-Indexed Editing
// =============================================================================

/**
 * Map a codepoint index to a UTF-8 byte offset (clamped to content size).
 */
inline std::size_t codepointToByteIndex(std::string_view content, std::uint32_t index) {
    std::size_t bytePos = 0;
    std::uint32_t count = 0;
    while (bytePos < content.size() && count < index) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        bytePos += byteLen;
        count++;
    }
    return bytePos;
}

inline std::string substrCodepoints(std::string_view content, std::uint32_t first, std::uint32_t count) {
    const std::size_t b0 = codepointToByteIndex(content, first);
    const std::size_t b1 = b0 + codepointToByteIndex(content.substr(b0), count);
    return std::string(content.substr(b0, b1 - b0));
}

inline std::string insertCodepoints(std::string_view content, std::uint32_t at, std::string_view text) {
    const std::size_t b = codepointToByteIndex(content, at);
    std::string out;
    out.reserve(content.size() + text.size());
    out.append(content.substr(0, b));
    out.append(text);
    out.append(content.substr(b));
    return out;
}

inline std::string eraseCodepoints(std::string_view content, std::uint32_t first, std::uint32_t count) {
    const std::size_t b0 = codepointToByteIndex(content, first);
    const std::size_t b1 = b0 + codepointToByteIndex(content.substr(b0), count);
    std::string out;
    out.reserve(content.size() - (b1 - b0));
    out.append(content.substr(0, b0));
    out.append(content.substr(b1));
    return out;
}

/**
 * Lower-case mapping for Latin and Cyrillic capitals; other codepoints pass through.
 */
inline std::uint32_t toLowerCodepoint(std::uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

} // namespace textarea

#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <string>
#include <string_view>

namespace quire {

// =============================================================================
// UTF-8 Index Conversion
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

inline bool isUtf8Continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * Clamp a byte offset into [0, size] and snap it back onto a code point boundary.
 */
inline std::uint32_t clampToCodepointBoundary(std::string_view content, std::uint32_t byteIndex) {
    std::size_t pos = std::min<std::size_t>(byteIndex, content.size());
    while (pos > 0 && pos < content.size() && isUtf8Continuation(static_cast<unsigned char>(content[pos]))) {
        --pos;
    }
    return static_cast<std::uint32_t>(pos);
}

inline std::uint32_t prevCodepointIndex(std::string_view content, std::uint32_t byteIndex) {
    std::size_t pos = std::min<std::size_t>(byteIndex, content.size());
    if (pos == 0) return 0;
    --pos;
    while (pos > 0 && isUtf8Continuation(static_cast<unsigned char>(content[pos]))) {
        --pos;
    }
    return static_cast<std::uint32_t>(pos);
}

inline std::uint32_t nextCodepointIndex(std::string_view content, std::uint32_t byteIndex) {
    if (byteIndex >= content.size()) return static_cast<std::uint32_t>(content.size());
    std::uint32_t byteLen = 0;
    decodeUtf8Codepoint(content, byteIndex, byteLen);
    if (byteLen == 0) byteLen = 1;
    return static_cast<std::uint32_t>(std::min<std::size_t>(content.size(), byteIndex + byteLen));
}

/**
 * Map logical index (UTF-16 code unit count) to UTF-8 byte offset.
 */
inline std::uint32_t logicalToByteIndex(std::string_view content, std::uint32_t logicalIndex) {
    std::uint32_t bytePos = 0;
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    while (bytePos < n && logicalCount < logicalIndex) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = cp > 0xFFFF ? 2u : 1u;
        if (logicalCount + units > logicalIndex) break;
        logicalCount += units;
        bytePos += byteLen;
    }
    return static_cast<std::uint32_t>(bytePos);
}

/**
 * Map UTF-8 byte index to logical index (UTF-16 code unit count).
 */
inline std::uint32_t byteToLogicalIndex(std::string_view content, std::uint32_t byteIndex) {
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    const std::size_t limit = std::min<std::size_t>(n, byteIndex);
    std::size_t pos = 0;
    while (pos < limit) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0 || pos + byteLen > limit) break;
        logicalCount += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return logicalCount;
}

// =============================================================================
// Class Lists
// =============================================================================

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

inline std::string_view trimAscii(std::string_view s) {
    while (!s.empty() && isAsciiSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isAsciiSpace(s.back())) s.remove_suffix(1);
    return s;
}

inline bool classListContains(std::string_view classList, std::string_view name) {
    std::size_t pos = 0;
    while (pos < classList.size()) {
        while (pos < classList.size() && isAsciiSpace(classList[pos])) ++pos;
        std::size_t end = pos;
        while (end < classList.size() && !isAsciiSpace(classList[end])) ++end;
        if (end > pos && classList.substr(pos, end - pos) == name) return true;
        pos = end;
    }
    return false;
}

// Drops every occurrence of `name`; remaining classes are joined by single spaces.
inline std::string classListWithout(std::string_view classList, std::string_view name) {
    std::string out;
    std::size_t pos = 0;
    while (pos < classList.size()) {
        while (pos < classList.size() && isAsciiSpace(classList[pos])) ++pos;
        std::size_t end = pos;
        while (end < classList.size() && !isAsciiSpace(classList[end])) ++end;
        if (end > pos) {
            const std::string_view item = classList.substr(pos, end - pos);
            if (item != name) {
                if (!out.empty()) out.push_back(' ');
                out.append(item.data(), item.size());
            }
        }
        pos = end;
    }
    return out;
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace quire

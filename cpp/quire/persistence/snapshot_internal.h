#pragma once

#include "quire/core/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quire::snapshot::detail {

constexpr const char* kTagLargeHeading = "h1";
constexpr const char* kTagSmallHeading = "h2";
constexpr const char* kTagParagraph = "p";
constexpr const char* kTagDiv = "div";

struct MarkupToken {
    enum class Kind : std::uint8_t { StartTag, EndTag, Text };

    Kind kind = Kind::Text;
    std::string name; // lower-case tag name
    std::vector<std::pair<std::string, std::string>> attributes;
    bool selfClosing = false;
    std::string text; // decoded character data
};

inline const std::string* findAttribute(const MarkupToken& token, std::string_view name) {
    for (const auto& attr : token.attributes) {
        if (attr.first == name) return &attr.second;
    }
    return nullptr;
}

inline bool isWhitespaceText(const MarkupToken& token) {
    if (token.kind != MarkupToken::Kind::Text) return false;
    for (const char c : token.text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f') return false;
    }
    return true;
}

// Pull tokenizer for the markup subset written by buildSnapshotMarkup.
class MarkupReader {
public:
    explicit MarkupReader(std::string_view src) : src_(src) {}

    // Returns false at end of input or on error (check failed()).
    bool next(MarkupToken& token);
    bool failed() const { return failed_; }

private:
    bool readTag(MarkupToken& token);
    bool readText(MarkupToken& token);

    std::string_view src_;
    std::size_t pos_ = 0;
    bool failed_ = false;
};

std::string decodeEntities(std::string_view raw);

inline void appendEscapedText(std::string& out, std::string_view text) {
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c); break;
        }
    }
}

inline void appendEscapedAttribute(std::string& out, std::string_view value) {
    for (const char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
}

} // namespace quire::snapshot::detail

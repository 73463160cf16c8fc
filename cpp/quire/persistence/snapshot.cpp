#include "quire/persistence/snapshot.h"
#include "quire/persistence/snapshot_internal.h"
#include "quire/document/section_tree.h"
#include "quire/core/logging.h"
#include "quire/core/string_utils.h"
#include <cctype>
#include <cstdlib>

namespace quire {

using namespace snapshot::detail;

namespace snapshot::detail {

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':';
}

std::string toLower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

std::string decodeEntities(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '&') {
            out.push_back(raw[i++]);
            continue;
        }
        const std::size_t semi = raw.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10) {
            out.push_back(raw[i++]);
            continue;
        }
        const std::string_view entity = raw.substr(i + 1, semi - i - 1);
        if (entity == "amp") out.push_back('&');
        else if (entity == "lt") out.push_back('<');
        else if (entity == "gt") out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else if (entity == "nbsp") appendUtf8(out, 0xA0);
        else if (entity.size() > 1 && entity[0] == '#') {
            const bool hex = entity[1] == 'x' || entity[1] == 'X';
            const std::string digits(entity.substr(hex ? 2 : 1));
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (digits.empty() || !end || *end != '\0') {
                out.push_back(raw[i++]);
                continue;
            }
            appendUtf8(out, static_cast<std::uint32_t>(cp));
        } else {
            out.push_back(raw[i++]);
            continue;
        }
        i = semi + 1;
    }
    return out;
}

bool MarkupReader::next(MarkupToken& token) {
    if (failed_) return false;
    while (pos_ < src_.size()) {
        if (src_.compare(pos_, 4, "<!--") == 0) {
            const std::size_t end = src_.find("-->", pos_ + 4);
            if (end == std::string_view::npos) {
                failed_ = true;
                return false;
            }
            pos_ = end + 3;
            continue;
        }
        token = MarkupToken{};
        if (src_[pos_] == '<') return readTag(token);
        return readText(token);
    }
    return false;
}

bool MarkupReader::readText(MarkupToken& token) {
    const std::size_t end = src_.find('<', pos_);
    const std::size_t stop = end == std::string_view::npos ? src_.size() : end;
    token.kind = MarkupToken::Kind::Text;
    token.text = decodeEntities(src_.substr(pos_, stop - pos_));
    pos_ = stop;
    return true;
}

bool MarkupReader::readTag(MarkupToken& token) {
    std::size_t p = pos_ + 1;
    token.kind = MarkupToken::Kind::StartTag;
    if (p < src_.size() && src_[p] == '/') {
        token.kind = MarkupToken::Kind::EndTag;
        ++p;
    }
    const std::size_t nameStart = p;
    while (p < src_.size() && isNameChar(src_[p])) ++p;
    if (p == nameStart) {
        failed_ = true;
        return false;
    }
    token.name = toLower(src_.substr(nameStart, p - nameStart));

    for (;;) {
        while (p < src_.size() && isAsciiSpace(src_[p])) ++p;
        if (p >= src_.size()) {
            failed_ = true;
            return false;
        }
        if (src_[p] == '>') {
            ++p;
            break;
        }
        if (src_[p] == '/' && p + 1 < src_.size() && src_[p + 1] == '>') {
            token.selfClosing = true;
            p += 2;
            break;
        }
        if (token.kind == MarkupToken::Kind::EndTag) {
            failed_ = true;
            return false;
        }

        const std::size_t attrStart = p;
        while (p < src_.size() && isNameChar(src_[p])) ++p;
        if (p == attrStart) {
            failed_ = true;
            return false;
        }
        std::string name = toLower(src_.substr(attrStart, p - attrStart));
        std::string value;
        while (p < src_.size() && isAsciiSpace(src_[p])) ++p;
        if (p < src_.size() && src_[p] == '=') {
            ++p;
            while (p < src_.size() && isAsciiSpace(src_[p])) ++p;
            if (p >= src_.size()) {
                failed_ = true;
                return false;
            }
            if (src_[p] == '"' || src_[p] == '\'') {
                const char quote = src_[p];
                const std::size_t close = src_.find(quote, p + 1);
                if (close == std::string_view::npos) {
                    failed_ = true;
                    return false;
                }
                value = decodeEntities(src_.substr(p + 1, close - p - 1));
                p = close + 1;
            } else {
                const std::size_t valueStart = p;
                while (p < src_.size() && !isAsciiSpace(src_[p]) && src_[p] != '>') ++p;
                value = decodeEntities(src_.substr(valueStart, p - valueStart));
            }
        }
        token.attributes.emplace_back(std::move(name), std::move(value));
    }
    pos_ = p;
    return true;
}

} // namespace snapshot::detail

namespace {

struct OpenMark {
    std::string tag;
    MarkFlags flags;
    LinkId linkIndex;
};

bool nextSignificant(MarkupReader& reader, MarkupToken& token) {
    while (reader.next(token)) {
        if (!isWhitespaceText(token)) return true;
    }
    return false;
}

std::string attributeOr(const MarkupToken& token, std::string_view name) {
    const std::string* value = findAttribute(token, name);
    return value ? *value : std::string();
}

EditorError parseContainer(MarkupReader& reader, const MarkupToken& open, SectionSnapshot& out) {
    out.kind = SectionKind::Container;
    out.classNames = classListWithout(attributeOr(open, "class"), kContainerSectionClass);
    out.style = attributeOr(open, "style");

    int atomicCount = 0;
    MarkupToken token;
    while (nextSignificant(reader, token)) {
        if (token.kind == MarkupToken::Kind::EndTag && token.name == kTagDiv) {
            return atomicCount == 1 ? EditorError::Ok : EditorError::InvalidSnapshot;
        }
        if (token.kind == MarkupToken::Kind::StartTag && token.name == "img") {
            const std::string* src = findAttribute(token, "src");
            if (!src) return EditorError::InvalidSnapshot;
            out.atomic.kind = AtomicKind::Image;
            out.atomic.src = *src;
            out.atomic.alt = attributeOr(token, "alt");
            ++atomicCount;
            continue;
        }
        if (token.kind == MarkupToken::Kind::StartTag && token.name == "hr") {
            out.atomic = AtomicObject{};
            out.atomic.kind = AtomicKind::Rule;
            ++atomicCount;
            continue;
        }
        return EditorError::InvalidSnapshot;
    }
    return EditorError::InvalidSnapshot;
}

EditorError parseTextSection(MarkupReader& reader, const MarkupToken& open, SnapshotData& data, SectionSnapshot& out) {
    out.kind = SectionKind::Text;
    if (open.name == kTagLargeHeading) out.heading = HeadingLevel::Large;
    else if (open.name == kTagSmallHeading) out.heading = HeadingLevel::Small;
    out.classNames = classListWithout(attributeOr(open, "class"), kTextSectionClass);
    out.style = attributeOr(open, "style");

    std::vector<OpenMark> stack;
    MarkupToken token;
    while (reader.next(token)) {
        switch (token.kind) {
            case MarkupToken::Kind::Text: {
                if (token.text.empty()) break;
                MarkFlags flags = MarkFlags::None;
                LinkId linkIndex = kNoLink;
                for (const OpenMark& mark : stack) {
                    flags = flags | mark.flags;
                    if (mark.linkIndex != kNoLink) linkIndex = mark.linkIndex;
                }
                TextRun run;
                run.startIndex = static_cast<std::uint32_t>(out.content.size());
                run.length = static_cast<std::uint32_t>(token.text.size());
                run.flags = flags;
                run.linkId = linkIndex;
                out.runs.push_back(run);
                out.content += token.text;
                break;
            }
            case MarkupToken::Kind::StartTag: {
                if (token.name == "br") break;
                OpenMark mark{token.name, MarkFlags::None, kNoLink};
                if (token.name == "b" || token.name == "strong") {
                    mark.flags = MarkFlags::Bold;
                } else if (token.name == "i" || token.name == "em") {
                    mark.flags = MarkFlags::Italic;
                } else if (token.name == "a") {
                    const std::string* href = findAttribute(token, "href");
                    if (!href) return EditorError::InvalidSnapshot;
                    data.links.push_back(*href);
                    mark.flags = MarkFlags::Link;
                    mark.linkIndex = static_cast<LinkId>(data.links.size());
                } else if (token.name != "span") {
                    return EditorError::InvalidSnapshot;
                }
                if (!token.selfClosing) stack.push_back(std::move(mark));
                break;
            }
            case MarkupToken::Kind::EndTag: {
                if (token.name == "br") break;
                if (stack.empty()) {
                    return token.name == open.name ? EditorError::Ok : EditorError::InvalidSnapshot;
                }
                if (stack.back().tag != token.name) return EditorError::InvalidSnapshot;
                stack.pop_back();
                break;
            }
        }
    }
    return EditorError::InvalidSnapshot;
}

bool isTextSectionTag(const std::string& name) {
    return name == kTagParagraph || name == kTagDiv || name == kTagLargeHeading || name == kTagSmallHeading;
}

} // namespace

EditorError parseSnapshot(std::string_view markup, SnapshotData& out) {
    out = SnapshotData{};
    MarkupReader reader(markup);
    MarkupToken token;

    if (!nextSignificant(reader, token)
        || token.kind != MarkupToken::Kind::StartTag
        || token.name != kTagDiv
        || !classListContains(attributeOr(token, "class"), kEditorRootClass)) {
        QUIRE_LOG_DEBUG("parseSnapshot: root fingerprint missing");
        return EditorError::InvalidMagic;
    }
    out.editable = attributeOr(token, "contenteditable") == "true";

    for (;;) {
        if (!nextSignificant(reader, token)) {
            QUIRE_LOG_DEBUG("parseSnapshot: unterminated root");
            return EditorError::InvalidSnapshot;
        }
        if (token.kind == MarkupToken::Kind::EndTag && token.name == kTagDiv) break;
        if (token.kind != MarkupToken::Kind::StartTag) return EditorError::InvalidSnapshot;

        SectionSnapshot section;
        EditorError err = EditorError::InvalidSnapshot;
        if (token.name == kTagDiv && classListContains(attributeOr(token, "class"), kContainerSectionClass)) {
            err = parseContainer(reader, token, section);
        } else if (isTextSectionTag(token.name) && !token.selfClosing) {
            err = parseTextSection(reader, token, out, section);
        }
        if (err != EditorError::Ok) {
            QUIRE_LOG_DEBUG("parseSnapshot: malformed section <%s>", token.name.c_str());
            return err;
        }
        out.sections.push_back(std::move(section));
    }

    if (nextSignificant(reader, token) || reader.failed()) return EditorError::InvalidSnapshot;
    if (out.sections.empty() || out.sections.front().kind != SectionKind::Text) {
        QUIRE_LOG_DEBUG("parseSnapshot: document must start with a text section");
        return EditorError::InvalidSnapshot;
    }
    return EditorError::Ok;
}

void loadSnapshot(const SnapshotData& data, SectionTree& tree) {
    tree.beginRestore();
    std::vector<LinkId> linkIds;
    linkIds.reserve(data.links.size());
    for (const std::string& href : data.links) {
        linkIds.push_back(tree.restoreLink(href));
    }

    for (const SectionSnapshot& section : data.sections) {
        if (section.kind == SectionKind::Container) {
            tree.restoreContainerSection(section.atomic, section.classNames, section.style);
            continue;
        }
        std::vector<TextRun> runs = section.runs;
        for (TextRun& run : runs) {
            if (run.linkId == kNoLink) continue;
            run.linkId = run.linkId <= linkIds.size() ? linkIds[run.linkId - 1] : kNoLink;
        }
        tree.restoreTextSection(section.heading, section.classNames, section.style, section.content, std::move(runs));
    }
    tree.finishRestore();
}

} // namespace quire

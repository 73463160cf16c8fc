#ifndef QUIRE_CORE_TYPES_H
#define QUIRE_CORE_TYPES_H

#include <cstdint>
#include <string>

namespace quire {

using SectionId = std::uint32_t;
using LinkId = std::uint32_t;

constexpr SectionId kNoSection = 0;
constexpr LinkId kNoLink = 0;

// Error codes. Nothing here is fatal; callers absorb them and the next host
// event re-derives a valid state.
enum class EditorError : std::uint32_t {
    Ok = 0,
    SectionNotFound = 1,
    StructuralViolation = 2,
    InvalidURL = 3,
    InvalidSnapshot = 4,
    InvalidMagic = 5,
    UnsupportedVersion = 6,
    BufferTruncated = 7,
    InvalidPayloadSize = 8,
    UnknownEvent = 9,
    InvalidOperation = 10,
};

const char* editorErrorName(EditorError err) noexcept;

enum class SectionKind : std::uint8_t {
    Text = 0,
    Container = 1,
};

enum class HeadingLevel : std::uint8_t {
    None = 0,
    Large = 1,
    Small = 2,
};

enum class AtomicKind : std::uint8_t {
    Image = 0,
    Rule = 1,
};

struct AtomicObject {
    AtomicKind kind = AtomicKind::Rule;
    std::string src;
    std::string alt;
};

enum class MarkFlags : std::uint8_t {
    None = 0,
    Bold = 1 << 0,
    Italic = 1 << 1,
    Link = 1 << 2,
};

inline MarkFlags operator|(MarkFlags a, MarkFlags b) {
    return static_cast<MarkFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline MarkFlags operator&(MarkFlags a, MarkFlags b) {
    return static_cast<MarkFlags>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

inline MarkFlags operator~(MarkFlags a) {
    return static_cast<MarkFlags>(~static_cast<std::uint8_t>(a) & 0x07u);
}

inline bool hasMark(MarkFlags flags, MarkFlags mark) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(mark)) != 0;
}

// A styled span inside a TextSection. Offsets are UTF-8 bytes.
// linkId is non-zero exactly when flags carries MarkFlags::Link.
struct TextRun {
    std::uint32_t startIndex = 0;
    std::uint32_t length = 0;
    MarkFlags flags = MarkFlags::None;
    LinkId linkId = kNoLink;
};

struct Cursor {
    SectionId sectionId = kNoSection;
    std::uint32_t offset = 0;
};

inline bool operator==(const Cursor& a, const Cursor& b) {
    return a.sectionId == b.sectionId && a.offset == b.offset;
}

inline bool operator!=(const Cursor& a, const Cursor& b) { return !(a == b); }

struct Selection {
    Cursor anchor;
    Cursor focus;

    bool isCollapsed() const { return anchor == focus; }

    static Selection collapsedAt(Cursor c) { return Selection{c, c}; }
    static Selection collapsedAt(SectionId id, std::uint32_t offset) { return collapsedAt(Cursor{id, offset}); }
};

inline bool operator==(const Selection& a, const Selection& b) {
    return a.anchor == b.anchor && a.focus == b.focus;
}

enum class Direction : std::uint8_t {
    Backward = 0,
    Forward = 1,
};

enum class FormatCommand : std::uint8_t {
    Bold = 0,
    Italic = 1,
};

// Accumulated document change categories, forwarded to the host after an event.
enum class ChangeMask : std::uint32_t {
    None = 0,
    Structure = 1 << 0,
    Content = 1 << 1,
    Marks = 1 << 2,
    Selection = 1 << 3,
};

inline ChangeMask operator|(ChangeMask a, ChangeMask b) {
    return static_cast<ChangeMask>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline bool hasChange(ChangeMask mask, ChangeMask bit) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(bit)) != 0;
}

} // namespace quire

#endif // QUIRE_CORE_TYPES_H

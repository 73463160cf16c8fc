#include "quire/editing/editing_engine.h"
#include "quire/editing/url_validation.h"
#include "quire/document/section_tree.h"
#include "quire/selection/selection_controller.h"
#include "quire/host/host_surface.h"
#include "quire/core/logging.h"
#include "quire/core/string_utils.h"

namespace quire {

namespace {

struct OrderedRange {
    Cursor start;
    Cursor end;
};

OrderedRange orderRange(const SectionTree& tree, const Selection& range) {
    if (tree.precedes(range.focus, range.anchor)) {
        return OrderedRange{range.focus, range.anchor};
    }
    return OrderedRange{range.anchor, range.focus};
}

MarkTriState triStateOf(bool sawOn, bool sawOff) {
    if (sawOn && sawOff) return MarkTriState::Mixed;
    return sawOn ? MarkTriState::On : MarkTriState::Off;
}

} // namespace

EditingEngine::EditingEngine(SectionTree& tree, SelectionController& selection, HostSurface& host)
    : tree_(tree), selection_(selection), host_(host) {}

// =============================================================================
// Marks
// =============================================================================

EditorError EditingEngine::toggleMark(FormatCommand command) {
    const Selection sel = host_.querySelection();
    if (!selection_.resolvesToText(sel.anchor) || !selection_.resolvesToText(sel.focus)) {
        return EditorError::SectionNotFound;
    }
    if (sel.isCollapsed()) return EditorError::InvalidOperation;
    if (formatStateOf(sel).marksDisabled()) return EditorError::InvalidOperation;

    if (!host_.execFormatCommand(command, sel)) {
        return EditorError::InvalidOperation;
    }
    const OrderedRange r = orderRange(tree_, sel);
    const auto first = tree_.indexOf(r.start.sectionId);
    const auto last = tree_.indexOf(r.end.sectionId);
    if (first && last) {
        for (std::size_t i = *first; i <= *last; ++i) {
            tree_.normalize(tree_.sectionAt(i));
        }
    }
    return EditorError::Ok;
}

EditorError EditingEngine::toggleBold() {
    return toggleMark(FormatCommand::Bold);
}

EditorError EditingEngine::toggleItalic() {
    return toggleMark(FormatCommand::Italic);
}

EditorError EditingEngine::wrapHeading() {
    const auto current = selection_.currentSection();
    if (!current) return EditorError::SectionNotFound;
    const SectionId id = *current;

    HeadingLevel next = HeadingLevel::None;
    if (tree_.headingOf(id) == HeadingLevel::None) {
        next = tree_.firstSection() == id ? HeadingLevel::Large : HeadingLevel::Small;
    }
    if (!host_.formatBlock(id, next)) {
        QUIRE_LOG_WARN("wrapHeading: host refused block format on section %u", id);
        return EditorError::InvalidOperation;
    }
    // Headings hold plain text whatever the host did with the inline marks.
    if (next != HeadingLevel::None) tree_.clearMarks(id);
    tree_.applyPresentation(id);
    return EditorError::Ok;
}

EditorError EditingEngine::wrapLink(std::string_view url, const Selection& range) {
    const auto href = normalizeUrl(url);
    if (!href) {
        QUIRE_LOG_DEBUG("wrapLink: rejected url '%.*s'", static_cast<int>(url.size()), url.data());
        return EditorError::InvalidURL;
    }
    if (!selection_.resolvesToText(range.anchor) || !selection_.resolvesToText(range.focus)) {
        return EditorError::SectionNotFound;
    }
    if (range.isCollapsed()) return EditorError::InvalidOperation;

    const OrderedRange r = orderRange(tree_, range);
    const std::size_t first = *tree_.indexOf(r.start.sectionId);
    const std::size_t last = *tree_.indexOf(r.end.sectionId);
    const LinkId linkId = tree_.createLink(*href);

    std::optional<Cursor> linkEnd;
    for (std::size_t i = first; i <= last; ++i) {
        const SectionId id = tree_.sectionAt(i);
        if (!tree_.isText(id)) continue;
        const std::uint32_t s = id == r.start.sectionId ? r.start.offset : 0;
        const std::uint32_t e = id == r.end.sectionId ? r.end.offset : tree_.contentLength(id);
        if (tree_.applyLink(id, s, e, linkId)) {
            linkEnd = Cursor{id, e};
        }
    }
    if (!linkEnd) {
        tree_.dropLink(linkId);
        return EditorError::InvalidOperation;
    }
    selection_.collapseTo(*linkEnd);
    return EditorError::Ok;
}

EditorError EditingEngine::removeLink(LinkId linkId) {
    if (!tree_.hasLink(linkId)) {
        QUIRE_LOG_DEBUG("removeLink: unknown link %u", linkId);
        return EditorError::SectionNotFound;
    }
    std::optional<Cursor> linkEnd;
    for (const SectionId id : tree_.order()) {
        if (const auto end = tree_.clearLink(id, linkId)) {
            linkEnd = Cursor{id, *end};
        }
    }
    tree_.dropLink(linkId);
    if (linkEnd) selection_.collapseTo(*linkEnd);
    return EditorError::Ok;
}

// =============================================================================
// Structure
// =============================================================================

EditorError EditingEngine::insertContainer(AtomicKind kind, const AtomicObject& payload, SectionId beforeSectionId) {
    const auto beforeIndex = tree_.indexOf(beforeSectionId);
    if (!beforeIndex) {
        QUIRE_LOG_DEBUG("insertContainer: unknown section %u", beforeSectionId);
        return EditorError::SectionNotFound;
    }

    AtomicObject atomic = payload;
    atomic.kind = kind;

    if (kind == AtomicKind::Rule) {
        if (*beforeIndex == 0) {
            QUIRE_LOG_DEBUG("insertContainer: refused rule before the first section");
            return EditorError::StructuralViolation;
        }
        atomic.src.clear();
        atomic.alt.clear();
        tree_.insertContainerSection(tree_.previousOf(beforeSectionId), atomic);
        if (tree_.isText(beforeSectionId)) selection_.collapseTo(Cursor{beforeSectionId, 0});
        return EditorError::Ok;
    }

    SectionId before = tree_.previousOf(beforeSectionId);
    if (before == kNoSection || !tree_.isText(before) || tree_.contentLength(before) != 0) {
        before = tree_.insertTextSection(before);
    }
    const SectionId container = tree_.insertContainerSection(before, atomic);

    SectionId after = tree_.nextOf(container);
    if (!tree_.isText(after) || tree_.contentLength(after) != 0) {
        after = tree_.insertTextSection(container);
    }
    selection_.collapseTo(Cursor{after, 0});
    return EditorError::Ok;
}

EditorError EditingEngine::splitAtCursor() {
    const Selection sel = host_.querySelection();
    if (!selection_.resolvesToText(sel.anchor) || !selection_.resolvesToText(sel.focus)) {
        return EditorError::SectionNotFound;
    }
    Cursor caret = sel.focus;
    if (!sel.isCollapsed()) {
        caret = tree_.deleteRange(sel.anchor, sel.focus);
    }
    const SectionId tail = tree_.splitSection(caret.sectionId, caret.offset);
    if (tail == kNoSection) return EditorError::SectionNotFound;
    selection_.collapseTo(Cursor{tail, 0});
    return EditorError::Ok;
}

bool EditingEngine::deleteAdjacentContainer(Direction direction) {
    const Selection sel = host_.querySelection();
    if (!sel.isCollapsed() || !selection_.resolvesToText(sel.focus)) return false;
    const Cursor caret = sel.focus;

    SectionId target = kNoSection;
    if (direction == Direction::Backward) {
        if (caret.offset != 0) return false;
        target = tree_.previousOf(caret.sectionId);
    } else {
        if (caret.offset < tree_.contentLength(caret.sectionId)) return false;
        target = tree_.nextOf(caret.sectionId);
    }
    if (!tree_.isContainer(target)) return false;

    tree_.removeSection(target);
    selection_.collapseTo(caret);
    return true;
}

EditorError EditingEngine::removeContainer(SectionId sectionId) {
    if (!tree_.isContainer(sectionId)) return EditorError::SectionNotFound;
    return tree_.removeSection(sectionId);
}

EditorError EditingEngine::pastePlainText(std::string_view text) {
    const Selection sel = host_.querySelection();
    if (!selection_.resolvesToText(sel.anchor) || !selection_.resolvesToText(sel.focus)) {
        return EditorError::SectionNotFound;
    }
    Cursor caret = sel.focus;
    if (!sel.isCollapsed()) {
        caret = tree_.deleteRange(sel.anchor, sel.focus);
    }
    const MarkFlags marks = tree_.typingMarksAt(caret.sectionId, caret.offset);

    bool firstLine = true;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        std::string_view line = text.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (!firstLine) {
            caret = Cursor{tree_.splitSection(caret.sectionId, caret.offset), 0};
        }
        tree_.insertText(caret.sectionId, caret.offset, line, marks);
        caret.offset += static_cast<std::uint32_t>(line.size());
        firstLine = false;
        pos = eol + 1;
    }
    selection_.collapseTo(caret);
    return EditorError::Ok;
}

// =============================================================================
// Queries
// =============================================================================

FormatState EditingEngine::formatStateOf(const Selection& range) const {
    FormatState state;
    if (!selection_.resolvesToText(range.anchor) || !selection_.resolvesToText(range.focus)) {
        return state;
    }
    const OrderedRange r = orderRange(tree_, range);
    state.heading = tree_.headingOf(r.start.sectionId);

    Cursor start = r.start;
    Cursor end = r.end;
    if (range.isCollapsed()) {
        // Inspect the character before the caret.
        start.offset = prevCodepointIndex(tree_.getContent(start.sectionId), start.offset);
    }

    bool boldOn = false;
    bool boldOff = false;
    bool italicOn = false;
    bool italicOff = false;
    const std::size_t first = *tree_.indexOf(start.sectionId);
    const std::size_t last = *tree_.indexOf(end.sectionId);
    for (std::size_t i = first; i <= last; ++i) {
        const SectionId id = tree_.sectionAt(i);
        if (!tree_.isText(id)) continue;
        const std::uint32_t s = id == start.sectionId ? start.offset : 0;
        const std::uint32_t e = id == end.sectionId ? end.offset : tree_.contentLength(id);
        if (s >= e) continue;
        for (const TextRun& run : tree_.getRuns(id)) {
            const std::uint32_t runEnd = run.startIndex + run.length;
            if (runEnd <= s || run.startIndex >= e) continue;
            (hasMark(run.flags, MarkFlags::Bold) ? boldOn : boldOff) = true;
            (hasMark(run.flags, MarkFlags::Italic) ? italicOn : italicOff) = true;
            if (!state.linkActive && hasMark(run.flags, MarkFlags::Link)) {
                state.linkActive = true;
                state.activeLinkId = run.linkId;
            }
        }
    }
    state.bold = triStateOf(boldOn, boldOff);
    state.italic = triStateOf(italicOn, italicOff);
    return state;
}

} // namespace quire

#include "quire/host/reference_surface.h"
#include "quire/document/section_tree.h"
#include "quire/core/string_utils.h"
#include <vector>

namespace quire {

namespace {

MarkFlags markFor(FormatCommand command) {
    return command == FormatCommand::Bold ? MarkFlags::Bold : MarkFlags::Italic;
}

struct Span {
    SectionId id;
    std::uint32_t start;
    std::uint32_t end;
};

// Non-empty pieces of `range` inside markable (non-heading) text sections.
std::vector<Span> markableSpans(const SectionTree& tree, const Selection& range) {
    std::vector<Span> spans;
    const bool reversed = tree.precedes(range.focus, range.anchor);
    const Cursor start = reversed ? range.focus : range.anchor;
    const Cursor end = reversed ? range.anchor : range.focus;
    const auto first = tree.indexOf(start.sectionId);
    const auto last = tree.indexOf(end.sectionId);
    if (!first || !last) return spans;

    for (std::size_t i = *first; i <= *last; ++i) {
        const SectionId id = tree.sectionAt(i);
        if (!tree.isText(id) || tree.headingOf(id) != HeadingLevel::None) continue;
        const std::uint32_t s = id == start.sectionId ? start.offset : 0;
        const std::uint32_t e = id == end.sectionId ? end.offset : tree.contentLength(id);
        if (s < e) spans.push_back(Span{id, s, e});
    }
    return spans;
}

} // namespace

ReferenceSurface::ReferenceSurface(std::uint32_t surfaceId)
    : surfaceId_(surfaceId) {}

bool ReferenceSurface::execFormatCommand(FormatCommand command, const Selection& range) {
    if (!tree_) return false;
    const MarkFlags mark = markFor(command);
    const std::vector<Span> spans = markableSpans(*tree_, range);
    if (spans.empty()) return false;

    bool allMarked = true;
    for (const Span& span : spans) {
        for (const TextRun& run : tree_->getRuns(span.id)) {
            const std::uint32_t runEnd = run.startIndex + run.length;
            if (runEnd <= span.start || run.startIndex >= span.end) continue;
            if (!hasMark(run.flags, mark)) allMarked = false;
        }
    }
    for (const Span& span : spans) {
        tree_->applyMarks(span.id, span.start, span.end, mark, !allMarked);
    }
    return true;
}

bool ReferenceSurface::formatBlock(SectionId sectionId, HeadingLevel level) {
    return tree_ && tree_->setHeading(sectionId, level);
}

void ReferenceSurface::documentChanged(ChangeMask changes) {
    ++documentChangeCount_;
    lastChanges_ = changes;
}

void ReferenceSurface::placeholderChanged(bool visible, std::string_view text) {
    placeholderVisible_ = visible;
    placeholderText_.assign(text.data(), text.size());
}

// =============================================================================
// Native behaviour
// =============================================================================

void ReferenceSurface::applyNativeKey(const KeyEvent& event) {
    if (!tree_) return;
    switch (event.key) {
        case Key::Character:
            if (event.isDeletion()) {
                deleteSelection();
            } else if (!event.isShortcut()) {
                typeText(event.text);
            }
            break;
        case Key::Enter: {
            if (!selection_.isCollapsed()) deleteSelection();
            const Cursor caret = selection_.focus;
            const SectionId tail = tree_->splitSection(caret.sectionId, caret.offset);
            if (tail != kNoSection) selection_ = Selection::collapsedAt(tail, 0);
            break;
        }
        case Key::Backspace:
            if (selection_.isCollapsed()) deleteBackward(); else deleteSelection();
            break;
        case Key::Delete:
            if (selection_.isCollapsed()) deleteForward(); else deleteSelection();
            break;
        case Key::ArrowUp:
        case Key::ArrowDown:
        case Key::ArrowLeft:
        case Key::ArrowRight:
            moveCaret(event.navigationKey());
            break;
        case Key::Escape:
        case Key::Other:
            break;
    }
}

void ReferenceSurface::typeText(std::string_view text) {
    if (!tree_) return;
    if (!selection_.isCollapsed()) deleteSelection();
    Cursor caret = selection_.focus;
    if (!tree_->isText(caret.sectionId)) return;
    caret.offset = clampToCodepointBoundary(tree_->getContent(caret.sectionId), caret.offset);
    const MarkFlags marks = tree_->typingMarksAt(caret.sectionId, caret.offset);
    tree_->insertText(caret.sectionId, caret.offset, text, marks);
    caret.offset += static_cast<std::uint32_t>(text.size());
    selection_ = Selection::collapsedAt(caret);
}

void ReferenceSurface::deleteBackward() {
    if (!tree_) return;
    const Cursor caret = selection_.focus;
    if (!tree_->isText(caret.sectionId)) return;

    if (caret.offset > 0) {
        const std::uint32_t prev = prevCodepointIndex(tree_->getContent(caret.sectionId), caret.offset);
        tree_->deleteText(caret.sectionId, prev, caret.offset);
        selection_ = Selection::collapsedAt(caret.sectionId, prev);
        return;
    }

    const SectionId prevSection = tree_->previousOf(caret.sectionId);
    if (tree_->isText(prevSection)) {
        const std::uint32_t joint = tree_->contentLength(prevSection);
        tree_->mergeWithNext(prevSection);
        selection_ = Selection::collapsedAt(prevSection, joint);
    } else if (tree_->isContainer(prevSection)) {
        selection_ = Selection::collapsedAt(prevSection, 0);
    }
}

void ReferenceSurface::deleteForward() {
    if (!tree_) return;
    const Cursor caret = selection_.focus;
    if (!tree_->isText(caret.sectionId)) return;

    const std::string_view content = tree_->getContent(caret.sectionId);
    if (caret.offset < content.size()) {
        tree_->deleteText(caret.sectionId, caret.offset, nextCodepointIndex(content, caret.offset));
        return;
    }

    const SectionId nextSection = tree_->nextOf(caret.sectionId);
    if (tree_->isText(nextSection)) {
        tree_->mergeWithNext(caret.sectionId);
    } else if (tree_->isContainer(nextSection)) {
        selection_ = Selection::collapsedAt(nextSection, 0);
    }
}

void ReferenceSurface::deleteSelection() {
    if (!tree_ || selection_.isCollapsed()) return;
    selection_ = Selection::collapsedAt(tree_->deleteRange(selection_.anchor, selection_.focus));
}

void ReferenceSurface::moveCaret(NavigationKey key) {
    if (!tree_ || key == NavigationKey::Other) return;
    const Cursor caret = selection_.focus;
    const bool inText = tree_->isText(caret.sectionId);
    const std::string_view content = tree_->getContent(caret.sectionId);

    switch (key) {
        case NavigationKey::ArrowLeft:
            if (inText && caret.offset > 0) {
                selection_ = Selection::collapsedAt(caret.sectionId, prevCodepointIndex(content, caret.offset));
                return;
            }
            break;
        case NavigationKey::ArrowRight:
            if (inText && caret.offset < content.size()) {
                selection_ = Selection::collapsedAt(caret.sectionId, nextCodepointIndex(content, caret.offset));
                return;
            }
            break;
        case NavigationKey::ArrowUp:
        case NavigationKey::ArrowDown:
        case NavigationKey::Other:
            break;
    }

    const bool backward = key == NavigationKey::ArrowLeft || key == NavigationKey::ArrowUp;
    const SectionId target = backward ? tree_->previousOf(caret.sectionId) : tree_->nextOf(caret.sectionId);
    if (target == kNoSection) return;

    std::uint32_t offset = 0;
    if (tree_->isText(target)) {
        if (key == NavigationKey::ArrowLeft) {
            offset = tree_->contentLength(target);
        } else if (key == NavigationKey::ArrowUp || key == NavigationKey::ArrowDown) {
            offset = clampToCodepointBoundary(tree_->getContent(target), caret.offset);
        }
    }
    selection_ = Selection::collapsedAt(target, offset);
}

void ReferenceSurface::placeCaret(SectionId sectionId, std::uint32_t offset) {
    selection_ = Selection::collapsedAt(sectionId, offset);
}

void ReferenceSurface::select(Cursor anchor, Cursor focus) {
    selection_ = Selection{anchor, focus};
}

} // namespace quire

// editor_events.cpp - Host event handlers for EditorInstance.
// Part of the editor.h class split; ctor and editing facade live in editor.cpp.

#include "quire/editor.h"
#include "quire/core/logging.h"

namespace quire {

bool EditorInstance::onKeyDown(const KeyEvent& event) {
    bool suppress = false;
    const Selection sel = host_.querySelection();

    if (event.isDeletion()) {
        // Cut removes forward, like Delete.
        const Direction direction = event.key == Key::Backspace ? Direction::Backward : Direction::Forward;
        if (tree_.isContainer(sel.focus.sectionId) && sel.isCollapsed()) {
            // Deleting while on a container removes that container.
            if (editing_.removeContainer(sel.focus.sectionId) == EditorError::Ok) {
                selection_.repairPosition();
            }
            suppress = true;
        } else if (editing_.deleteAdjacentContainer(direction)) {
            suppress = true;
        } else if (direction == Direction::Backward && sel.isCollapsed()
                   && sel.focus.sectionId == tree_.firstSection() && sel.focus.offset == 0) {
            QUIRE_LOG_DEBUG("onKeyDown: backspace at document start suppressed");
            suppress = true;
        }
    }

    if (!suppress && event.key == Key::Enter) {
        const EditorError err = editing_.splitAtCursor();
        if (err != EditorError::Ok) {
            QUIRE_LOG_DEBUG("onKeyDown: split skipped (%s)", editorErrorName(err));
        }
        suppress = true;
    }

    // Only arrows and printable input act on a container; other keys leave
    // the caret to the post-event repair.
    const bool acts = event.navigationKey() != NavigationKey::Other
        || (event.key == Key::Character && !event.isShortcut());
    if (!suppress && acts && selection_.state() == CursorState::PositionedInContainer) {
        suppress = selection_.preventEditInContainer(event.navigationKey());
    }

    selection_.recordLastGoodPosition();
    afterEvent();
    return suppress;
}

void EditorInstance::onKeyUp(const KeyEvent& event) {
    if (const auto current = selection_.currentSection()) {
        tree_.normalize(*current);
    }
    // Arrowing onto a container continues past it in the direction of travel.
    const NavigationKey nav = event.navigationKey();
    if (nav != NavigationKey::Other && selection_.state() == CursorState::PositionedInContainer
        && host_.querySelection().isCollapsed()) {
        selection_.preventEditInContainer(nav);
    }
    selection_.repairPosition();
    if (event.key != Key::Escape) {
        toolbar_.rederive();
    } else if (!toolbar_.hasPendingInput()) {
        toolbar_.hide();
    }
    afterEvent();
}

void EditorInstance::onClick() {
    selection_.repairPosition();
    toolbar_.rederive();
    afterEvent();
}

void EditorInstance::onMouseUp() {
    selection_.repairPosition();
    selection_.recordLastGoodPosition();
    toolbar_.rederive();
    afterEvent();
}

bool EditorInstance::onPaste(std::string_view plainText) {
    selection_.repairPosition();
    const EditorError err = editing_.pastePlainText(plainText);
    if (err != EditorError::Ok) {
        QUIRE_LOG_DEBUG("onPaste: %s", editorErrorName(err));
    }
    toolbar_.rederive();
    afterEvent();
    return true;
}

void EditorInstance::onSelectionChange(const SelectionChangeEvent& event) {
    if (event.surfaceId != host_.surfaceId()) return;
    if (event.owner == SelectionOwner::Editor) {
        selection_.repairPosition();
    }
    toolbar_.onSelectionChange(event.owner);
    afterEvent();
}

void EditorInstance::onScroll() {
    toolbar_.onScroll();
}

void EditorInstance::onImageLoadFailed(SectionId sectionId) {
    const SectionRec* rec = tree_.getSection(sectionId);
    if (!rec || rec->kind != SectionKind::Container || rec->atomic.kind != AtomicKind::Image) {
        QUIRE_LOG_DEBUG("onImageLoadFailed: section %u is not an image", sectionId);
        return;
    }
    QUIRE_LOG_WARN("image failed to load, removing section %u", sectionId);
    if (editing_.removeContainer(sectionId) != EditorError::Ok) return;
    selection_.repairPosition();
    toolbar_.rederive();
    afterEvent();
}

} // namespace quire

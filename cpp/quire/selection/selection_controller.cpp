#include "quire/selection/selection_controller.h"
#include "quire/document/section_tree.h"
#include "quire/host/host_surface.h"
#include "quire/core/logging.h"
#include "quire/core/string_utils.h"

namespace quire {

SelectionController::SelectionController(SectionTree& tree, HostSurface& host)
    : tree_(tree), host_(host) {}

bool SelectionController::resolvesToText(const Cursor& cursor) const {
    return tree_.isText(cursor.sectionId);
}

CursorState SelectionController::state() const {
    const Selection sel = host_.querySelection();
    if (resolvesToText(sel.anchor) && resolvesToText(sel.focus)) {
        return CursorState::PositionedInText;
    }
    return CursorState::PositionedInContainer;
}

std::optional<SectionId> SelectionController::currentSection() const {
    const Selection sel = host_.querySelection();
    if (!resolvesToText(sel.focus)) return std::nullopt;
    return sel.focus.sectionId;
}

Cursor SelectionController::clampCursor(const Cursor& cursor) const {
    return Cursor{cursor.sectionId, clampToCodepointBoundary(tree_.getContent(cursor.sectionId), cursor.offset)};
}

void SelectionController::collapseTo(const Cursor& cursor) {
    host_.setSelection(Selection::collapsedAt(clampCursor(cursor)));
}

void SelectionController::reset() {
    lastGood_ = PositionSnapshot{};
}

void SelectionController::recordLastGoodPosition() {
    const Selection sel = host_.querySelection();
    if (!resolvesToText(sel.anchor)) return;
    lastGood_.sectionId = sel.anchor.sectionId;
    lastGood_.offset = sel.anchor.offset;
    lastGood_.previousSiblingId = tree_.previousOf(sel.anchor.sectionId);
    lastGood_.valid = true;
}

Cursor SelectionController::chooseRepairTarget(const Selection& current, RepairOutcome& outcome) {
    if (lastGood_.valid && tree_.isText(lastGood_.sectionId)) {
        outcome = RepairOutcome::LastGoodPosition;
        return clampCursor(Cursor{lastGood_.sectionId, lastGood_.offset});
    }

    // Slot the lost position used to occupy.
    std::optional<std::size_t> slot;
    if (lastGood_.valid) {
        if (lastGood_.previousSiblingId == kNoSection) {
            slot = 0;
        } else if (const auto prevIndex = tree_.indexOf(lastGood_.previousSiblingId)) {
            slot = *prevIndex + 1;
        }
    }
    if (!slot) {
        const SectionId landed = resolvesToText(current.anchor) ? current.focus.sectionId : current.anchor.sectionId;
        const auto landedIndex = tree_.indexOf(landed);
        slot = landedIndex ? *landedIndex + 1 : 0;
    }

    const SectionId candidate = tree_.sectionAt(*slot);
    if (tree_.isText(candidate)) {
        outcome = RepairOutcome::AdjacentSection;
        return Cursor{candidate, 0};
    }

    // Slot 0 always holds a TextSection, so *slot >= 1 here.
    const SectionId created = tree_.insertTextSection(tree_.sectionAt(*slot - 1));
    outcome = RepairOutcome::SynthesizedSection;
    return Cursor{created, 0};
}

RepairOutcome SelectionController::repairPosition() {
    const Selection sel = host_.querySelection();

    if (resolvesToText(sel.anchor) && resolvesToText(sel.focus)) {
        const Selection clamped{clampCursor(sel.anchor), clampCursor(sel.focus)};
        if (clamped == sel) return RepairOutcome::Unchanged;
        host_.setSelection(clamped);
        return RepairOutcome::Clamped;
    }

    RepairOutcome outcome = RepairOutcome::Unchanged;
    const Cursor target = chooseRepairTarget(sel, outcome);
    QUIRE_LOG_DEBUG("repairPosition: section %u -> section %u offset %u (outcome %u)",
        sel.focus.sectionId, target.sectionId, target.offset, static_cast<unsigned>(outcome));
    host_.setSelection(Selection::collapsedAt(target));
    recordLastGoodPosition();
    return outcome;
}

bool SelectionController::preventEditInContainer(NavigationKey key) {
    const Selection sel = host_.querySelection();
    const SectionId container = sel.focus.sectionId;
    if (!tree_.isContainer(container)) return false;

    switch (key) {
        case NavigationKey::ArrowUp:
        case NavigationKey::ArrowLeft: {
            const SectionId prev = tree_.previousOf(container);
            if (tree_.isText(prev)) {
                collapseTo(Cursor{prev, tree_.contentLength(prev)});
            } else {
                collapseTo(Cursor{tree_.insertTextSection(prev), 0});
            }
            recordLastGoodPosition();
            return true;
        }
        case NavigationKey::ArrowDown:
        case NavigationKey::ArrowRight: {
            const SectionId next = tree_.nextOf(container);
            if (tree_.isText(next)) {
                collapseTo(Cursor{next, 0});
            } else {
                collapseTo(Cursor{tree_.insertTextSection(container), 0});
            }
            recordLastGoodPosition();
            return true;
        }
        case NavigationKey::Other:
            break;
    }

    // Text typed while on a container goes into an empty section after it.
    const SectionId next = tree_.nextOf(container);
    if (tree_.isText(next) && tree_.contentLength(next) == 0) {
        collapseTo(Cursor{next, 0});
    } else {
        collapseTo(Cursor{tree_.insertTextSection(container), 0});
    }
    recordLastGoodPosition();
    return false;
}

} // namespace quire

#include "quire/toolbar/toolbar_coordinator.h"
#include "quire/document/section_tree.h"
#include "quire/selection/selection_controller.h"
#include "quire/editing/editing_engine.h"
#include "quire/editing/url_validation.h"
#include "quire/host/host_surface.h"
#include "quire/core/logging.h"

namespace quire {

const char* toolbarStateName(ToolbarState state) noexcept {
    switch (state) {
        case ToolbarState::Hidden: return "Hidden";
        case ToolbarState::ShowingFormatControls: return "ShowingFormatControls";
        case ToolbarState::ShowingLinkInput: return "ShowingLinkInput";
        case ToolbarState::ShowingInsertControls: return "ShowingInsertControls";
        case ToolbarState::ShowingImageURLInput: return "ShowingImageURLInput";
        case ToolbarState::ShowingImageAltInput: return "ShowingImageAltInput";
    }
    return "Unknown";
}

void ToolbarCore::openInput(const Selection& current, std::string initialText) {
    inputOpen = true;
    savedSelection = current;
    inputText = std::move(initialText);
}

void ToolbarCore::closeInput() {
    inputOpen = false;
    inputText.clear();
}

ToolbarCoordinator::ToolbarCoordinator(
    const SectionTree& tree,
    SelectionController& selection,
    EditingEngine& editing,
    HostSurface& host)
    : tree_(tree), selection_(selection), editing_(editing), host_(host) {}

ToolbarState ToolbarCoordinator::state() const {
    if (const auto* edit = std::get_if<EditToolbar>(&variant_)) {
        return edit->core.inputOpen ? ToolbarState::ShowingLinkInput : ToolbarState::ShowingFormatControls;
    }
    if (const auto* insert = std::get_if<InsertToolbar>(&variant_)) {
        switch (insert->step) {
            case InsertToolbar::Step::Controls: return ToolbarState::ShowingInsertControls;
            case InsertToolbar::Step::ImageUrl: return ToolbarState::ShowingImageURLInput;
            case InsertToolbar::Step::ImageAlt: return ToolbarState::ShowingImageAltInput;
        }
    }
    return ToolbarState::Hidden;
}

const FormatState* ToolbarCoordinator::formatControls() const {
    const auto* edit = std::get_if<EditToolbar>(&variant_);
    return edit ? &edit->format : nullptr;
}

ToolbarCore* ToolbarCoordinator::activeCore() {
    if (auto* edit = std::get_if<EditToolbar>(&variant_)) return &edit->core;
    if (auto* insert = std::get_if<InsertToolbar>(&variant_)) return &insert->core;
    return nullptr;
}

bool ToolbarCoordinator::hasPendingInput() const {
    if (const auto* edit = std::get_if<EditToolbar>(&variant_)) return edit->core.inputOpen;
    if (const auto* insert = std::get_if<InsertToolbar>(&variant_)) return insert->core.inputOpen;
    return false;
}

void ToolbarCoordinator::showFormatControls(const Selection& sel) {
    EditToolbar edit;
    edit.format = editing_.formatStateOf(sel);
    variant_ = std::move(edit);
}

// =============================================================================
// Derivation
// =============================================================================

void ToolbarCoordinator::rederive() {
    if (hasPendingInput()) return;
    const Selection sel = host_.querySelection();
    if (!selection_.resolvesToText(sel.anchor) || !selection_.resolvesToText(sel.focus)) {
        variant_ = std::monostate{};
        return;
    }
    if (!sel.isCollapsed()) {
        showFormatControls(sel);
        return;
    }
    if (tree_.contentLength(sel.focus.sectionId) == 0) {
        InsertToolbar insert;
        insert.targetSection = sel.focus.sectionId;
        variant_ = std::move(insert);
        return;
    }
    variant_ = std::monostate{};
}

void ToolbarCoordinator::display() {
    if (hasPendingInput()) return;
    const Selection sel = host_.querySelection();
    if (!selection_.resolvesToText(sel.anchor) || !selection_.resolvesToText(sel.focus)) {
        variant_ = std::monostate{};
        return;
    }
    if (sel.isCollapsed() && tree_.contentLength(sel.focus.sectionId) == 0) {
        rederive();
        return;
    }
    showFormatControls(sel);
}

void ToolbarCoordinator::hide() {
    variant_ = std::monostate{};
}

void ToolbarCoordinator::onSelectionChange(SelectionOwner owner) {
    if (owner == SelectionOwner::Toolbar) return;
    if (ToolbarCore* core = activeCore(); core && core->inputOpen) {
        QUIRE_LOG_DEBUG("toolbar: pending input dropped by selection change");
        core->closeInput();
        variant_ = std::monostate{};
    }
    rederive();
}

void ToolbarCoordinator::onScroll() {
    if (std::holds_alternative<InsertToolbar>(variant_)) hide();
}

void ToolbarCoordinator::notifyMutated() {
    if (onMutated_) onMutated_();
}

// =============================================================================
// Format controls
// =============================================================================

bool ToolbarCoordinator::toggleMarkControl(FormatCommand command) {
    auto* edit = std::get_if<EditToolbar>(&variant_);
    if (!edit || edit->core.inputOpen || edit->format.marksDisabled()) return false;
    const EditorError err = command == FormatCommand::Bold ? editing_.toggleBold() : editing_.toggleItalic();
    rederive();
    notifyMutated();
    return err == EditorError::Ok;
}

bool ToolbarCoordinator::activateBold() {
    return toggleMarkControl(FormatCommand::Bold);
}

bool ToolbarCoordinator::activateItalic() {
    return toggleMarkControl(FormatCommand::Italic);
}

bool ToolbarCoordinator::activateHeading() {
    auto* edit = std::get_if<EditToolbar>(&variant_);
    if (!edit || edit->core.inputOpen) return false;
    const EditorError err = editing_.wrapHeading();
    rederive();
    notifyMutated();
    return err == EditorError::Ok;
}

bool ToolbarCoordinator::activateLink() {
    auto* edit = std::get_if<EditToolbar>(&variant_);
    if (!edit || edit->core.inputOpen || edit->format.marksDisabled()) return false;
    if (edit->format.linkActive) {
        const EditorError err = editing_.removeLink(edit->format.activeLinkId);
        rederive();
        notifyMutated();
        return err == EditorError::Ok;
    }
    edit->core.openInput(host_.querySelection());
    return true;
}

EditorError ToolbarCoordinator::submitLink(std::string_view url) {
    auto* edit = std::get_if<EditToolbar>(&variant_);
    if (!edit || !edit->core.inputOpen) return EditorError::InvalidOperation;
    const EditorError err = editing_.wrapLink(url, edit->core.savedSelection);
    if (err == EditorError::InvalidURL) {
        edit->core.inputText.assign(url.data(), url.size());
        return err;
    }
    edit->core.closeInput();
    variant_ = std::monostate{};
    rederive();
    notifyMutated();
    return err;
}

// =============================================================================
// Insert controls
// =============================================================================

bool ToolbarCoordinator::activateImage() {
    auto* insert = std::get_if<InsertToolbar>(&variant_);
    if (!insert || insert->step != InsertToolbar::Step::Controls) return false;
    insert->core.openInput(host_.querySelection());
    insert->step = InsertToolbar::Step::ImageUrl;
    return true;
}

EditorError ToolbarCoordinator::submitImageUrl(std::string_view url) {
    auto* insert = std::get_if<InsertToolbar>(&variant_);
    if (!insert || insert->step != InsertToolbar::Step::ImageUrl) return EditorError::InvalidOperation;
    const auto normalized = normalizeUrl(url);
    if (!normalized) {
        QUIRE_LOG_DEBUG("toolbar: rejected image url");
        insert->core.inputText.assign(url.data(), url.size());
        return EditorError::InvalidURL;
    }
    insert->imageUrl = *normalized;
    insert->core.inputText.clear();
    insert->step = InsertToolbar::Step::ImageAlt;
    return EditorError::Ok;
}

EditorError ToolbarCoordinator::submitImageAlt(std::string_view alt) {
    auto* insert = std::get_if<InsertToolbar>(&variant_);
    if (!insert || insert->step != InsertToolbar::Step::ImageAlt) return EditorError::InvalidOperation;

    AtomicObject image;
    image.kind = AtomicKind::Image;
    image.src = insert->imageUrl;
    image.alt.assign(alt.data(), alt.size());
    const SectionId target = insert->targetSection;
    const Selection saved = insert->core.savedSelection;
    variant_ = std::monostate{};

    host_.setSelection(saved);
    const EditorError err = editing_.insertContainer(AtomicKind::Image, image, target);
    notifyMutated();
    return err;
}

EditorError ToolbarCoordinator::activateRule() {
    auto* insert = std::get_if<InsertToolbar>(&variant_);
    if (!insert || insert->step != InsertToolbar::Step::Controls) return EditorError::InvalidOperation;
    const SectionId target = insert->targetSection;
    const EditorError err = editing_.insertContainer(AtomicKind::Rule, AtomicObject{}, target);
    hide();
    notifyMutated();
    return err;
}

void ToolbarCoordinator::cancelInput() {
    if (auto* edit = std::get_if<EditToolbar>(&variant_)) {
        if (!edit->core.inputOpen) return;
        const Selection saved = edit->core.savedSelection;
        edit->core.closeInput();
        host_.setSelection(saved);
        showFormatControls(saved);
        return;
    }
    if (auto* insert = std::get_if<InsertToolbar>(&variant_)) {
        if (!insert->core.inputOpen) return;
        host_.setSelection(insert->core.savedSelection);
        if (insert->step == InsertToolbar::Step::ImageAlt) {
            insert->step = InsertToolbar::Step::ImageUrl;
            insert->core.inputText = insert->imageUrl;
        } else {
            insert->core.closeInput();
            insert->step = InsertToolbar::Step::Controls;
        }
    }
}

} // namespace quire

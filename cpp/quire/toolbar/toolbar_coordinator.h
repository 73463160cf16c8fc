#ifndef QUIRE_TOOLBAR_TOOLBAR_COORDINATOR_H
#define QUIRE_TOOLBAR_TOOLBAR_COORDINATOR_H

#include "quire/core/types.h"
#include "quire/editing/format_state.h"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace quire {

class SectionTree;
class SelectionController;
class EditingEngine;
class HostSurface;

enum class ToolbarState : std::uint8_t {
    Hidden = 0,
    ShowingFormatControls = 1,
    ShowingLinkInput = 2,
    ShowingInsertControls = 3,
    ShowingImageURLInput = 4,
    ShowingImageAltInput = 5,
};

const char* toolbarStateName(ToolbarState state) noexcept;

// Where the host reports a selection to live.
enum class SelectionOwner : std::uint8_t {
    Editor = 0,
    Toolbar = 1,
};

// State shared by both toolbar variants: the pending text input and the
// selection that was active when it opened.
struct ToolbarCore {
    bool inputOpen = false;
    Selection savedSelection;
    std::string inputText;

    void openInput(const Selection& current, std::string initialText = std::string());
    void closeInput();
};

struct EditToolbar {
    ToolbarCore core;
    FormatState format;
};

struct InsertToolbar {
    enum class Step : std::uint8_t { Controls, ImageUrl, ImageAlt };

    ToolbarCore core;
    SectionId targetSection = kNoSection;
    Step step = Step::Controls;
    std::string imageUrl;
};

using ToolbarVariant = std::variant<std::monostate, EditToolbar, InsertToolbar>;

/**
 * ToolbarCoordinator: decides which control surface is visible from the
 * live selection and routes control activations to the EditingEngine.
 *
 * Cancelling an input returns to the state that opened it and restores the
 * selection saved at that point. A selection change outside the toolbar
 * drops a pending input; the new selection then drives the state.
 */
class ToolbarCoordinator {
public:
    ToolbarCoordinator(const SectionTree& tree, SelectionController& selection, EditingEngine& editing, HostSurface& host);

    // Called after every control activation that changed the document.
    void setMutationListener(std::function<void()> listener) { onMutated_ = std::move(listener); }

    ToolbarState state() const;
    const ToolbarVariant& variant() const { return variant_; }
    const FormatState* formatControls() const;
    bool hasPendingInput() const;

    void rederive();
    void display();
    void hide();
    void onSelectionChange(SelectionOwner owner);
    void onScroll();

    // ==========================================================================
    // Format controls
    // ==========================================================================

    bool activateBold();
    bool activateItalic();
    bool activateHeading();
    bool activateLink();
    EditorError submitLink(std::string_view url);

    // ==========================================================================
    // Insert controls
    // ==========================================================================

    bool activateImage();
    EditorError submitImageUrl(std::string_view url);
    EditorError submitImageAlt(std::string_view alt);
    EditorError activateRule();

    // Explicit close of the open input.
    void cancelInput();

private:
    ToolbarCore* activeCore();
    void showFormatControls(const Selection& sel);
    bool toggleMarkControl(FormatCommand command);
    void notifyMutated();

    const SectionTree& tree_;
    SelectionController& selection_;
    EditingEngine& editing_;
    HostSurface& host_;
    ToolbarVariant variant_;
    std::function<void()> onMutated_;
};

/**
 * ToolbarHandle: opaque handle returned to embedders.
 */
class ToolbarHandle {
public:
    explicit ToolbarHandle(ToolbarCoordinator* coordinator) : coordinator_(coordinator) {}

    void display() { if (coordinator_) coordinator_->display(); }
    void hide() { if (coordinator_) coordinator_->hide(); }
    ToolbarState state() const { return coordinator_ ? coordinator_->state() : ToolbarState::Hidden; }

private:
    ToolbarCoordinator* coordinator_;
};

} // namespace quire

#endif // QUIRE_TOOLBAR_TOOLBAR_COORDINATOR_H

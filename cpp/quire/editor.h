#ifndef QUIRE_EDITOR_H
#define QUIRE_EDITOR_H

#include "quire/core/types.h"
#include "quire/core/editor_options.h"
#include "quire/document/section_tree.h"
#include "quire/selection/selection_controller.h"
#include "quire/editing/editing_engine.h"
#include "quire/toolbar/toolbar_coordinator.h"
#include "quire/host/host_surface.h"
#include "quire/host/key_event.h"
#include "quire/host/selection_event_hub.h"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace quire {

/**
 * EditorInstance: one editor bound to one host surface.
 *
 * Owns the document, the selection controller, the editing engine and the
 * toolbar coordinator. Host events enter through the on* handlers, which run
 * synchronously and leave the document and selection valid.
 *
 * The key handlers are the two hooks around the host's native edit:
 * onKeyDown runs before the host applies its default action (and decides
 * whether it must be suppressed); onKeyUp runs after it and repairs.
 */
class EditorInstance {
public:
    EditorInstance(HostSurface& host, SelectionEventHub& hub, const EditorOptions& options);
    ~EditorInstance();

    EditorInstance(const EditorInstance&) = delete;
    EditorInstance& operator=(const EditorInstance&) = delete;

    // ==========================================================================
    // Host events
    // ==========================================================================

    // Pre-mutation hook. Returns true when the host must skip its default action.
    bool onKeyDown(const KeyEvent& event);
    // Post-mutation hook.
    void onKeyUp(const KeyEvent& event);
    void onClick();
    void onMouseUp();
    // Pastes the plain-text flavour; the host default is always suppressed.
    bool onPaste(std::string_view plainText);
    void onSelectionChange(const SelectionChangeEvent& event);
    void onScroll();
    void onImageLoadFailed(SectionId sectionId);

    // ==========================================================================
    // Editing
    // ==========================================================================

    EditorError toggleBold();
    EditorError toggleItalic();
    EditorError wrapHeading();
    EditorError wrapLink(std::string_view url, const Selection& range);
    EditorError removeLink(LinkId linkId);
    EditorError insertContainer(AtomicKind kind, const AtomicObject& payload, SectionId beforeSectionId);
    EditorError splitAtCursor();

    // ==========================================================================
    // Serialization
    // ==========================================================================

    std::string serialize(bool editable = false) const;
    // Atomic: on failure the current document is left untouched.
    bool deserialize(std::string_view snapshot);

    // ==========================================================================
    // Accessors
    // ==========================================================================

    ToolbarHandle getToolbarHandle() { return ToolbarHandle(&toolbar_); }
    ToolbarCoordinator& toolbar() { return toolbar_; }
    const ToolbarCoordinator& toolbar() const { return toolbar_; }
    const SectionTree& document() const { return tree_; }
    SelectionController& selection() { return selection_; }
    const EditorOptions& options() const { return options_; }
    HostSurface& host() { return host_; }

    bool placeholderVisible() const { return placeholderVisible_; }
    std::uint64_t documentDigest() const { return tree_.documentDigest(); }

private:
    void afterEvent();

    HostSurface& host_;
    SelectionEventHub& hub_;
    EditorOptions options_;
    SectionTree tree_;
    SelectionController selection_;
    EditingEngine editing_;
    ToolbarCoordinator toolbar_;
    std::uint32_t subscription_ = 0;
    bool placeholderVisible_ = false;
};

using EditorHandle = std::unique_ptr<EditorInstance>;

// Create an editor on `host` and subscribe it to `hub`.
EditorHandle init(HostSurface& host, SelectionEventHub& hub, const EditorOptions& options = EditorOptions());

} // namespace quire

#endif // QUIRE_EDITOR_H

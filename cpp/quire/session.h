#ifndef QUIRE_SESSION_H
#define QUIRE_SESSION_H

#include "quire/editor.h"
#include "quire/host/reference_surface.h"
#include "quire/host/selection_event_hub.h"
#include <cstdint>
#include <string>

namespace quire {

/**
 * EditorSession: a self-contained editor for embedders that cannot supply a
 * HostSurface of their own (the wasm module). Owns a ReferenceSurface and a
 * selection hub, and takes host input as QEVT event buffers.
 */
class EditorSession {
public:
    EditorSession();
    explicit EditorSession(const EditorOptions& options);
    ~EditorSession();

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    // Replays the buffer at `ptr`; the result is also kept as lastError().
    EditorError applyEventBuffer(std::uintptr_t ptr, std::uint32_t byteCount);
    EditorError lastError() const { return lastError_; }
    void clearError() { lastError_ = EditorError::Ok; }

    std::string serialize(bool editable) const { return editor_->serialize(editable); }
    bool deserialize(const std::string& snapshot);

    void displayToolbar() { editor_->getToolbarHandle().display(); }
    void hideToolbar() { editor_->getToolbarHandle().hide(); }
    ToolbarState toolbarState() const { return editor_->toolbar().state(); }

    // Toolbar controls. Each returns false or an error when the control is
    // not available in the current toolbar state.
    bool activateBold() { return editor_->toolbar().activateBold(); }
    bool activateItalic() { return editor_->toolbar().activateItalic(); }
    bool activateHeading() { return editor_->toolbar().activateHeading(); }
    bool activateLink() { return editor_->toolbar().activateLink(); }
    EditorError submitLink(const std::string& url);
    bool activateImage() { return editor_->toolbar().activateImage(); }
    EditorError submitImageUrl(const std::string& url);
    EditorError submitImageAlt(const std::string& alt);
    EditorError activateRule();
    void cancelInput() { editor_->toolbar().cancelInput(); }

    std::uint32_t sectionCount() const { return static_cast<std::uint32_t>(editor_->document().sectionCount()); }
    std::uint32_t revision() const { return editor_->document().revision(); }
    // Live selection with offsets in UTF-16 code units.
    Selection selection() const;
    bool placeholderVisible() const { return editor_->placeholderVisible(); }

    EditorInstance& editor() { return *editor_; }
    ReferenceSurface& surface() { return surface_; }

private:
    // Keeps a failure as lastError() and passes `err` through.
    EditorError record(EditorError err);

    ReferenceSurface surface_;
    SelectionEventHub hub_;
    EditorHandle editor_;
    EditorError lastError_ = EditorError::Ok;
};

} // namespace quire

#endif // QUIRE_SESSION_H

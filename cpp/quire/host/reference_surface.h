#ifndef QUIRE_HOST_REFERENCE_SURFACE_H
#define QUIRE_HOST_REFERENCE_SURFACE_H

#include "quire/host/host_surface.h"
#include "quire/host/key_event.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace quire {

/**
 * ReferenceSurface: in-process host surface with contenteditable-like
 * native behaviour. Native edits know nothing about the editor's
 * invariants: Backspace next to a container moves the caret into it, and
 * placeCaret accepts any section.
 */
class ReferenceSurface final : public HostSurface {
public:
    explicit ReferenceSurface(std::uint32_t surfaceId = 1);

    std::uint32_t surfaceId() const override { return surfaceId_; }
    void attachDocument(SectionTree* tree) override { tree_ = tree; }
    bool execFormatCommand(FormatCommand command, const Selection& range) override;
    bool formatBlock(SectionId sectionId, HeadingLevel level) override;
    Selection querySelection() const override { return selection_; }
    void setSelection(const Selection& selection) override { selection_ = selection; }
    void documentChanged(ChangeMask changes) override;
    void placeholderChanged(bool visible, std::string_view text) override;

    // ==========================================================================
    // Native behaviour
    // ==========================================================================

    // Default action for a key the editor did not suppress.
    void applyNativeKey(const KeyEvent& event);

    void typeText(std::string_view text);
    void deleteBackward();
    void deleteForward();
    void deleteSelection();
    void moveCaret(NavigationKey key);

    void placeCaret(SectionId sectionId, std::uint32_t offset);
    void select(Cursor anchor, Cursor focus);

    // ==========================================================================
    // Observations
    // ==========================================================================

    bool isAttached() const { return tree_ != nullptr; }
    std::uint32_t documentChangeCount() const { return documentChangeCount_; }
    ChangeMask lastChanges() const { return lastChanges_; }
    bool placeholderVisible() const { return placeholderVisible_; }
    const std::string& placeholderText() const { return placeholderText_; }

private:
    std::uint32_t surfaceId_;
    SectionTree* tree_ = nullptr;
    Selection selection_;
    std::uint32_t documentChangeCount_ = 0;
    ChangeMask lastChanges_ = ChangeMask::None;
    bool placeholderVisible_ = false;
    std::string placeholderText_;
};

} // namespace quire

#endif // QUIRE_HOST_REFERENCE_SURFACE_H

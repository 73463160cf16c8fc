#ifndef QUIRE_EDITING_EDITING_ENGINE_H
#define QUIRE_EDITING_EDITING_ENGINE_H

#include "quire/core/types.h"
#include "quire/editing/format_state.h"
#include <string_view>

namespace quire {

class SectionTree;
class SelectionController;
class HostSurface;

/**
 * EditingEngine: formatting and structural edits on the live selection.
 *
 * Every operation leaves the document invariants intact. Stale ids yield
 * SectionNotFound and change nothing.
 */
class EditingEngine {
public:
    EditingEngine(SectionTree& tree, SelectionController& selection, HostSurface& host);

    // ==========================================================================
    // Marks
    // ==========================================================================

    EditorError toggleBold();
    EditorError toggleItalic();

    /**
     * Cycle the current section's heading: none -> large on the first
     * section, none -> small elsewhere, large/small -> none. Entering a
     * heading strips every mark.
     */
    EditorError wrapHeading();

    /**
     * Validate `url` and apply a Link mark over `range`, then collapse the
     * cursor to the range end.
     * @return InvalidURL without touching the document when validation fails
     */
    EditorError wrapLink(std::string_view url, const Selection& range);

    // Replace a link with plain text and collapse the cursor to its end.
    EditorError removeLink(LinkId linkId);

    // ==========================================================================
    // Structure
    // ==========================================================================

    /**
     * Insert an Image or Rule container before `beforeSectionId`.
     * Rules are refused before the first section. Images get an empty
     * TextSection on both sides, synthesized where missing.
     */
    EditorError insertContainer(AtomicKind kind, const AtomicObject& payload, SectionId beforeSectionId);

    // Split the current TextSection at the caret; the caret moves to the new tail.
    EditorError splitAtCursor();

    /**
     * Remove a container adjacent to a collapsed caret sitting on the
     * matching TextSection boundary.
     * @return True when a container was removed and the host default must be suppressed
     */
    bool deleteAdjacentContainer(Direction direction);

    EditorError removeContainer(SectionId sectionId);

    // Insert plain text at the caret; line breaks split the section.
    EditorError pastePlainText(std::string_view text);

    FormatState formatStateOf(const Selection& range) const;

private:
    EditorError toggleMark(FormatCommand command);

    SectionTree& tree_;
    SelectionController& selection_;
    HostSurface& host_;
};

} // namespace quire

#endif // QUIRE_EDITING_EDITING_ENGINE_H

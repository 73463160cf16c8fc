#ifndef QUIRE_SELECTION_SELECTION_CONTROLLER_H
#define QUIRE_SELECTION_SELECTION_CONTROLLER_H

#include "quire/core/types.h"
#include <cstdint>
#include <optional>

namespace quire {

class SectionTree;
class HostSurface;

enum class CursorState : std::uint8_t {
    PositionedInText = 0,
    PositionedInContainer = 1,
};

enum class NavigationKey : std::uint8_t {
    ArrowUp = 0,
    ArrowDown = 1,
    ArrowLeft = 2,
    ArrowRight = 3,
    Other = 4,
};

struct PositionSnapshot {
    SectionId sectionId = kNoSection;
    std::uint32_t offset = 0;
    SectionId previousSiblingId = kNoSection;
    bool valid = false;
};

enum class RepairOutcome : std::uint8_t {
    Unchanged = 0,
    Clamped = 1,
    LastGoodPosition = 2,
    AdjacentSection = 3,
    SynthesizedSection = 4,
};

/**
 * Tracks the host-reported selection against the section tree and relocates
 * it into a TextSection whenever native editing leaves it somewhere invalid.
 *
 * Repair order when an endpoint does not resolve into a TextSection:
 *  1. the last recorded good position, if its section is still a TextSection;
 *  2. the section right after the recorded previous sibling (or, without a
 *     snapshot, right after the container the caret landed in), if it is a
 *     TextSection;
 *  3. a new empty TextSection synthesized in that slot.
 */
class SelectionController {
public:
    SelectionController(SectionTree& tree, HostSurface& host);

    CursorState state() const;
    bool resolvesToText(const Cursor& cursor) const;

    // Section holding the focus endpoint when it resolves into text.
    std::optional<SectionId> currentSection() const;

    void recordLastGoodPosition();
    RepairOutcome repairPosition();
    bool preventEditInContainer(NavigationKey key);

    void collapseTo(const Cursor& cursor);
    const PositionSnapshot& lastGoodPosition() const { return lastGood_; }
    void reset();

private:
    Cursor chooseRepairTarget(const Selection& current, RepairOutcome& outcome);
    Cursor clampCursor(const Cursor& cursor) const;

    SectionTree& tree_;
    HostSurface& host_;
    PositionSnapshot lastGood_;
};

} // namespace quire

#endif // QUIRE_SELECTION_SELECTION_CONTROLLER_H

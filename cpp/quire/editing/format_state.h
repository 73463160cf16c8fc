#ifndef QUIRE_EDITING_FORMAT_STATE_H
#define QUIRE_EDITING_FORMAT_STATE_H

#include "quire/core/types.h"
#include <cstdint>

namespace quire {

enum class MarkTriState : std::uint8_t { Off = 0, On = 1, Mixed = 2 };

// Formatting summary of a selection, consumed by the format controls.
struct FormatState {
    MarkTriState bold = MarkTriState::Off;
    MarkTriState italic = MarkTriState::Off;
    bool linkActive = false;
    LinkId activeLinkId = kNoLink;
    HeadingLevel heading = HeadingLevel::None;

    // Bold/italic/link controls are disabled inside headings.
    bool marksDisabled() const { return heading != HeadingLevel::None; }
};

} // namespace quire

#endif // QUIRE_EDITING_FORMAT_STATE_H

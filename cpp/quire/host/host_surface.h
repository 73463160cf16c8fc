#ifndef QUIRE_HOST_HOST_SURFACE_H
#define QUIRE_HOST_HOST_SURFACE_H

#include "quire/core/types.h"
#include <cstdint>
#include <string_view>

namespace quire {

class SectionTree;

/**
 * HostSurface: boundary to the text surface that renders a document and
 * performs native editing (typing, deletion, caret placement).
 *
 * The editor shares its SectionTree with the surface through attachDocument();
 * block insertion and removal happen on that tree. Mark toggling and block
 * tag changes are requested through the format primitives below.
 */
class HostSurface {
public:
    virtual ~HostSurface() = default;

    // Identity used to filter shared selection-change notifications.
    virtual std::uint32_t surfaceId() const = 0;

    // Called with the editor's document on init and with nullptr on teardown.
    virtual void attachDocument(SectionTree* tree) = 0;

    // Toggle Bold/Italic over `range`. Returns false when nothing was covered.
    virtual bool execFormatCommand(FormatCommand command, const Selection& range) = 0;

    // Change the block tag of a TextSection.
    virtual bool formatBlock(SectionId sectionId, HeadingLevel level) = 0;

    // Live selection as the surface currently reports it; may be unresolved.
    virtual Selection querySelection() const = 0;
    virtual void setSelection(const Selection& selection) = 0;

    virtual void documentChanged(ChangeMask changes) { (void)changes; }
    virtual void placeholderChanged(bool visible, std::string_view text) {
        (void)visible;
        (void)text;
    }
};

} // namespace quire

#endif // QUIRE_HOST_HOST_SURFACE_H

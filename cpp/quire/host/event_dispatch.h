#ifndef QUIRE_HOST_EVENT_DISPATCH_H
#define QUIRE_HOST_EVENT_DISPATCH_H

#include "quire/host/event_buffer.h"
#include <cstdint>

namespace quire {

class EditorInstance;
class ReferenceSurface;

// Apply one host event to `editor`. Key-down events that the editor does not
// suppress get the surface's native default between the two key hooks.
EditorError dispatchHostEvent(EditorInstance& editor, ReferenceSurface& surface, const HostEventRecord& record);

EditorError replayEventBuffer(
    EditorInstance& editor,
    ReferenceSurface& surface,
    const std::uint8_t* src,
    std::uint32_t byteCount);

} // namespace quire

#endif // QUIRE_HOST_EVENT_DISPATCH_H

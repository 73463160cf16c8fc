#ifndef QUIRE_HOST_EVENT_BUFFER_H
#define QUIRE_HOST_EVENT_BUFFER_H

#include "quire/core/types.h"
#include <cstdint>
#include <cstddef>

namespace quire {

// Batched host input, little-endian:
//   header:    magic "QEVT", version, eventCount, reserved   (4 x u32)
//   per event: type, key, arg, payloadByteCount             (4 x u32) + payload
constexpr std::uint32_t kEventBufferMagic = 0x54564551; // "QEVT"
constexpr std::uint32_t kEventBufferVersion = 1;
constexpr std::size_t kEventBufferHeaderBytes = 16;
constexpr std::size_t kPerEventHeaderBytes = 16;

enum class HostEventType : std::uint32_t {
    KeyDown = 1,         // key = Key, arg = KeyModifier bits, payload = UTF-8 text
    KeyUp = 2,           // same layout as KeyDown
    Click = 3,           // payload = empty | (sectionId, offset); offsets are UTF-16 code units
    MouseUp = 4,         // payload = empty | (anchorId, anchorOffset, focusId, focusOffset)
    Paste = 5,           // payload = UTF-8 plain text
    SelectionChange = 6, // arg = SelectionOwner, payload as MouseUp
    Scroll = 7,
    ImageLoadFailed = 8, // arg = sectionId
};

struct HostEventRecord {
    HostEventType type;
    std::uint32_t key;
    std::uint32_t arg;
    const std::uint8_t* payload;
    std::uint32_t payloadByteCount;
};

using HostEventCallback = EditorError(*)(void* ctx, const HostEventRecord& record);

// Validate the framing of the whole buffer, then invoke `cb` for each event in
// order. A framing error dispatches nothing; the first callback error stops
// the walk and is returned.
EditorError parseEventBuffer(const std::uint8_t* src, std::uint32_t byteCount, HostEventCallback cb, void* ctx);

} // namespace quire

#endif // QUIRE_HOST_EVENT_BUFFER_H

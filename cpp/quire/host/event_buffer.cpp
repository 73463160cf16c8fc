#include "quire/host/event_buffer.h"
#include "quire/core/util.h"
#include "quire/core/logging.h"

namespace quire {

namespace {

EditorError walkEvents(const std::uint8_t* src, std::uint32_t byteCount, HostEventCallback cb, void* ctx) {
    const std::uint32_t eventCount = readU32(src, 8);
    std::size_t o = kEventBufferHeaderBytes;
    for (std::uint32_t i = 0; i < eventCount; i++) {
        if (o + kPerEventHeaderBytes > byteCount) return EditorError::BufferTruncated;
        HostEventRecord record{};
        record.type = static_cast<HostEventType>(readU32(src, o)); o += 4;
        record.key = readU32(src, o); o += 4;
        record.arg = readU32(src, o); o += 4;
        record.payloadByteCount = readU32(src, o); o += 4;
        if (record.payloadByteCount > byteCount - o) return EditorError::BufferTruncated;
        record.payload = src + o;
        o += record.payloadByteCount;

        if (cb) {
            const EditorError err = cb(ctx, record);
            if (err != EditorError::Ok) return err;
        }
    }
    return EditorError::Ok;
}

} // namespace

EditorError parseEventBuffer(const std::uint8_t* src, std::uint32_t byteCount, HostEventCallback cb, void* ctx) {
    if (!src || byteCount < kEventBufferHeaderBytes) {
        return EditorError::BufferTruncated;
    }
    if (readU32(src, 0) != kEventBufferMagic) {
        return EditorError::InvalidMagic;
    }
    if (readU32(src, 4) != kEventBufferVersion) {
        return EditorError::UnsupportedVersion;
    }

    const EditorError framing = walkEvents(src, byteCount, nullptr, nullptr);
    if (framing != EditorError::Ok) {
        QUIRE_LOG_WARN("event buffer rejected: %s", editorErrorName(framing));
        return framing;
    }
    return walkEvents(src, byteCount, cb, ctx);
}

} // namespace quire

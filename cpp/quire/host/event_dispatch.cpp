#include "quire/host/event_dispatch.h"
#include "quire/host/reference_surface.h"
#include "quire/editor.h"
#include "quire/core/util.h"
#include "quire/core/string_utils.h"
#include "quire/core/logging.h"
#include <string>

namespace quire {

namespace {

struct ReplayContext {
    EditorInstance* editor;
    ReferenceSurface* surface;
};

EditorError readKeyEvent(const HostEventRecord& record, KeyEvent& out) {
    if (record.key > static_cast<std::uint32_t>(Key::Other)) return EditorError::UnknownEvent;
    out.key = static_cast<Key>(record.key);
    out.modifiers = record.arg;
    out.text.assign(reinterpret_cast<const char*>(record.payload), record.payloadByteCount);
    return EditorError::Ok;
}

// Buffer offsets count UTF-16 code units; the document counts UTF-8 bytes.
Cursor readCursor(const SectionTree& tree, const std::uint8_t* src, std::size_t offset) {
    const SectionId id = readU32(src, offset);
    const std::uint32_t units = readU32(src, offset + 4);
    if (!tree.isText(id)) return Cursor{id, units};
    return Cursor{id, logicalToByteIndex(tree.getContent(id), units)};
}

bool readSelection(const SectionTree& tree, const HostEventRecord& record, Selection& out) {
    if (record.payloadByteCount != 16) return false;
    out.anchor = readCursor(tree, record.payload, 0);
    out.focus = readCursor(tree, record.payload, 8);
    return true;
}

EditorError replayCallback(void* ctx, const HostEventRecord& record) {
    auto* replay = static_cast<ReplayContext*>(ctx);
    return dispatchHostEvent(*replay->editor, *replay->surface, record);
}

} // namespace

EditorError dispatchHostEvent(EditorInstance& editor, ReferenceSurface& surface, const HostEventRecord& record) {
    switch (record.type) {
        case HostEventType::KeyDown: {
            KeyEvent event;
            const EditorError err = readKeyEvent(record, event);
            if (err != EditorError::Ok) return err;
            if (!editor.onKeyDown(event)) surface.applyNativeKey(event);
            break;
        }
        case HostEventType::KeyUp: {
            KeyEvent event;
            const EditorError err = readKeyEvent(record, event);
            if (err != EditorError::Ok) return err;
            editor.onKeyUp(event);
            break;
        }
        case HostEventType::Click: {
            if (record.payloadByteCount == 8) {
                const Cursor at = readCursor(editor.document(), record.payload, 0);
                surface.placeCaret(at.sectionId, at.offset);
            } else if (record.payloadByteCount != 0) {
                return EditorError::InvalidPayloadSize;
            }
            editor.onClick();
            break;
        }
        case HostEventType::MouseUp:
        case HostEventType::SelectionChange: {
            Selection sel;
            if (readSelection(editor.document(), record, sel)) {
                surface.select(sel.anchor, sel.focus);
            } else if (record.payloadByteCount != 0) {
                return EditorError::InvalidPayloadSize;
            }
            if (record.type == HostEventType::MouseUp) {
                editor.onMouseUp();
            } else {
                if (record.arg > static_cast<std::uint32_t>(SelectionOwner::Toolbar)) return EditorError::UnknownEvent;
                editor.onSelectionChange(SelectionChangeEvent{surface.surfaceId(), static_cast<SelectionOwner>(record.arg)});
            }
            break;
        }
        case HostEventType::Paste:
            editor.onPaste(std::string(reinterpret_cast<const char*>(record.payload), record.payloadByteCount));
            break;
        case HostEventType::Scroll:
            editor.onScroll();
            break;
        case HostEventType::ImageLoadFailed:
            editor.onImageLoadFailed(record.arg);
            break;
        default:
            QUIRE_LOG_WARN("unknown host event type %u", static_cast<unsigned>(record.type));
            return EditorError::UnknownEvent;
    }
    return EditorError::Ok;
}

EditorError replayEventBuffer(
    EditorInstance& editor,
    ReferenceSurface& surface,
    const std::uint8_t* src,
    std::uint32_t byteCount) {
    ReplayContext ctx{&editor, &surface};
    return parseEventBuffer(src, byteCount, &replayCallback, &ctx);
}

} // namespace quire

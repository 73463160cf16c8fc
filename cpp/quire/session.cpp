#include "quire/session.h"
#include "quire/host/event_dispatch.h"
#include "quire/core/logging.h"
#include "quire/core/string_utils.h"
#include <cstdlib>

namespace quire {

EditorSession::EditorSession() : EditorSession(EditorOptions()) {}

EditorSession::EditorSession(const EditorOptions& options)
    : surface_(1), editor_(init(surface_, hub_, options)) {}

EditorSession::~EditorSession() {
    editor_.reset();
}

std::uintptr_t EditorSession::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void EditorSession::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

EditorError EditorSession::applyEventBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
    const std::uint8_t* src = reinterpret_cast<const std::uint8_t*>(ptr);
    lastError_ = replayEventBuffer(*editor_, surface_, src, byteCount);
    if (lastError_ != EditorError::Ok) {
        QUIRE_LOG_WARN("event buffer failed: %s", editorErrorName(lastError_));
    }
    return lastError_;
}

EditorError EditorSession::record(EditorError err) {
    if (err != EditorError::Ok) lastError_ = err;
    return err;
}

EditorError EditorSession::submitLink(const std::string& url) {
    return record(editor_->toolbar().submitLink(url));
}

EditorError EditorSession::submitImageUrl(const std::string& url) {
    return record(editor_->toolbar().submitImageUrl(url));
}

EditorError EditorSession::submitImageAlt(const std::string& alt) {
    return record(editor_->toolbar().submitImageAlt(alt));
}

EditorError EditorSession::activateRule() {
    return record(editor_->toolbar().activateRule());
}

Selection EditorSession::selection() const {
    const SectionTree& tree = editor_->document();
    auto toUnits = [&tree](Cursor c) {
        if (tree.isText(c.sectionId)) c.offset = byteToLogicalIndex(tree.getContent(c.sectionId), c.offset);
        return c;
    };
    const Selection sel = surface_.querySelection();
    return Selection{toUnits(sel.anchor), toUnits(sel.focus)};
}

bool EditorSession::deserialize(const std::string& snapshot) {
    if (!editor_->deserialize(snapshot)) {
        lastError_ = EditorError::InvalidSnapshot;
        return false;
    }
    return true;
}

} // namespace quire

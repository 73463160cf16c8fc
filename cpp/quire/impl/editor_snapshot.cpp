// editor_snapshot.cpp - serialize()/deserialize() for EditorInstance.

#include "quire/editor.h"
#include "quire/persistence/snapshot.h"
#include "quire/core/logging.h"

namespace quire {

std::string EditorInstance::serialize(bool editable) const {
    return buildSnapshotMarkup(captureSnapshot(tree_, editable), options_);
}

bool EditorInstance::deserialize(std::string_view snapshot) {
    SnapshotData data;
    const EditorError err = parseSnapshot(snapshot, data);
    if (err != EditorError::Ok) {
        QUIRE_LOG_WARN("deserialize rejected: %s", editorErrorName(err));
        return false;
    }

    loadSnapshot(data, tree_);
    selection_.reset();
    toolbar_.hide();
    host_.setSelection(Selection::collapsedAt(tree_.firstSection(), 0));
    afterEvent();
    return true;
}

} // namespace quire

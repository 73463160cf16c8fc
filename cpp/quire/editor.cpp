#include "quire/editor.h"
#include "quire/core/logging.h"

namespace quire {

EditorInstance::EditorInstance(HostSurface& host, SelectionEventHub& hub, const EditorOptions& options)
    : host_(host),
      hub_(hub),
      options_(options),
      tree_(),
      selection_(tree_, host_),
      editing_(tree_, selection_, host_),
      toolbar_(tree_, selection_, editing_, host_) {
    tree_.setOptions(&options_);
    const SectionId first = tree_.createDocument();
    host_.attachDocument(&tree_);
    host_.setSelection(Selection::collapsedAt(first, 0));
    toolbar_.setMutationListener([this]() { afterEvent(); });
    subscription_ = hub_.subscribe([this](const SelectionChangeEvent& event) { onSelectionChange(event); });
    QUIRE_LOG_DEBUG("editor attached to surface %u", host_.surfaceId());
    afterEvent();
}

EditorInstance::~EditorInstance() {
    hub_.unsubscribe(subscription_);
    host_.attachDocument(nullptr);
    QUIRE_LOG_DEBUG("editor detached from surface %u", host_.surfaceId());
}

EditorHandle init(HostSurface& host, SelectionEventHub& hub, const EditorOptions& options) {
    return std::make_unique<EditorInstance>(host, hub, options);
}

void EditorInstance::afterEvent() {
    const ChangeMask changes = tree_.consumeChanges();
    if (changes != ChangeMask::None) {
        host_.documentChanged(changes);
    }
    const bool blank = tree_.isBlank();
    if (blank != placeholderVisible_) {
        placeholderVisible_ = blank;
        host_.placeholderChanged(blank, options_.emptyPlaceholderText);
    }
}

// =============================================================================
// Editing
// =============================================================================

EditorError EditorInstance::toggleBold() {
    const EditorError err = editing_.toggleBold();
    toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::toggleItalic() {
    const EditorError err = editing_.toggleItalic();
    toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::wrapHeading() {
    const EditorError err = editing_.wrapHeading();
    toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::wrapLink(std::string_view url, const Selection& range) {
    const EditorError err = editing_.wrapLink(url, range);
    if (err != EditorError::InvalidURL) toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::removeLink(LinkId linkId) {
    const EditorError err = editing_.removeLink(linkId);
    toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::insertContainer(AtomicKind kind, const AtomicObject& payload, SectionId beforeSectionId) {
    const EditorError err = editing_.insertContainer(kind, payload, beforeSectionId);
    toolbar_.rederive();
    afterEvent();
    return err;
}

EditorError EditorInstance::splitAtCursor() {
    const EditorError err = editing_.splitAtCursor();
    toolbar_.rederive();
    afterEvent();
    return err;
}

} // namespace quire

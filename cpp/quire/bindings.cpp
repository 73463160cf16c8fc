#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the session API header for bindings.
#include "quire/session.h"

#ifdef EMSCRIPTEN
using quire::EditorSession;

EMSCRIPTEN_BINDINGS(quire_editor_module) {
    emscripten::enum_<quire::ToolbarState>("ToolbarState")
        .value("Hidden", quire::ToolbarState::Hidden)
        .value("ShowingFormatControls", quire::ToolbarState::ShowingFormatControls)
        .value("ShowingLinkInput", quire::ToolbarState::ShowingLinkInput)
        .value("ShowingInsertControls", quire::ToolbarState::ShowingInsertControls)
        .value("ShowingImageURLInput", quire::ToolbarState::ShowingImageURLInput)
        .value("ShowingImageAltInput", quire::ToolbarState::ShowingImageAltInput);

    emscripten::enum_<quire::EditorError>("EditorError")
        .value("Ok", quire::EditorError::Ok)
        .value("SectionNotFound", quire::EditorError::SectionNotFound)
        .value("StructuralViolation", quire::EditorError::StructuralViolation)
        .value("InvalidURL", quire::EditorError::InvalidURL)
        .value("InvalidSnapshot", quire::EditorError::InvalidSnapshot)
        .value("InvalidMagic", quire::EditorError::InvalidMagic)
        .value("UnsupportedVersion", quire::EditorError::UnsupportedVersion)
        .value("BufferTruncated", quire::EditorError::BufferTruncated)
        .value("InvalidPayloadSize", quire::EditorError::InvalidPayloadSize)
        .value("UnknownEvent", quire::EditorError::UnknownEvent)
        .value("InvalidOperation", quire::EditorError::InvalidOperation);

    emscripten::class_<EditorSession>("EditorSession")
        .constructor<>()
        .function("allocBytes", &EditorSession::allocBytes)
        .function("freeBytes", &EditorSession::freeBytes)
        .function("applyEventBuffer", &EditorSession::applyEventBuffer)
        .function("getLastError", &EditorSession::lastError)
        .function("clearError", &EditorSession::clearError)
        .function("serialize", &EditorSession::serialize)
        .function("deserialize", &EditorSession::deserialize)
        .function("displayToolbar", &EditorSession::displayToolbar)
        .function("hideToolbar", &EditorSession::hideToolbar)
        .function("getToolbarState", &EditorSession::toolbarState)
        .function("activateBold", &EditorSession::activateBold)
        .function("activateItalic", &EditorSession::activateItalic)
        .function("activateHeading", &EditorSession::activateHeading)
        .function("activateLink", &EditorSession::activateLink)
        .function("submitLink", &EditorSession::submitLink)
        .function("activateImage", &EditorSession::activateImage)
        .function("submitImageUrl", &EditorSession::submitImageUrl)
        .function("submitImageAlt", &EditorSession::submitImageAlt)
        .function("activateRule", &EditorSession::activateRule)
        .function("cancelInput", &EditorSession::cancelInput)
        .function("getSectionCount", &EditorSession::sectionCount)
        .function("getRevision", &EditorSession::revision)
        .function("isPlaceholderVisible", &EditorSession::placeholderVisible)
        .function("getSelection", &EditorSession::selection);

    emscripten::value_object<quire::Cursor>("Cursor")
        .field("sectionId", &quire::Cursor::sectionId)
        .field("offset", &quire::Cursor::offset);

    emscripten::value_object<quire::Selection>("Selection")
        .field("anchor", &quire::Selection::anchor)
        .field("focus", &quire::Selection::focus);
}
#endif

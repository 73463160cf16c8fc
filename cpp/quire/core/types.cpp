#include "quire/core/types.h"
#include "quire/core/editor_options.h"

namespace quire {

const char* editorErrorName(EditorError err) noexcept {
    switch (err) {
        case EditorError::Ok: return "Ok";
        case EditorError::SectionNotFound: return "SectionNotFound";
        case EditorError::StructuralViolation: return "StructuralViolation";
        case EditorError::InvalidURL: return "InvalidURL";
        case EditorError::InvalidSnapshot: return "InvalidSnapshot";
        case EditorError::InvalidMagic: return "InvalidMagic";
        case EditorError::UnsupportedVersion: return "UnsupportedVersion";
        case EditorError::BufferTruncated: return "BufferTruncated";
        case EditorError::InvalidPayloadSize: return "InvalidPayloadSize";
        case EditorError::UnknownEvent: return "UnknownEvent";
        case EditorError::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

const std::string& sectionClassNamesFor(const EditorOptions& options, HeadingLevel level) {
    switch (level) {
        case HeadingLevel::Large: return options.largeHeadingClassNames;
        case HeadingLevel::Small: return options.smallHeadingClassNames;
        case HeadingLevel::None: break;
    }
    return options.sectionClassNames;
}

const std::string& sectionStyleFor(const EditorOptions& options, HeadingLevel level) {
    switch (level) {
        case HeadingLevel::Large: return options.largeHeadingStyle;
        case HeadingLevel::Small: return options.smallHeadingStyle;
        case HeadingLevel::None: break;
    }
    return options.sectionStyle;
}

} // namespace quire

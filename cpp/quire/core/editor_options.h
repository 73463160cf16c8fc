#ifndef QUIRE_CORE_EDITOR_OPTIONS_H
#define QUIRE_CORE_EDITOR_OPTIONS_H

#include "quire/core/types.h"
#include <cstdint>
#include <string>

namespace quire {

enum class BlockTag : std::uint8_t {
    Paragraph = 0,
    Div = 1,
};

// Root element class names used as the snapshot fingerprint and for section roles.
constexpr const char* kEditorRootClass = "quire__editor";
constexpr const char* kTextSectionClass = "quire__text-section";
constexpr const char* kContainerSectionClass = "quire__container-section";

/**
 * Presentation options for one editor instance.
 *
 * Class lists are space separated. Styles are inline CSS declarations
 * ("font-size: 1.25rem; margin-left: auto"). containerClassNames and
 * containerStyle decorate the editor root element.
 */
struct EditorOptions {
    BlockTag blockTag = BlockTag::Paragraph;

    std::string sectionClassNames;
    std::string sectionStyle = "font-size: 1.25rem; max-width: 35rem; margin-left: auto; margin-right: auto";

    std::string containerClassNames;
    std::string containerStyle =
        "min-height: 2em; max-width: 100%; margin: 1em auto; padding: 0em 1.5rem; "
        "font-size: 1.25rem; outline: none; color: #333";

    std::string largeHeadingClassNames;
    std::string largeHeadingStyle = "font-size: 2rem; max-width: 35rem; margin-left: auto; margin-right: auto";
    std::string smallHeadingClassNames;
    std::string smallHeadingStyle = "font-size: 1.5rem; max-width: 35rem; margin-left: auto; margin-right: auto";

    std::string imageClassNames;
    std::string imageStyle = "font-size: 1.25rem; max-width: 100%; margin-left: auto; margin-right: auto";

    std::string emptyPlaceholderText = "Try writing here...";
};

// Class list / inline style applied to a text section in the given heading state.
const std::string& sectionClassNamesFor(const EditorOptions& options, HeadingLevel level);
const std::string& sectionStyleFor(const EditorOptions& options, HeadingLevel level);

} // namespace quire

#endif // QUIRE_CORE_EDITOR_OPTIONS_H

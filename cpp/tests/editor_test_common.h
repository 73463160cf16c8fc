#pragma once

#include <gtest/gtest.h>
#include "quire/editor.h"
#include "quire/document/section_tree.h"
#include "quire/host/reference_surface.h"
#include "quire/host/selection_event_hub.h"
#include <string>
#include <string_view>

namespace quire_test {

using namespace quire;

// Host delivery of one key press: pre hook, native default unless suppressed, post hook.
inline bool pressKey(EditorInstance& editor, ReferenceSurface& surface, const KeyEvent& event) {
    const bool suppressed = editor.onKeyDown(event);
    if (!suppressed) surface.applyNativeKey(event);
    editor.onKeyUp(event);
    return suppressed;
}

// ASCII only; one key press per character.
inline void typeString(EditorInstance& editor, ReferenceSurface& surface, std::string_view text) {
    for (const char c : text) {
        pressKey(editor, surface, KeyEvent::character(std::string(1, c)));
    }
}

inline void expectSameRuns(const std::vector<TextRun>& a, const std::vector<TextRun>& b) {
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].startIndex, b[i].startIndex) << "run " << i;
        EXPECT_EQ(a[i].length, b[i].length) << "run " << i;
        EXPECT_EQ(a[i].flags, b[i].flags) << "run " << i;
        EXPECT_EQ(a[i].linkId, b[i].linkId) << "run " << i;
    }
}

// Structural invariants that hold after every public operation.
inline void expectDocumentInvariants(const SectionTree& tree) {
    ASSERT_GE(tree.sectionCount(), 1u);
    EXPECT_TRUE(tree.isText(tree.firstSection()));

    for (const SectionId id : tree.order()) {
        if (!tree.isText(id)) continue;
        const std::vector<TextRun>& runs = tree.getRuns(id);
        std::uint32_t covered = 0;
        for (std::size_t i = 0; i < runs.size(); ++i) {
            const TextRun& run = runs[i];
            EXPECT_EQ(run.startIndex, covered) << "gap in section " << id;
            EXPECT_GT(run.length, 0u) << "empty run in section " << id;
            covered += run.length;
            if (i > 0) {
                const TextRun& prev = runs[i - 1];
                EXPECT_FALSE(prev.flags == run.flags && prev.linkId == run.linkId)
                    << "unmerged runs in section " << id;
            }
            if (tree.headingOf(id) != HeadingLevel::None) {
                EXPECT_EQ(run.flags, MarkFlags::None) << "marks in heading section " << id;
            }
            if (hasMark(run.flags, MarkFlags::Link)) {
                EXPECT_TRUE(tree.hasLink(run.linkId)) << "dangling link in section " << id;
            }
        }
        EXPECT_EQ(covered, tree.contentLength(id)) << "runs do not cover section " << id;
    }
}

class EditorFixture : public ::testing::Test {
protected:
    SelectionEventHub hub;
    ReferenceSurface surface{1};
    EditorHandle editor = init(surface, hub);

    const SectionTree& doc() const { return editor->document(); }
    SectionId section(std::size_t index) const { return doc().sectionAt(index); }
    std::string text(std::size_t index) const { return std::string(doc().getContent(section(index))); }
    Cursor caret() const { return surface.querySelection().focus; }

    bool press(Key key) { return pressKey(*editor, surface, KeyEvent::of(key)); }
    void type(std::string_view s) { typeString(*editor, surface, s); }

    void click(SectionId id, std::uint32_t offset) {
        surface.placeCaret(id, offset);
        editor->onClick();
    }

    void selectRange(Cursor anchor, Cursor focus) {
        surface.select(anchor, focus);
        editor->onMouseUp();
    }

    // One plain paragraph per entry, typed and split with Enter.
    void typeParagraphs(std::initializer_list<std::string_view> paragraphs) {
        bool first = true;
        for (const std::string_view p : paragraphs) {
            if (!first) press(Key::Enter);
            type(p);
            first = false;
        }
    }
};

} // namespace quire_test

#include <gtest/gtest.h>
#include "quire/toolbar/toolbar_coordinator.h"
#include "tests/editor_test_common.h"

using namespace quire;

class ToolbarCoordinatorTest : public quire_test::EditorFixture {
protected:
    ToolbarCoordinator& toolbar() { return editor->toolbar(); }
    ToolbarState state() { return editor->toolbar().state(); }

    // "hello" in the first section, fully selected.
    void selectHello() {
        type("hello");
        selectRange(Cursor{section(0), 0}, Cursor{section(0), 5});
    }
};

// =============================================================================
// Derivation
// =============================================================================

TEST_F(ToolbarCoordinatorTest, StartsHidden) {
    EXPECT_EQ(state(), ToolbarState::Hidden);
    EXPECT_EQ(editor->getToolbarHandle().state(), ToolbarState::Hidden);
}

TEST_F(ToolbarCoordinatorTest, CollapsedCaretInEmptySectionShowsInsertControls) {
    click(section(0), 0);
    EXPECT_EQ(state(), ToolbarState::ShowingInsertControls);
    EXPECT_TRUE(std::holds_alternative<InsertToolbar>(toolbar().variant()));
}

TEST_F(ToolbarCoordinatorTest, CollapsedCaretInTextHides) {
    type("abc");
    EXPECT_EQ(state(), ToolbarState::Hidden);
}

TEST_F(ToolbarCoordinatorTest, RangeSelectionShowsFormatControls) {
    selectHello();
    EXPECT_EQ(state(), ToolbarState::ShowingFormatControls);
    ASSERT_NE(toolbar().formatControls(), nullptr);
    EXPECT_EQ(toolbar().formatControls()->bold, MarkTriState::Off);
}

TEST_F(ToolbarCoordinatorTest, DisplayForcesFormatControlsOnCollapsedText) {
    type("abc");
    editor->getToolbarHandle().display();
    EXPECT_EQ(state(), ToolbarState::ShowingFormatControls);
    editor->getToolbarHandle().hide();
    EXPECT_EQ(state(), ToolbarState::Hidden);
}

TEST_F(ToolbarCoordinatorTest, DisplayInEmptySectionShowsInsertControls) {
    editor->getToolbarHandle().display();
    EXPECT_EQ(state(), ToolbarState::ShowingInsertControls);
}

TEST_F(ToolbarCoordinatorTest, EscapeHidesWithoutPendingInput) {
    selectHello();
    press(Key::Escape);
    EXPECT_EQ(state(), ToolbarState::Hidden);
}

TEST_F(ToolbarCoordinatorTest, ScrollHidesOnlyInsertControls) {
    click(section(0), 0);
    editor->onScroll();
    EXPECT_EQ(state(), ToolbarState::Hidden);

    selectHello();
    editor->onScroll();
    EXPECT_EQ(state(), ToolbarState::ShowingFormatControls);
}

// =============================================================================
// Format controls
// =============================================================================

TEST_F(ToolbarCoordinatorTest, BoldControlTogglesAndRefreshes) {
    selectHello();
    EXPECT_TRUE(toolbar().activateBold());
    EXPECT_EQ(state(), ToolbarState::ShowingFormatControls);
    EXPECT_EQ(toolbar().formatControls()->bold, MarkTriState::On);

    EXPECT_TRUE(toolbar().activateItalic());
    EXPECT_EQ(toolbar().formatControls()->italic, MarkTriState::On);
    EXPECT_EQ(doc().getRuns(section(0))[0].flags, MarkFlags::Bold | MarkFlags::Italic);
}

TEST_F(ToolbarCoordinatorTest, HeadingControlDisablesMarkControls) {
    selectHello();
    EXPECT_TRUE(toolbar().activateHeading());
    EXPECT_EQ(doc().headingOf(section(0)), HeadingLevel::Large);
    ASSERT_NE(toolbar().formatControls(), nullptr);
    EXPECT_TRUE(toolbar().formatControls()->marksDisabled());
    EXPECT_FALSE(toolbar().activateBold());
    EXPECT_FALSE(toolbar().activateLink());
}

TEST_F(ToolbarCoordinatorTest, FormatControlsUnavailableFromInsertControls) {
    click(section(0), 0);
    EXPECT_FALSE(toolbar().activateBold());
    EXPECT_FALSE(toolbar().activateLink());
    EXPECT_EQ(toolbar().submitLink("example.com"), EditorError::InvalidOperation);
}

// =============================================================================
// Link input
// =============================================================================

TEST_F(ToolbarCoordinatorTest, LinkInputAppliesValidUrl) {
    selectHello();
    EXPECT_TRUE(toolbar().activateLink());
    EXPECT_EQ(state(), ToolbarState::ShowingLinkInput);
    EXPECT_TRUE(toolbar().hasPendingInput());

    EXPECT_EQ(toolbar().submitLink("example.com"), EditorError::Ok);
    EXPECT_FALSE(toolbar().hasPendingInput());
    const TextRun& run = doc().getRuns(section(0))[0];
    EXPECT_TRUE(hasMark(run.flags, MarkFlags::Link));
    EXPECT_EQ(*doc().getLinkHref(run.linkId), "http://example.com");
    EXPECT_EQ(caret(), (Cursor{section(0), 5}));
}

TEST_F(ToolbarCoordinatorTest, InvalidUrlKeepsLinkInputOpen) {
    selectHello();
    toolbar().activateLink();
    const std::uint64_t before = editor->documentDigest();

    EXPECT_EQ(toolbar().submitLink("nope"), EditorError::InvalidURL);
    EXPECT_EQ(state(), ToolbarState::ShowingLinkInput);
    EXPECT_EQ(editor->documentDigest(), before);
    const auto& edit = std::get<EditToolbar>(toolbar().variant());
    EXPECT_EQ(edit.core.inputText, "nope");
}

TEST_F(ToolbarCoordinatorTest, LinkControlOnLinkedTextRemovesLink) {
    selectHello();
    toolbar().activateLink();
    ASSERT_EQ(toolbar().submitLink("example.com"), EditorError::Ok);

    selectRange(Cursor{section(0), 0}, Cursor{section(0), 5});
    ASSERT_TRUE(toolbar().formatControls()->linkActive);
    EXPECT_TRUE(toolbar().activateLink());
    EXPECT_FALSE(hasMark(doc().getRuns(section(0))[0].flags, MarkFlags::Link));
}

TEST_F(ToolbarCoordinatorTest, CancelLinkInputRestoresSavedSelection) {
    selectHello();
    toolbar().activateLink();
    // Focus moves into the toolbar's text field.
    surface.placeCaret(section(0), 2);
    editor->onSelectionChange(SelectionChangeEvent{surface.surfaceId(), SelectionOwner::Toolbar});
    EXPECT_EQ(state(), ToolbarState::ShowingLinkInput);

    toolbar().cancelInput();
    EXPECT_EQ(state(), ToolbarState::ShowingFormatControls);
    EXPECT_EQ(surface.querySelection(), (Selection{Cursor{section(0), 0}, Cursor{section(0), 5}}));
}

TEST_F(ToolbarCoordinatorTest, EditorSelectionChangeDropsPendingInput) {
    selectHello();
    toolbar().activateLink();
    surface.placeCaret(section(0), 2);
    hub.publish(SelectionChangeEvent{surface.surfaceId(), SelectionOwner::Editor});

    EXPECT_FALSE(toolbar().hasPendingInput());
    EXPECT_EQ(state(), ToolbarState::Hidden);
    EXPECT_EQ(caret(), (Cursor{section(0), 2}));
}

TEST_F(ToolbarCoordinatorTest, SelectionChangeOnOtherSurfaceIsIgnored) {
    selectHello();
    toolbar().activateLink();
    hub.publish(SelectionChangeEvent{surface.surfaceId() + 1, SelectionOwner::Editor});
    EXPECT_EQ(state(), ToolbarState::ShowingLinkInput);
}

TEST_F(ToolbarCoordinatorTest, EscapeKeepsPendingInput) {
    selectHello();
    toolbar().activateLink();
    editor->onKeyUp(KeyEvent::of(Key::Escape));
    EXPECT_EQ(state(), ToolbarState::ShowingLinkInput);
}

// =============================================================================
// Insert controls
// =============================================================================

TEST_F(ToolbarCoordinatorTest, ImageFlowInsertsContainer) {
    click(section(0), 0);
    EXPECT_TRUE(toolbar().activateImage());
    EXPECT_EQ(state(), ToolbarState::ShowingImageURLInput);

    EXPECT_EQ(toolbar().submitImageUrl("bad"), EditorError::InvalidURL);
    EXPECT_EQ(state(), ToolbarState::ShowingImageURLInput);

    EXPECT_EQ(toolbar().submitImageUrl("example.com/cat.png"), EditorError::Ok);
    EXPECT_EQ(state(), ToolbarState::ShowingImageAltInput);

    EXPECT_EQ(toolbar().submitImageAlt("a cat"), EditorError::Ok);
    EXPECT_EQ(state(), ToolbarState::Hidden);
    ASSERT_EQ(doc().sectionCount(), 3u);
    const SectionRec* image = doc().getSection(section(1));
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->atomic.kind, AtomicKind::Image);
    EXPECT_EQ(image->atomic.src, "http://example.com/cat.png");
    EXPECT_EQ(image->atomic.alt, "a cat");
    EXPECT_TRUE(doc().isText(section(0)));
    EXPECT_EQ(caret(), (Cursor{section(2), 0}));
}

TEST_F(ToolbarCoordinatorTest, CancelAltInputReturnsToUrlWithPrefill) {
    click(section(0), 0);
    toolbar().activateImage();
    toolbar().submitImageUrl("example.com/cat.png");

    toolbar().cancelInput();
    EXPECT_EQ(state(), ToolbarState::ShowingImageURLInput);
    const auto& insert = std::get<InsertToolbar>(toolbar().variant());
    EXPECT_EQ(insert.core.inputText, "http://example.com/cat.png");

    toolbar().cancelInput();
    EXPECT_EQ(state(), ToolbarState::ShowingInsertControls);
    EXPECT_EQ(doc().sectionCount(), 1u);
}

TEST_F(ToolbarCoordinatorTest, RuleRefusedOnFirstSection) {
    click(section(0), 0);
    EXPECT_EQ(toolbar().activateRule(), EditorError::StructuralViolation);
    EXPECT_EQ(doc().sectionCount(), 1u);
    EXPECT_EQ(state(), ToolbarState::Hidden);
}

TEST_F(ToolbarCoordinatorTest, RuleInsertedBeforeEmptySection) {
    type("a");
    press(Key::Enter);
    EXPECT_EQ(state(), ToolbarState::ShowingInsertControls);

    EXPECT_EQ(toolbar().activateRule(), EditorError::Ok);
    ASSERT_EQ(doc().sectionCount(), 3u);
    EXPECT_TRUE(doc().isContainer(section(1)));
    EXPECT_EQ(caret(), (Cursor{section(2), 0}));
}

TEST_F(ToolbarCoordinatorTest, ImageInsertClearsPlaceholderImmediately) {
    ASSERT_TRUE(surface.placeholderVisible());
    editor->onMouseUp();
    ASSERT_TRUE(toolbar().activateImage());
    ASSERT_EQ(toolbar().submitImageUrl("example.com/a.png"), EditorError::Ok);
    const std::uint32_t before = surface.documentChangeCount();

    ASSERT_EQ(toolbar().submitImageAlt("a"), EditorError::Ok);
    EXPECT_EQ(doc().sectionCount(), 3u);
    EXPECT_FALSE(surface.placeholderVisible());
    EXPECT_FALSE(editor->placeholderVisible());
    EXPECT_GT(surface.documentChangeCount(), before);
}

TEST_F(ToolbarCoordinatorTest, ControlActionsNotifyHost) {
    selectHello();
    std::uint32_t before = surface.documentChangeCount();
    ASSERT_TRUE(toolbar().activateBold());
    EXPECT_GT(surface.documentChangeCount(), before);
    EXPECT_TRUE(hasChange(surface.lastChanges(), ChangeMask::Marks));

    before = surface.documentChangeCount();
    ASSERT_TRUE(toolbar().activateLink());
    ASSERT_EQ(toolbar().submitLink("example.com"), EditorError::Ok);
    EXPECT_GT(surface.documentChangeCount(), before);

    selectRange(Cursor{section(0), 0}, Cursor{section(0), 5});
    before = surface.documentChangeCount();
    ASSERT_TRUE(toolbar().activateHeading());
    EXPECT_GT(surface.documentChangeCount(), before);
}

TEST_F(ToolbarCoordinatorTest, RuleControlNotifiesHost) {
    type("a");
    press(Key::Enter);
    const std::uint32_t before = surface.documentChangeCount();
    ASSERT_EQ(toolbar().activateRule(), EditorError::Ok);
    EXPECT_GT(surface.documentChangeCount(), before);
    EXPECT_TRUE(hasChange(surface.lastChanges(), ChangeMask::Structure));
}

TEST_F(ToolbarCoordinatorTest, StateNamesAreStable) {
    EXPECT_STREQ(toolbarStateName(ToolbarState::Hidden), "Hidden");
    EXPECT_STREQ(toolbarStateName(ToolbarState::ShowingImageAltInput), "ShowingImageAltInput");
}

#include <gtest/gtest.h>
#include "quire/document/section_tree.h"
#include "tests/editor_test_common.h"

using namespace quire;
using quire_test::expectDocumentInvariants;
using quire_test::expectSameRuns;

class SectionTreeTest : public ::testing::Test {
protected:
    SectionTree tree;

    SectionId addText(SectionId after, std::string_view content, MarkFlags flags = MarkFlags::None) {
        const SectionId id = tree.insertTextSection(after);
        tree.insertText(id, 0, content, flags);
        return id;
    }

    SectionId addRule(SectionId after) {
        AtomicObject rule;
        rule.kind = AtomicKind::Rule;
        return tree.insertContainerSection(after, rule);
    }
};

// =============================================================================
// Structure
// =============================================================================

TEST_F(SectionTreeTest, NewDocumentIsSingleEmptyTextSection) {
    EXPECT_EQ(tree.sectionCount(), 1u);
    EXPECT_TRUE(tree.isText(tree.firstSection()));
    EXPECT_TRUE(tree.isBlank());
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, CreateDocumentAllocatesFreshId) {
    const SectionId before = tree.firstSection();
    const SectionId after = tree.createDocument();
    EXPECT_NE(before, after);
    EXPECT_FALSE(tree.contains(before));
    EXPECT_EQ(tree.firstSection(), after);
}

TEST_F(SectionTreeTest, InsertTextSectionAtFrontAndAfter) {
    const SectionId first = tree.firstSection();
    const SectionId tail = tree.insertTextSection(first);
    const SectionId head = tree.insertTextSection(kNoSection);
    ASSERT_EQ(tree.sectionCount(), 3u);
    EXPECT_EQ(tree.sectionAt(0), head);
    EXPECT_EQ(tree.sectionAt(1), first);
    EXPECT_EQ(tree.sectionAt(2), tail);
}

TEST_F(SectionTreeTest, InsertTextSectionAfterUnknownIdFails) {
    EXPECT_EQ(tree.insertTextSection(999), kNoSection);
    EXPECT_EQ(tree.sectionCount(), 1u);
}

TEST_F(SectionTreeTest, ContainerAtDocumentHeadIsRefused) {
    AtomicObject rule;
    rule.kind = AtomicKind::Rule;
    EXPECT_EQ(tree.insertContainerSection(kNoSection, rule), kNoSection);
    EXPECT_EQ(tree.sectionCount(), 1u);
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, ContainerKeepsAtomicPayload) {
    AtomicObject image;
    image.kind = AtomicKind::Image;
    image.src = "http://example.com/a.png";
    image.alt = "a";
    const SectionId id = tree.insertContainerSection(tree.firstSection(), image);
    ASSERT_TRUE(tree.isContainer(id));
    const SectionRec* rec = tree.getSection(id);
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->atomic.kind, AtomicKind::Image);
    EXPECT_EQ(rec->atomic.src, "http://example.com/a.png");
    EXPECT_EQ(rec->atomic.alt, "a");
    EXPECT_EQ(tree.contentLength(id), 0u);
    EXPECT_TRUE(tree.getRuns(id).empty());
}

TEST_F(SectionTreeTest, RemovingLastSectionLeavesFreshTextSection) {
    const SectionId only = tree.firstSection();
    EXPECT_EQ(tree.removeSection(only), EditorError::Ok);
    ASSERT_EQ(tree.sectionCount(), 1u);
    EXPECT_NE(tree.firstSection(), only);
    EXPECT_TRUE(tree.isText(tree.firstSection()));
}

TEST_F(SectionTreeTest, RemovingHeadBeforeContainerKeepsTextAtHead) {
    const SectionId first = tree.firstSection();
    const SectionId rule = addRule(first);
    EXPECT_EQ(tree.removeSection(first), EditorError::Ok);
    ASSERT_EQ(tree.sectionCount(), 2u);
    EXPECT_TRUE(tree.isText(tree.sectionAt(0)));
    EXPECT_EQ(tree.sectionAt(1), rule);
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, RemoveUnknownSectionReportsNotFound) {
    EXPECT_EQ(tree.removeSection(999), EditorError::SectionNotFound);
    EXPECT_EQ(tree.sectionCount(), 1u);
}

TEST_F(SectionTreeTest, NeighbourQueries) {
    const SectionId a = tree.firstSection();
    const SectionId rule = addRule(a);
    const SectionId b = addText(rule, "b");
    EXPECT_EQ(tree.previousOf(a), kNoSection);
    EXPECT_EQ(tree.nextOf(a), rule);
    EXPECT_EQ(tree.previousOf(b), rule);
    EXPECT_EQ(tree.nextOf(b), kNoSection);
    EXPECT_EQ(tree.indexOf(b).value_or(99), 2u);
    EXPECT_FALSE(tree.indexOf(999).has_value());
}

// =============================================================================
// Content and Runs
// =============================================================================

TEST_F(SectionTreeTest, InsertTextMergesEqualMarks) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "ab", MarkFlags::Bold);
    tree.insertText(id, 2, "cd", MarkFlags::Bold);
    EXPECT_EQ(tree.getContent(id), "abcd");
    ASSERT_EQ(tree.getRuns(id).size(), 1u);
    EXPECT_EQ(tree.getRuns(id)[0].length, 4u);
    EXPECT_FALSE(tree.isBlank());
}

TEST_F(SectionTreeTest, InsertTextInsideRunSplitsIt) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "ad", MarkFlags::Bold);
    tree.insertText(id, 1, "bc", MarkFlags::Italic);
    EXPECT_EQ(tree.getContent(id), "abcd");
    const auto& runs = tree.getRuns(id);
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].flags, MarkFlags::Bold);
    EXPECT_EQ(runs[1].flags, MarkFlags::Italic);
    EXPECT_EQ(runs[1].startIndex, 1u);
    EXPECT_EQ(runs[2].flags, MarkFlags::Bold);
    EXPECT_EQ(runs[2].startIndex, 3u);
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, InsertTextNeverCarriesLinkFlag) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "x", MarkFlags::Bold | MarkFlags::Link);
    ASSERT_EQ(tree.getRuns(id).size(), 1u);
    EXPECT_EQ(tree.getRuns(id)[0].flags, MarkFlags::Bold);
}

TEST_F(SectionTreeTest, DeleteTextClampsToCodepointBoundaries) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "a\xC3\xA9" "b", MarkFlags::None); // "aéb"
    // End byte 2 falls inside the two-byte é; it clamps back to 1.
    EXPECT_TRUE(tree.deleteText(id, 0, 2));
    EXPECT_EQ(tree.getContent(id), "\xC3\xA9" "b");
    EXPECT_TRUE(tree.deleteText(id, 0, 2));
    EXPECT_EQ(tree.getContent(id), "b");
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, NormalizeIsIdempotent) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "hello world", MarkFlags::None);
    tree.applyMarks(id, 0, 5, MarkFlags::Bold, true);
    tree.applyMarks(id, 3, 8, MarkFlags::Italic, true);
    tree.applyMarks(id, 0, 11, MarkFlags::Italic, false);

    tree.normalize(id);
    const std::vector<TextRun> once = tree.getRuns(id);
    tree.normalize(id);
    expectSameRuns(tree.getRuns(id), once);
    ASSERT_EQ(once.size(), 2u);
    EXPECT_EQ(once[0].length, 5u);
    EXPECT_EQ(once[0].flags, MarkFlags::Bold);
}

TEST_F(SectionTreeTest, TypingMarksFollowPrecedingCharacter) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "ab", MarkFlags::Bold);
    tree.insertText(id, 2, "cd", MarkFlags::None);
    EXPECT_EQ(tree.typingMarksAt(id, 2), MarkFlags::Bold);
    EXPECT_EQ(tree.typingMarksAt(id, 3), MarkFlags::None);
    // At offset 0 the first run's marks apply.
    EXPECT_EQ(tree.typingMarksAt(id, 0), MarkFlags::Bold);
}

TEST_F(SectionTreeTest, TypingMarksExcludeLink) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "ab", MarkFlags::Italic);
    const LinkId link = tree.createLink("http://example.com");
    ASSERT_TRUE(tree.applyLink(id, 0, 2, link));
    EXPECT_EQ(tree.typingMarksAt(id, 2), MarkFlags::Italic);
}

// =============================================================================
// Split and Merge
// =============================================================================

TEST_F(SectionTreeTest, SplitPreservesMarksOnBothSides) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "hello", MarkFlags::Bold);
    const SectionId tail = tree.splitSection(id, 2);
    ASSERT_NE(tail, kNoSection);
    EXPECT_EQ(tree.getContent(id), "he");
    EXPECT_EQ(tree.getContent(tail), "llo");
    ASSERT_EQ(tree.getRuns(tail).size(), 1u);
    EXPECT_EQ(tree.getRuns(tail)[0].startIndex, 0u);
    EXPECT_EQ(tree.getRuns(tail)[0].flags, MarkFlags::Bold);
    EXPECT_EQ(tree.nextOf(id), tail);
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, SplitTailOfHeadingIsPlain) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "Title", MarkFlags::None);
    tree.setHeading(id, HeadingLevel::Large);
    const SectionId tail = tree.splitSection(id, 3);
    EXPECT_EQ(tree.headingOf(id), HeadingLevel::Large);
    EXPECT_EQ(tree.headingOf(tail), HeadingLevel::None);
    EXPECT_EQ(tree.getContent(tail), "le");
}

TEST_F(SectionTreeTest, SplitContainerFails) {
    const SectionId rule = addRule(tree.firstSection());
    EXPECT_EQ(tree.splitSection(rule, 0), kNoSection);
}

TEST_F(SectionTreeTest, MergeJoinsContentAndRuns) {
    const SectionId a = tree.firstSection();
    tree.insertText(a, 0, "ab", MarkFlags::None);
    const SectionId b = addText(a, "cd", MarkFlags::Italic);
    EXPECT_TRUE(tree.mergeWithNext(a));
    EXPECT_FALSE(tree.contains(b));
    EXPECT_EQ(tree.getContent(a), "abcd");
    ASSERT_EQ(tree.getRuns(a).size(), 2u);
    EXPECT_EQ(tree.getRuns(a)[1].startIndex, 2u);
    EXPECT_EQ(tree.getRuns(a)[1].flags, MarkFlags::Italic);
}

TEST_F(SectionTreeTest, MergeIntoHeadingDropsMarks) {
    const SectionId a = tree.firstSection();
    tree.insertText(a, 0, "Head", MarkFlags::None);
    tree.setHeading(a, HeadingLevel::Small);
    addText(a, "bold", MarkFlags::Bold);
    EXPECT_TRUE(tree.mergeWithNext(a));
    EXPECT_EQ(tree.getContent(a), "Headbold");
    ASSERT_EQ(tree.getRuns(a).size(), 1u);
    EXPECT_EQ(tree.getRuns(a)[0].flags, MarkFlags::None);
}

TEST_F(SectionTreeTest, MergeWithContainerFails) {
    const SectionId a = tree.firstSection();
    addRule(a);
    EXPECT_FALSE(tree.mergeWithNext(a));
    EXPECT_EQ(tree.sectionCount(), 2u);
}

// =============================================================================
// Headings and Marks
// =============================================================================

TEST_F(SectionTreeTest, EnteringHeadingStripsMarks) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "abc", MarkFlags::Bold | MarkFlags::Italic);
    const LinkId link = tree.createLink("http://example.com");
    tree.applyLink(id, 0, 1, link);
    EXPECT_TRUE(tree.setHeading(id, HeadingLevel::Large));
    for (const TextRun& run : tree.getRuns(id)) {
        EXPECT_EQ(run.flags, MarkFlags::None);
        EXPECT_EQ(run.linkId, kNoLink);
    }
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, HeadingRefusesMarksAndForcesPlainTyping) {
    const SectionId id = tree.firstSection();
    tree.setHeading(id, HeadingLevel::Small);
    tree.insertText(id, 0, "abc", MarkFlags::Bold);
    EXPECT_EQ(tree.getRuns(id)[0].flags, MarkFlags::None);
    EXPECT_FALSE(tree.applyMarks(id, 0, 3, MarkFlags::Italic, true));
    const LinkId link = tree.createLink("http://example.com");
    EXPECT_FALSE(tree.applyLink(id, 0, 3, link));
}

TEST_F(SectionTreeTest, ClearLinkReturnsEndOfLastRun) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "one two three", MarkFlags::None);
    const LinkId link = tree.createLink("http://example.com");
    tree.applyLink(id, 4, 7, link);
    const auto end = tree.clearLink(id, link);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 7u);
    ASSERT_EQ(tree.getRuns(id).size(), 1u);
    EXPECT_FALSE(tree.clearLink(id, link).has_value());
}

// =============================================================================
// Range Deletion
// =============================================================================

TEST_F(SectionTreeTest, DeleteRangeWithinSection) {
    const SectionId id = tree.firstSection();
    tree.insertText(id, 0, "hello", MarkFlags::None);
    const Cursor caret = tree.deleteRange(Cursor{id, 4}, Cursor{id, 1});
    EXPECT_EQ(tree.getContent(id), "ho");
    EXPECT_EQ(caret, (Cursor{id, 1}));
}

TEST_F(SectionTreeTest, DeleteRangeAcrossSectionsMergesEndpoints) {
    const SectionId a = tree.firstSection();
    tree.insertText(a, 0, "abc", MarkFlags::None);
    const SectionId rule = addRule(a);
    const SectionId b = addText(rule, "def", MarkFlags::Bold);

    const Cursor caret = tree.deleteRange(Cursor{a, 1}, Cursor{b, 2});
    ASSERT_EQ(tree.sectionCount(), 1u);
    EXPECT_EQ(tree.getContent(a), "af");
    EXPECT_EQ(caret, (Cursor{a, 1}));
    ASSERT_EQ(tree.getRuns(a).size(), 2u);
    EXPECT_EQ(tree.getRuns(a)[1].flags, MarkFlags::Bold);
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, DeleteRangeEndingInContainerRemovesIt) {
    const SectionId a = tree.firstSection();
    tree.insertText(a, 0, "abc", MarkFlags::None);
    const SectionId rule = addRule(a);
    const Cursor caret = tree.deleteRange(Cursor{a, 2}, Cursor{rule, 0});
    EXPECT_EQ(tree.sectionCount(), 1u);
    EXPECT_EQ(tree.getContent(a), "ab");
    EXPECT_EQ(caret, (Cursor{a, 2}));
}

TEST_F(SectionTreeTest, DeleteRangeBetweenContainersLandsWhereRangeWas) {
    const SectionId a = tree.firstSection();
    tree.insertText(a, 0, "abc", MarkFlags::None);
    const SectionId first = addRule(a);
    const SectionId mid = addText(first, "mid");
    const SectionId second = addRule(mid);
    const SectionId tail = addText(second, "tail");

    const Cursor caret = tree.deleteRange(Cursor{first, 0}, Cursor{second, 0});
    ASSERT_EQ(tree.sectionCount(), 2u);
    EXPECT_EQ(tree.sectionAt(1), tail);
    EXPECT_EQ(caret, (Cursor{tail, 0}));
    expectDocumentInvariants(tree);
}

TEST_F(SectionTreeTest, DeleteRangeOfTrailingContainersFallsBackToPrecedingText) {
    const SectionId a = tree.firstSection();
    const SectionId b = addText(a, "b");
    const SectionId first = addRule(b);
    const SectionId second = addRule(first);

    const Cursor caret = tree.deleteRange(Cursor{second, 0}, Cursor{first, 0});
    ASSERT_EQ(tree.sectionCount(), 2u);
    EXPECT_EQ(caret, (Cursor{b, 0}));
}

// =============================================================================
// Ordering, Changes, Digest
// =============================================================================

TEST_F(SectionTreeTest, PrecedesOrdersBySectionThenOffset) {
    const SectionId a = tree.firstSection();
    const SectionId b = addText(a, "xy");
    EXPECT_TRUE(tree.precedes(Cursor{a, 5}, Cursor{b, 0}));
    EXPECT_TRUE(tree.precedes(Cursor{b, 0}, Cursor{b, 1}));
    EXPECT_FALSE(tree.precedes(Cursor{b, 1}, Cursor{a, 0}));
    EXPECT_TRUE(tree.precedes(Cursor{a, 0}, Cursor{999, 0}));
}

TEST_F(SectionTreeTest, ConsumeChangesClearsPendingMask) {
    tree.consumeChanges();
    const std::uint32_t revision = tree.revision();
    tree.insertText(tree.firstSection(), 0, "x", MarkFlags::None);
    EXPECT_GT(tree.revision(), revision);
    const ChangeMask changes = tree.consumeChanges();
    EXPECT_TRUE(hasChange(changes, ChangeMask::Content));
    EXPECT_FALSE(hasChange(changes, ChangeMask::Structure));
    EXPECT_EQ(tree.consumeChanges(), ChangeMask::None);
}

TEST_F(SectionTreeTest, DigestIgnoresSectionIds) {
    SectionTree other;
    other.createDocument();
    other.createDocument(); // burn ids so both trees differ in numbering

    tree.insertText(tree.firstSection(), 0, "same", MarkFlags::Bold);
    addRule(tree.firstSection());
    other.insertText(other.firstSection(), 0, "same", MarkFlags::Bold);
    AtomicObject rule;
    rule.kind = AtomicKind::Rule;
    other.insertContainerSection(other.firstSection(), rule);

    EXPECT_NE(tree.firstSection(), other.firstSection());
    EXPECT_EQ(tree.documentDigest(), other.documentDigest());

    other.applyMarks(other.firstSection(), 0, 2, MarkFlags::Italic, true);
    EXPECT_NE(tree.documentDigest(), other.documentDigest());
}

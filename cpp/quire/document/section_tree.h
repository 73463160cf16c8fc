#ifndef QUIRE_DOCUMENT_SECTION_TREE_H
#define QUIRE_DOCUMENT_SECTION_TREE_H

#include "quire/core/types.h"
#include "quire/core/editor_options.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quire {

struct SectionRec {
    SectionId id = kNoSection;
    SectionKind kind = SectionKind::Text;
    HeadingLevel heading = HeadingLevel::None;
    std::string classNames;
    std::string style;
    AtomicObject atomic; // Container sections only
};

/**
 * SectionTree: the document model.
 *
 * Holds the ordered block sections, the UTF-8 content and styled runs of
 * every TextSection, and the link records referenced by Link marks.
 *
 * Invariants held after every public call:
 * - there is at least one section;
 * - the first section is a TextSection;
 * - runs of a TextSection cover its content without gaps, and no two
 *   adjacent runs carry the same marks;
 * - heading sections carry no marks.
 */
class SectionTree {
public:
    SectionTree();

    // Resets to a single empty TextSection and returns its id.
    SectionId createDocument();

    // Presentation applied to sections created from now on (nullable).
    void setOptions(const EditorOptions* options) { options_ = options; }

    // ==========================================================================
    // Structure
    // ==========================================================================

    /**
     * Insert an empty TextSection after `afterId`.
     * @param afterId Existing section, or kNoSection to insert at the front
     * @return New section id, or kNoSection if afterId is unknown
     */
    SectionId insertTextSection(SectionId afterId);

    /**
     * Insert a ContainerSection wrapping `atomic` after `afterId`.
     * Placing a container at the front is a structural violation and is refused.
     * @return New section id, or kNoSection when refused
     */
    SectionId insertContainerSection(SectionId afterId, const AtomicObject& atomic);

    /**
     * Remove a section. When that would leave the document empty or headed
     * by a container, a fresh empty TextSection is placed at the front.
     */
    EditorError removeSection(SectionId id);

    /**
     * Append the following TextSection's content and runs to `id` and remove it.
     * @return False when either side is missing or not a TextSection
     */
    bool mergeWithNext(SectionId id);

    /**
     * Move the content after `offset` into a new plain TextSection placed after `id`.
     * Marks are preserved on both sides of the cut.
     * @return New section id, or kNoSection if `id` is not a TextSection
     */
    SectionId splitSection(SectionId id, std::uint32_t offset);

    // Merge equal-mark adjacent runs and drop empty ones. Idempotent.
    void normalize(SectionId id);

    bool setHeading(SectionId id, HeadingLevel level);

    // Re-apply class/style metadata from the options for the section's current state.
    void applyPresentation(SectionId id);

    // ==========================================================================
    // Queries
    // ==========================================================================

    std::size_t sectionCount() const { return order_.size(); }
    const std::vector<SectionId>& order() const { return order_; }
    const SectionRec* getSection(SectionId id) const;
    bool contains(SectionId id) const;
    bool isText(SectionId id) const;
    bool isContainer(SectionId id) const;
    std::optional<std::size_t> indexOf(SectionId id) const;
    SectionId firstSection() const { return order_.front(); }
    SectionId sectionAt(std::size_t index) const;
    SectionId previousOf(SectionId id) const;
    SectionId nextOf(SectionId id) const;
    HeadingLevel headingOf(SectionId id) const;

    std::string_view getContent(SectionId id) const;
    std::uint32_t contentLength(SectionId id) const;
    const std::vector<TextRun>& getRuns(SectionId id) const;

    // Marks inherited by text typed at `offset` (the preceding character's, link excluded).
    MarkFlags typingMarksAt(SectionId id, std::uint32_t offset) const;

    // True when the document is a single empty TextSection.
    bool isBlank() const;

    // ==========================================================================
    // Content
    // ==========================================================================

    bool insertText(SectionId id, std::uint32_t byteIndex, std::string_view text, MarkFlags flags);
    bool deleteText(SectionId id, std::uint32_t startByte, std::uint32_t endByte);

    /**
     * Delete everything between two cursors (any order). Sections strictly
     * between are removed; text endpoints are trimmed and merged.
     * @return Cursor where the caret belongs afterwards
     */
    Cursor deleteRange(const Cursor& a, const Cursor& b);

    // Set (on=true) or clear Bold/Italic over [startByte, endByte). Headings are skipped.
    bool applyMarks(SectionId id, std::uint32_t startByte, std::uint32_t endByte, MarkFlags marks, bool on);
    bool applyLink(SectionId id, std::uint32_t startByte, std::uint32_t endByte, LinkId linkId);

    // Strip `linkId` from every run of `id`. Returns the end offset of the last stripped run.
    std::optional<std::uint32_t> clearLink(SectionId id, LinkId linkId);
    bool clearMarks(SectionId id);

    // ==========================================================================
    // Links
    // ==========================================================================

    LinkId createLink(std::string href);
    void dropLink(LinkId linkId);
    bool hasLink(LinkId linkId) const;
    const std::string* getLinkHref(LinkId linkId) const;

    // ==========================================================================
    // Ordering
    // ==========================================================================

    // Orders two cursors by document position. Unknown sections sort last.
    bool precedes(const Cursor& a, const Cursor& b) const;

    // ==========================================================================
    // Restore (snapshot adoption)
    // ==========================================================================

    void beginRestore();
    SectionId restoreTextSection(
        HeadingLevel heading,
        std::string classNames,
        std::string style,
        std::string content,
        std::vector<TextRun> runs);
    SectionId restoreContainerSection(AtomicObject atomic, std::string classNames, std::string style);
    LinkId restoreLink(std::string href);
    void finishRestore();

    // ==========================================================================
    // Change Tracking
    // ==========================================================================

    std::uint32_t revision() const { return revision_; }
    ChangeMask consumeChanges();

    // FNV-1a over structure, content, marks and atomic payloads. Ids are excluded.
    std::uint64_t documentDigest() const;

private:
    SectionId allocateSection(SectionKind kind, std::size_t index);
    void ensureHeadText();
    void eraseSection(SectionId id);
    SectionId textSectionNear(std::size_t index) const;
    void markChanged(ChangeMask mask);

    std::vector<SectionId> order_;
    std::unordered_map<SectionId, SectionRec> sections_;
    std::unordered_map<SectionId, std::string> content_;
    std::unordered_map<SectionId, std::vector<TextRun>> runs_;
    std::unordered_map<LinkId, std::string> links_;

    const EditorOptions* options_ = nullptr;
    SectionId nextId_ = 1;
    LinkId nextLinkId_ = 1;
    std::uint32_t revision_ = 0;
    ChangeMask pending_ = ChangeMask::None;
};

} // namespace quire

#endif // QUIRE_DOCUMENT_SECTION_TREE_H

#include "quire/document/section_tree.h"
#include "quire/core/logging.h"
#include "quire/core/string_utils.h"
#include <algorithm>

namespace quire {

namespace {

const std::vector<TextRun> kEmptyRuns;

bool sameMarks(const TextRun& a, const TextRun& b) {
    return a.flags == b.flags && a.linkId == b.linkId;
}

// Ensure a run boundary at `offset`; returns the index of the first run starting at or after it.
std::size_t splitRunAt(std::vector<TextRun>& runs, std::uint32_t offset) {
    for (std::size_t i = 0; i < runs.size(); ++i) {
        TextRun& run = runs[i];
        const std::uint32_t runEnd = run.startIndex + run.length;
        if (run.startIndex >= offset) return i;
        if (offset < runEnd) {
            TextRun tail = run;
            tail.startIndex = offset;
            tail.length = runEnd - offset;
            run.length = offset - run.startIndex;
            runs.insert(runs.begin() + static_cast<std::ptrdiff_t>(i + 1), tail);
            return i + 1;
        }
    }
    return runs.size();
}

void adjustRunsAfterDelete(std::vector<TextRun>& runs, std::uint32_t startByte, std::uint32_t deleteLength) {
    const std::uint32_t endByte = startByte + deleteLength;
    for (auto runIt = runs.begin(); runIt != runs.end(); ) {
        TextRun& run = *runIt;
        const std::uint32_t runStart = run.startIndex;
        const std::uint32_t runEnd = run.startIndex + run.length;

        if (runEnd <= startByte) {
            ++runIt;
        } else if (runStart >= endByte) {
            run.startIndex -= deleteLength;
            ++runIt;
        } else if (runStart >= startByte && runEnd <= endByte) {
            runIt = runs.erase(runIt);
        } else if (runStart < startByte && runEnd > endByte) {
            run.length -= deleteLength;
            ++runIt;
        } else if (runStart < startByte) {
            // Overlaps the start of the deleted region
            run.length = startByte - runStart;
            ++runIt;
        } else {
            // Overlaps the end of the deleted region
            run.length -= endByte - runStart;
            run.startIndex = startByte;
            ++runIt;
        }
    }
}

void normalizeRuns(std::vector<TextRun>& runs) {
    runs.erase(
        std::remove_if(runs.begin(), runs.end(), [](const TextRun& r) { return r.length == 0; }),
        runs.end());

    std::vector<TextRun> merged;
    merged.reserve(runs.size());
    std::uint32_t cursor = 0;
    for (TextRun run : runs) {
        if (!hasMark(run.flags, MarkFlags::Link)) run.linkId = kNoLink;
        if (run.linkId == kNoLink) run.flags = run.flags & ~MarkFlags::Link;
        run.startIndex = cursor;
        cursor += run.length;
        if (!merged.empty() && sameMarks(merged.back(), run)) {
            merged.back().length += run.length;
        } else {
            merged.push_back(run);
        }
    }
    runs.swap(merged);
}

} // namespace

SectionTree::SectionTree() {
    createDocument();
}

SectionId SectionTree::createDocument() {
    order_.clear();
    sections_.clear();
    content_.clear();
    runs_.clear();
    links_.clear();
    const SectionId id = allocateSection(SectionKind::Text, 0);
    markChanged(ChangeMask::Structure | ChangeMask::Content);
    return id;
}

// =============================================================================
// Structure
// =============================================================================

SectionId SectionTree::allocateSection(SectionKind kind, std::size_t index) {
    const SectionId id = nextId_++;
    SectionRec rec;
    rec.id = id;
    rec.kind = kind;
    sections_[id] = rec;
    if (kind == SectionKind::Text) {
        content_[id] = std::string();
        runs_[id] = std::vector<TextRun>();
    }
    index = std::min(index, order_.size());
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(index), id);
    applyPresentation(id);
    return id;
}

SectionId SectionTree::insertTextSection(SectionId afterId) {
    std::size_t index = 0;
    if (afterId != kNoSection) {
        const auto afterIndex = indexOf(afterId);
        if (!afterIndex) {
            QUIRE_LOG_DEBUG("insertTextSection: unknown section %u", afterId);
            return kNoSection;
        }
        index = *afterIndex + 1;
    }
    const SectionId id = allocateSection(SectionKind::Text, index);
    markChanged(ChangeMask::Structure);
    return id;
}

SectionId SectionTree::insertContainerSection(SectionId afterId, const AtomicObject& atomic) {
    if (afterId == kNoSection) {
        QUIRE_LOG_DEBUG("insertContainerSection: refused container at document head");
        return kNoSection;
    }
    const auto afterIndex = indexOf(afterId);
    if (!afterIndex) {
        QUIRE_LOG_DEBUG("insertContainerSection: unknown section %u", afterId);
        return kNoSection;
    }
    const SectionId id = allocateSection(SectionKind::Container, *afterIndex + 1);
    sections_[id].atomic = atomic;
    markChanged(ChangeMask::Structure);
    return id;
}

void SectionTree::eraseSection(SectionId id) {
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    sections_.erase(id);
    content_.erase(id);
    runs_.erase(id);
}

void SectionTree::ensureHeadText() {
    if (!order_.empty() && isText(order_.front())) return;
    QUIRE_LOG_DEBUG("structural violation corrected: empty text section placed at head");
    allocateSection(SectionKind::Text, 0);
}

EditorError SectionTree::removeSection(SectionId id) {
    if (!contains(id)) {
        QUIRE_LOG_DEBUG("removeSection: unknown section %u", id);
        return EditorError::SectionNotFound;
    }
    eraseSection(id);
    ensureHeadText();
    markChanged(ChangeMask::Structure);
    return EditorError::Ok;
}

bool SectionTree::mergeWithNext(SectionId id) {
    const SectionId next = nextOf(id);
    if (!isText(id) || !isText(next)) return false;

    std::string& content = content_[id];
    std::vector<TextRun>& runs = runs_[id];
    const std::uint32_t base = static_cast<std::uint32_t>(content.size());
    const bool plainOnly = headingOf(id) != HeadingLevel::None;

    content += content_[next];
    for (TextRun run : runs_[next]) {
        run.startIndex += base;
        if (plainOnly) {
            run.flags = MarkFlags::None;
            run.linkId = kNoLink;
        }
        runs.push_back(run);
    }
    normalizeRuns(runs);
    eraseSection(next);
    markChanged(ChangeMask::Structure | ChangeMask::Content);
    return true;
}

SectionId SectionTree::splitSection(SectionId id, std::uint32_t offset) {
    if (!isText(id)) return kNoSection;

    std::string& content = content_[id];
    offset = clampToCodepointBoundary(content, offset);
    std::vector<TextRun>& runs = runs_[id];
    const std::size_t cut = splitRunAt(runs, offset);

    std::string tailContent = content.substr(offset);
    std::vector<TextRun> tailRuns(runs.begin() + static_cast<std::ptrdiff_t>(cut), runs.end());
    for (TextRun& run : tailRuns) run.startIndex -= offset;
    runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(cut), runs.end());
    content.erase(offset);
    normalizeRuns(runs);

    const SectionId tail = insertTextSection(id);
    content_[tail] = std::move(tailContent);
    normalizeRuns(tailRuns);
    runs_[tail] = std::move(tailRuns);
    markChanged(ChangeMask::Structure | ChangeMask::Content);
    return tail;
}

void SectionTree::normalize(SectionId id) {
    auto it = runs_.find(id);
    if (it == runs_.end()) return;
    normalizeRuns(it->second);
}

bool SectionTree::setHeading(SectionId id, HeadingLevel level) {
    if (!isText(id)) return false;
    SectionRec& rec = sections_[id];
    if (rec.heading == level) return true;
    rec.heading = level;
    if (level != HeadingLevel::None) clearMarks(id);
    markChanged(ChangeMask::Structure);
    return true;
}

void SectionTree::applyPresentation(SectionId id) {
    auto it = sections_.find(id);
    if (it == sections_.end() || !options_) return;
    SectionRec& rec = it->second;
    if (rec.kind == SectionKind::Text) {
        rec.classNames = sectionClassNamesFor(*options_, rec.heading);
        rec.style = sectionStyleFor(*options_, rec.heading);
    } else {
        rec.classNames.clear();
        rec.style.clear();
    }
}

// =============================================================================
// Queries
// =============================================================================

const SectionRec* SectionTree::getSection(SectionId id) const {
    auto it = sections_.find(id);
    return it == sections_.end() ? nullptr : &it->second;
}

bool SectionTree::contains(SectionId id) const {
    return sections_.find(id) != sections_.end();
}

bool SectionTree::isText(SectionId id) const {
    const SectionRec* rec = getSection(id);
    return rec && rec->kind == SectionKind::Text;
}

bool SectionTree::isContainer(SectionId id) const {
    const SectionRec* rec = getSection(id);
    return rec && rec->kind == SectionKind::Container;
}

std::optional<std::size_t> SectionTree::indexOf(SectionId id) const {
    if (!contains(id)) return std::nullopt;
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - order_.begin());
}

SectionId SectionTree::sectionAt(std::size_t index) const {
    return index < order_.size() ? order_[index] : kNoSection;
}

SectionId SectionTree::previousOf(SectionId id) const {
    const auto index = indexOf(id);
    if (!index || *index == 0) return kNoSection;
    return order_[*index - 1];
}

SectionId SectionTree::nextOf(SectionId id) const {
    const auto index = indexOf(id);
    if (!index) return kNoSection;
    return sectionAt(*index + 1);
}

HeadingLevel SectionTree::headingOf(SectionId id) const {
    const SectionRec* rec = getSection(id);
    return rec ? rec->heading : HeadingLevel::None;
}

std::string_view SectionTree::getContent(SectionId id) const {
    auto it = content_.find(id);
    if (it != content_.end()) {
        return std::string_view(it->second);
    }
    return std::string_view();
}

std::uint32_t SectionTree::contentLength(SectionId id) const {
    return static_cast<std::uint32_t>(getContent(id).size());
}

const std::vector<TextRun>& SectionTree::getRuns(SectionId id) const {
    auto it = runs_.find(id);
    return it == runs_.end() ? kEmptyRuns : it->second;
}

MarkFlags SectionTree::typingMarksAt(SectionId id, std::uint32_t offset) const {
    if (headingOf(id) != HeadingLevel::None) return MarkFlags::None;
    const std::vector<TextRun>& runs = getRuns(id);
    if (runs.empty()) return MarkFlags::None;
    const TextRun* source = &runs.front();
    for (const TextRun& run : runs) {
        if (offset > run.startIndex && offset <= run.startIndex + run.length) {
            source = &run;
            break;
        }
    }
    return source->flags & (MarkFlags::Bold | MarkFlags::Italic);
}

bool SectionTree::isBlank() const {
    return order_.size() == 1 && contentLength(order_.front()) == 0;
}

// =============================================================================
// Content
// =============================================================================

bool SectionTree::insertText(SectionId id, std::uint32_t byteIndex, std::string_view text, MarkFlags flags) {
    if (!isText(id)) return false;
    if (text.empty()) return true;

    std::string& content = content_[id];
    byteIndex = clampToCodepointBoundary(content, byteIndex);
    if (headingOf(id) != HeadingLevel::None) flags = MarkFlags::None;
    flags = flags & ~MarkFlags::Link;

    std::vector<TextRun>& runs = runs_[id];
    const std::size_t at = splitRunAt(runs, byteIndex);
    const std::uint32_t insertLength = static_cast<std::uint32_t>(text.size());
    for (std::size_t i = at; i < runs.size(); ++i) {
        runs[i].startIndex += insertLength;
    }
    TextRun run;
    run.startIndex = byteIndex;
    run.length = insertLength;
    run.flags = flags;
    runs.insert(runs.begin() + static_cast<std::ptrdiff_t>(at), run);

    content.insert(byteIndex, text.data(), text.size());
    normalizeRuns(runs);
    markChanged(ChangeMask::Content);
    return true;
}

bool SectionTree::deleteText(SectionId id, std::uint32_t startByte, std::uint32_t endByte) {
    if (!isText(id)) return false;
    std::string& content = content_[id];
    startByte = clampToCodepointBoundary(content, startByte);
    endByte = clampToCodepointBoundary(content, endByte);
    if (startByte >= endByte) return true;

    const std::uint32_t deleteLength = endByte - startByte;
    content.erase(startByte, deleteLength);
    std::vector<TextRun>& runs = runs_[id];
    adjustRunsAfterDelete(runs, startByte, deleteLength);
    normalizeRuns(runs);
    markChanged(ChangeMask::Content);
    return true;
}

// First TextSection at or after `index`, else the last one before it.
SectionId SectionTree::textSectionNear(std::size_t index) const {
    for (std::size_t i = index; i < order_.size(); ++i) {
        if (isText(order_[i])) return order_[i];
    }
    for (std::size_t i = std::min(index, order_.size()); i > 0; --i) {
        if (isText(order_[i - 1])) return order_[i - 1];
    }
    return firstSection();
}

Cursor SectionTree::deleteRange(const Cursor& a, const Cursor& b) {
    const Cursor start = precedes(b, a) ? b : a;
    const Cursor end = precedes(b, a) ? a : b;
    if (!contains(start.sectionId) || !contains(end.sectionId)) return start;

    if (start.sectionId == end.sectionId) {
        if (isText(start.sectionId)) {
            deleteText(start.sectionId, start.offset, end.offset);
            return Cursor{start.sectionId, clampToCodepointBoundary(getContent(start.sectionId), start.offset)};
        }
        const std::size_t index = *indexOf(start.sectionId);
        removeSection(start.sectionId);
        return Cursor{textSectionNear(index), 0};
    }

    const std::size_t startIndex = *indexOf(start.sectionId);
    const std::size_t endIndex = *indexOf(end.sectionId);
    std::vector<SectionId> between(
        order_.begin() + static_cast<std::ptrdiff_t>(startIndex + 1),
        order_.begin() + static_cast<std::ptrdiff_t>(endIndex));
    for (const SectionId id : between) {
        eraseSection(id);
    }

    Cursor caret{start.sectionId, start.offset};
    if (isText(start.sectionId)) {
        deleteText(start.sectionId, start.offset, contentLength(start.sectionId));
        caret.offset = contentLength(start.sectionId);
    } else {
        caret = Cursor{end.sectionId, 0};
        eraseSection(start.sectionId);
    }

    if (isText(end.sectionId)) {
        deleteText(end.sectionId, 0, end.offset);
        if (isText(caret.sectionId) && caret.sectionId != end.sectionId) {
            mergeWithNext(caret.sectionId);
        }
    } else {
        eraseSection(end.sectionId);
    }

    ensureHeadText();
    if (!isText(caret.sectionId)) caret = Cursor{textSectionNear(startIndex), 0};
    markChanged(ChangeMask::Structure | ChangeMask::Content);
    return caret;
}

bool SectionTree::applyMarks(SectionId id, std::uint32_t startByte, std::uint32_t endByte, MarkFlags marks, bool on) {
    if (!isText(id) || headingOf(id) != HeadingLevel::None) return false;
    marks = marks & (MarkFlags::Bold | MarkFlags::Italic);
    const std::string_view content = getContent(id);
    startByte = clampToCodepointBoundary(content, startByte);
    endByte = clampToCodepointBoundary(content, endByte);
    if (startByte >= endByte) return false;

    std::vector<TextRun>& runs = runs_[id];
    const std::size_t first = splitRunAt(runs, startByte);
    const std::size_t last = splitRunAt(runs, endByte);
    for (std::size_t i = first; i < last; ++i) {
        runs[i].flags = on ? (runs[i].flags | marks) : (runs[i].flags & ~marks);
    }
    normalizeRuns(runs);
    markChanged(ChangeMask::Marks);
    return true;
}

bool SectionTree::applyLink(SectionId id, std::uint32_t startByte, std::uint32_t endByte, LinkId linkId) {
    if (!isText(id) || headingOf(id) != HeadingLevel::None || !hasLink(linkId)) return false;
    const std::string_view content = getContent(id);
    startByte = clampToCodepointBoundary(content, startByte);
    endByte = clampToCodepointBoundary(content, endByte);
    if (startByte >= endByte) return false;

    std::vector<TextRun>& runs = runs_[id];
    const std::size_t first = splitRunAt(runs, startByte);
    const std::size_t last = splitRunAt(runs, endByte);
    for (std::size_t i = first; i < last; ++i) {
        runs[i].flags = runs[i].flags | MarkFlags::Link;
        runs[i].linkId = linkId;
    }
    normalizeRuns(runs);
    markChanged(ChangeMask::Marks);
    return true;
}

std::optional<std::uint32_t> SectionTree::clearLink(SectionId id, LinkId linkId) {
    auto it = runs_.find(id);
    if (it == runs_.end() || linkId == kNoLink) return std::nullopt;
    std::optional<std::uint32_t> lastEnd;
    for (TextRun& run : it->second) {
        if (run.linkId != linkId) continue;
        run.linkId = kNoLink;
        run.flags = run.flags & ~MarkFlags::Link;
        lastEnd = run.startIndex + run.length;
    }
    if (lastEnd) {
        normalizeRuns(it->second);
        markChanged(ChangeMask::Marks);
    }
    return lastEnd;
}

bool SectionTree::clearMarks(SectionId id) {
    auto it = runs_.find(id);
    if (it == runs_.end()) return false;
    bool changed = false;
    for (TextRun& run : it->second) {
        if (run.flags != MarkFlags::None) changed = true;
        run.flags = MarkFlags::None;
        run.linkId = kNoLink;
    }
    normalizeRuns(it->second);
    if (changed) markChanged(ChangeMask::Marks);
    return changed;
}

// =============================================================================
// Links
// =============================================================================

LinkId SectionTree::createLink(std::string href) {
    const LinkId id = nextLinkId_++;
    links_[id] = std::move(href);
    return id;
}

void SectionTree::dropLink(LinkId linkId) {
    links_.erase(linkId);
}

bool SectionTree::hasLink(LinkId linkId) const {
    return links_.find(linkId) != links_.end();
}

const std::string* SectionTree::getLinkHref(LinkId linkId) const {
    auto it = links_.find(linkId);
    return it == links_.end() ? nullptr : &it->second;
}

// =============================================================================
// Ordering
// =============================================================================

bool SectionTree::precedes(const Cursor& a, const Cursor& b) const {
    const auto ia = indexOf(a.sectionId);
    const auto ib = indexOf(b.sectionId);
    if (!ia) return false;
    if (!ib) return true;
    if (*ia != *ib) return *ia < *ib;
    return a.offset < b.offset;
}

// =============================================================================
// Restore
// =============================================================================

void SectionTree::beginRestore() {
    order_.clear();
    sections_.clear();
    content_.clear();
    runs_.clear();
    links_.clear();
}

SectionId SectionTree::restoreTextSection(
    HeadingLevel heading,
    std::string classNames,
    std::string style,
    std::string content,
    std::vector<TextRun> runs) {
    const SectionId id = nextId_++;
    SectionRec rec;
    rec.id = id;
    rec.kind = SectionKind::Text;
    rec.heading = heading;
    rec.classNames = std::move(classNames);
    rec.style = std::move(style);
    sections_[id] = std::move(rec);
    if (heading != HeadingLevel::None) {
        for (TextRun& run : runs) {
            run.flags = MarkFlags::None;
            run.linkId = kNoLink;
        }
    }
    normalizeRuns(runs);
    content_[id] = std::move(content);
    runs_[id] = std::move(runs);
    order_.push_back(id);
    return id;
}

SectionId SectionTree::restoreContainerSection(AtomicObject atomic, std::string classNames, std::string style) {
    const SectionId id = nextId_++;
    SectionRec rec;
    rec.id = id;
    rec.kind = SectionKind::Container;
    rec.classNames = std::move(classNames);
    rec.style = std::move(style);
    rec.atomic = std::move(atomic);
    sections_[id] = std::move(rec);
    order_.push_back(id);
    return id;
}

LinkId SectionTree::restoreLink(std::string href) {
    return createLink(std::move(href));
}

void SectionTree::finishRestore() {
    ensureHeadText();
    markChanged(ChangeMask::Structure | ChangeMask::Content | ChangeMask::Marks);
}

// =============================================================================
// Change Tracking
// =============================================================================

void SectionTree::markChanged(ChangeMask mask) {
    pending_ = pending_ | mask;
    ++revision_;
}

ChangeMask SectionTree::consumeChanges() {
    const ChangeMask out = pending_;
    pending_ = ChangeMask::None;
    return out;
}

std::uint64_t SectionTree::documentDigest() const {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x45524951u); // "QIRE" marker
    h = hashU32(h, static_cast<std::uint32_t>(order_.size()));
    for (const SectionId id : order_) {
        const SectionRec* rec = getSection(id);
        if (!rec) continue;
        h = hashU32(h, static_cast<std::uint32_t>(rec->kind));
        if (rec->kind == SectionKind::Container) {
            h = hashU32(h, static_cast<std::uint32_t>(rec->atomic.kind));
            h = hashString(h, rec->atomic.src);
            h = hashString(h, rec->atomic.alt);
            continue;
        }
        h = hashU32(h, static_cast<std::uint32_t>(rec->heading));
        h = hashString(h, getContent(id));
        const std::vector<TextRun>& runs = getRuns(id);
        h = hashU32(h, static_cast<std::uint32_t>(runs.size()));
        for (const TextRun& run : runs) {
            h = hashU32(h, run.startIndex);
            h = hashU32(h, run.length);
            h = hashU32(h, static_cast<std::uint32_t>(run.flags));
            if (const std::string* href = getLinkHref(run.linkId)) {
                h = hashString(h, *href);
            }
        }
    }
    return h;
}

} // namespace quire

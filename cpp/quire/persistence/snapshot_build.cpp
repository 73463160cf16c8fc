#include "quire/persistence/snapshot.h"
#include "quire/persistence/snapshot_internal.h"
#include "quire/document/section_tree.h"
#include <unordered_map>

namespace quire {

using namespace snapshot::detail;

namespace {

void appendClassAttribute(std::string& out, const char* roleClass, const std::string& extra) {
    out += " class=\"";
    out += roleClass;
    if (!extra.empty()) {
        out.push_back(' ');
        appendEscapedAttribute(out, extra);
    }
    out.push_back('"');
}

void appendOptionalAttribute(std::string& out, const char* name, const std::string& value) {
    if (value.empty()) return;
    out.push_back(' ');
    out += name;
    out += "=\"";
    appendEscapedAttribute(out, value);
    out.push_back('"');
}

const char* textSectionTag(const SectionSnapshot& section, const EditorOptions& options) {
    switch (section.heading) {
        case HeadingLevel::Large: return kTagLargeHeading;
        case HeadingLevel::Small: return kTagSmallHeading;
        case HeadingLevel::None: break;
    }
    return options.blockTag == BlockTag::Div ? kTagDiv : kTagParagraph;
}

void appendInline(std::string& out, const SectionSnapshot& section, const SnapshotData& data) {
    LinkId openLink = kNoLink;
    for (const TextRun& run : section.runs) {
        if (run.linkId != openLink) {
            if (openLink != kNoLink) out += "</a>";
            openLink = run.linkId;
            if (openLink != kNoLink) {
                out += "<a href=\"";
                if (openLink <= data.links.size()) appendEscapedAttribute(out, data.links[openLink - 1]);
                out += "\">";
            }
        }
        const bool bold = hasMark(run.flags, MarkFlags::Bold);
        const bool italic = hasMark(run.flags, MarkFlags::Italic);
        if (bold) out += "<b>";
        if (italic) out += "<i>";
        appendEscapedText(out, std::string_view(section.content).substr(run.startIndex, run.length));
        if (italic) out += "</i>";
        if (bold) out += "</b>";
    }
    if (openLink != kNoLink) out += "</a>";
}

} // namespace

std::string buildSnapshotMarkup(const SnapshotData& data, const EditorOptions& options) {
    std::string out;
    out += "<div";
    appendClassAttribute(out, kEditorRootClass, options.containerClassNames);
    appendOptionalAttribute(out, "style", options.containerStyle);
    out += data.editable ? " contenteditable=\"true\">" : " contenteditable=\"false\">";

    for (const SectionSnapshot& section : data.sections) {
        if (section.kind == SectionKind::Container) {
            out += "<div";
            appendClassAttribute(out, kContainerSectionClass, section.classNames);
            appendOptionalAttribute(out, "style", section.style);
            out += " contenteditable=\"false\">";
            if (section.atomic.kind == AtomicKind::Image) {
                out += "<img src=\"";
                appendEscapedAttribute(out, section.atomic.src);
                out += "\" alt=\"";
                appendEscapedAttribute(out, section.atomic.alt);
                out.push_back('"');
                appendOptionalAttribute(out, "class", options.imageClassNames);
                appendOptionalAttribute(out, "style", options.imageStyle);
                out += ">";
            } else {
                out += "<hr>";
            }
            out += "</div>";
            continue;
        }

        const char* tag = textSectionTag(section, options);
        out.push_back('<');
        out += tag;
        appendClassAttribute(out, kTextSectionClass, section.classNames);
        appendOptionalAttribute(out, "style", section.style);
        out.push_back('>');
        appendInline(out, section, data);
        out += "</";
        out += tag;
        out.push_back('>');
    }

    out += "</div>";
    return out;
}

SnapshotData captureSnapshot(const SectionTree& tree, bool editable) {
    SnapshotData data;
    data.editable = editable;
    std::unordered_map<LinkId, LinkId> linkIndex;

    for (const SectionId id : tree.order()) {
        const SectionRec* rec = tree.getSection(id);
        if (!rec) continue;
        SectionSnapshot section;
        section.kind = rec->kind;
        section.heading = rec->heading;
        section.classNames = rec->classNames;
        section.style = rec->style;
        if (rec->kind == SectionKind::Container) {
            section.atomic = rec->atomic;
        } else {
            section.content = std::string(tree.getContent(id));
            section.runs = tree.getRuns(id);
            for (TextRun& run : section.runs) {
                if (run.linkId == kNoLink) continue;
                auto it = linkIndex.find(run.linkId);
                if (it == linkIndex.end()) {
                    const std::string* href = tree.getLinkHref(run.linkId);
                    data.links.push_back(href ? *href : std::string());
                    it = linkIndex.emplace(run.linkId, static_cast<LinkId>(data.links.size())).first;
                }
                run.linkId = it->second;
            }
        }
        data.sections.push_back(std::move(section));
    }
    return data;
}

} // namespace quire

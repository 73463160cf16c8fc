#ifndef QUIRE_PERSISTENCE_SNAPSHOT_H
#define QUIRE_PERSISTENCE_SNAPSHOT_H

#include "quire/core/types.h"
#include "quire/core/editor_options.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

class SectionTree;

struct SectionSnapshot {
    SectionKind kind = SectionKind::Text;
    HeadingLevel heading = HeadingLevel::None;
    std::string classNames;
    std::string style;
    std::string content;
    // Run linkIds are 1-based indices into SnapshotData::links.
    std::vector<TextRun> runs;
    AtomicObject atomic;
};

struct SnapshotData {
    bool editable = false;
    std::vector<SectionSnapshot> sections;
    std::vector<std::string> links;
};

// Parse snapshot markup. Fails with InvalidMagic when the root fingerprint is
// missing and InvalidSnapshot for any other malformation; `out` is only
// meaningful on EditorError::Ok.
EditorError parseSnapshot(std::string_view markup, SnapshotData& out);

// Build snapshot markup from SnapshotData.
std::string buildSnapshotMarkup(const SnapshotData& data, const EditorOptions& options);

SnapshotData captureSnapshot(const SectionTree& tree, bool editable);

// Replace the whole content of `tree` with `data`.
void loadSnapshot(const SnapshotData& data, SectionTree& tree);

} // namespace quire

#endif // QUIRE_PERSISTENCE_SNAPSHOT_H

#pragma once

#include <QString>

#include "common/enums.hpp"

namespace cassette {

inline const QString kDefaultSnapshotDirectory = QStringLiteral("testdata/snapshots");

// "replay", "record" or "bypass", case-insensitive. Anything else, including
// an empty value, resolves to Replay.
SnapshotMode resolveSnapshotMode(const QString &value);
QString snapshotModeName(SnapshotMode mode);

// "strict" (case-insensitive) selects Strict; anything else is Positional.
MatchPolicy resolveMatchPolicy(const QString &value);

// Everything a SnapshotProjectsClient needs to know about how to run. Passed
// once at construction; nothing is read from the environment afterwards.
struct SnapshotConfig {
    SnapshotMode mode = SnapshotMode::Replay;
    QString snapshotDirectory = kDefaultSnapshotDirectory;
    MatchPolicy matchPolicy = MatchPolicy::Positional;

    // SNAPSHOT_MODE, SNAPSHOT_DIR and SNAPSHOT_MATCH.
    static SnapshotConfig fromEnvironment();
};

} // namespace cassette

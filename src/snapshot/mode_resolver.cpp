#include "snapshot/mode_resolver.hpp"

namespace cassette {

SnapshotMode resolveSnapshotMode(const QString &value)
{
    const QString mode = value.trimmed().toLower();
    if (mode == QStringLiteral("record")) {
        return SnapshotMode::Record;
    }
    if (mode == QStringLiteral("bypass")) {
        return SnapshotMode::Bypass;
    }
    return SnapshotMode::Replay;
}

QString snapshotModeName(SnapshotMode mode)
{
    switch (mode) {
    case SnapshotMode::Replay:
        return QStringLiteral("replay");
    case SnapshotMode::Record:
        return QStringLiteral("record");
    case SnapshotMode::Bypass:
        return QStringLiteral("bypass");
    }
    return QStringLiteral("replay");
}

MatchPolicy resolveMatchPolicy(const QString &value)
{
    if (value.trimmed().toLower() == QStringLiteral("strict")) {
        return MatchPolicy::Strict;
    }
    return MatchPolicy::Positional;
}

SnapshotConfig SnapshotConfig::fromEnvironment()
{
    SnapshotConfig config;
    config.mode = resolveSnapshotMode(qEnvironmentVariable("SNAPSHOT_MODE"));
    const QString dir = qEnvironmentVariable("SNAPSHOT_DIR");
    if (!dir.isEmpty()) {
        config.snapshotDirectory = dir;
    }
    config.matchPolicy = resolveMatchPolicy(qEnvironmentVariable("SNAPSHOT_MATCH"));
    return config;
}

} // namespace cassette

#pragma once

#include <QString>

#include "common/models.hpp"

namespace cassette {

// SnapshotStore maps scenario names to files and moves Snapshots between
// memory and disk. File handles live only for the duration of one call.
class SnapshotStore {
public:
    // {baseDirectory}/{sanitized name}.json. Names that needed sanitizing, or
    // that already end like a hashed name (_ and 8 hex digits), get a short
    // hash of the raw name appended so distinct names stay distinct.
    static QString derivePath(const QString &scenarioName, const QString &baseDirectory);
    static QString sanitizeName(const QString &scenarioName);

    // Throws HarnessError: SnapshotNotFound, ParseError or PersistenceError.
    static Snapshot load(const QString &path);

    // Writes atomically, creating parent directories. Throws PersistenceError.
    static void save(const Snapshot &snapshot, const QString &path);
};

} // namespace cassette

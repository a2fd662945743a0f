#include "snapshot/snapshot_store.hpp"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace cassette {

namespace {

constexpr int kNameHashLength = 8;

bool isSafeChar(QChar c)
{
    const ushort code = c.unicode();
    return (code >= 'a' && code <= 'z')
        || (code >= 'A' && code <= 'Z')
        || (code >= '0' && code <= '9')
        || code == '_' || code == '-';
}

// True when name ends the way a hashed name does: '_' and kNameHashLength
// lowercase hex digits.
bool hasHashSuffix(const QString &name)
{
    if (name.size() <= kNameHashLength || name.at(name.size() - kNameHashLength - 1) != QLatin1Char('_')) {
        return false;
    }
    for (int i = name.size() - kNameHashLength; i < name.size(); ++i) {
        const ushort code = name.at(i).unicode();
        if (!((code >= '0' && code <= '9') || (code >= 'a' && code <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // namespace

QString SnapshotStore::sanitizeName(const QString &scenarioName)
{
    QString safe;
    safe.reserve(scenarioName.size());
    for (const QChar c : scenarioName) {
        safe.append(isSafeChar(c) ? c : QLatin1Char('_'));
    }
    if (safe.isEmpty()) {
        return QStringLiteral("unnamed");
    }
    if (safe == scenarioName && !hasHashSuffix(safe)) {
        return safe;
    }

    const QByteArray digest = QCryptographicHash::hash(scenarioName.toUtf8(),
                                                       QCryptographicHash::Sha1).toHex();
    return safe + QLatin1Char('_') + QString::fromLatin1(digest.left(kNameHashLength));
}

QString SnapshotStore::derivePath(const QString &scenarioName, const QString &baseDirectory)
{
    return QDir(baseDirectory).filePath(sanitizeName(scenarioName) + QStringLiteral(".json"));
}

Snapshot SnapshotStore::load(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        throw HarnessError(ErrorKind::SnapshotNotFound,
                           "snapshot file not found: " + path.toStdString()
                               + " (run with SNAPSHOT_MODE=record to create it)");
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw HarnessError(ErrorKind::PersistenceError,
                           "failed to read snapshot file " + path.toStdString() + ": "
                               + file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();
    file.close();

    Snapshot snapshot;
    try {
        const nlohmann::json document = nlohmann::json::parse(data.toStdString());
        if (!document.is_object() || !document.contains("calls")) {
            throw HarnessError(ErrorKind::ParseError,
                               "snapshot file " + path.toStdString()
                                   + " is not a snapshot document (no \"calls\")");
        }
        snapshot = document.get<Snapshot>();
    } catch (const nlohmann::json::exception &ex) {
        throw HarnessError(ErrorKind::ParseError,
                           "failed to parse snapshot file " + path.toStdString() + ": "
                               + ex.what());
    }

    CLOG_DEBUG(QStringLiteral("SnapshotStore"),
               QStringLiteral("load"),
               QStringLiteral("snapshot_loaded"),
               QStringLiteral("replay"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                               {"calls", snapshot.calls.size()}}));
    return snapshot;
}

void SnapshotStore::save(const Snapshot &snapshot, const QString &path)
{
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        throw HarnessError(ErrorKind::PersistenceError,
                           "failed to create snapshot directory: " + dir.toStdString());
    }

    std::string payload;
    try {
        payload = nlohmann::json(snapshot).dump(2);
    } catch (const nlohmann::json::exception &ex) {
        throw HarnessError(ErrorKind::PersistenceError,
                           "failed to serialize snapshot " + snapshot.testName + ": " + ex.what());
    }
    payload.push_back('\n');

    // QSaveFile writes to a temporary and renames it over the target on commit.
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw HarnessError(ErrorKind::PersistenceError,
                           "failed to open snapshot file " + path.toStdString() + ": "
                               + file.errorString().toStdString());
    }
    const QByteArray bytes = QByteArray::fromStdString(payload);
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        CLOG_ERROR(QStringLiteral("SnapshotStore"),
                   QStringLiteral("save"),
                   QStringLiteral("snapshot_write_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qsavefile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
        throw HarnessError(ErrorKind::PersistenceError,
                           "failed to write snapshot file " + path.toStdString() + ": "
                               + file.errorString().toStdString());
    }

    CLOG_INFO(QStringLiteral("SnapshotStore"),
              QStringLiteral("save"),
              QStringLiteral("snapshot_saved"),
              QStringLiteral("record_close"),
              QStringLiteral("qsavefile"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", path.toStdString()},
                              {"calls", snapshot.calls.size()}}));
}

} // namespace cassette

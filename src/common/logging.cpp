#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace cassette::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// Everything initLogging() configures. Guarded by mutex; files are opened per
// write so several scenarios in one process can share them.
struct LoggerState {
    std::mutex mutex;
    QString processName;
    bool traceEnabled = false;
    LogLevel minimumLevel = LogLevel::Info;
};

LoggerState &loggerState()
{
    static LoggerState state;
    return state;
}

thread_local QString t_corrId;

int severity(LogLevel level)
{
    return static_cast<int>(level);
}

void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &dir, const QString &fileName, const QByteArray &line)
{
    QDir().mkpath(dir);
    const QString path = dir + QDir::separator() + fileName;
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

LogLevel levelFromName(const QString &name, LogLevel fallback)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (key == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (key == QLatin1String("warn") || key == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (key == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return fallback;
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("CASSETTE_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/cassette/logs");
    }
    return home + QStringLiteral("/.local/share/cassette/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.traceEnabled = traceEnabled;
    state.minimumLevel = traceEnabled
        ? LogLevel::Debug
        : levelFromName(qEnvironmentVariable("CASSETTE_LOG_LEVEL"), LogLevel::Info);
}

bool isTraceEnabled()
{
    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.traceEnabled;
}

LogLevel minimumLevel()
{
    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.minimumLevel;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LoggerState &state = loggerState();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("cassette");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Context may carry upstream response text; invalid UTF-8 is replaced.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    const QString dir = logsDirPath();

    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (severity(level) >= severity(state.minimumLevel)) {
        appendLine(dir, process + QStringLiteral(".log"), line);
    }
    if (state.traceEnabled) {
        appendLine(dir, process + QStringLiteral("-trace.log"), line);
    }
    if (level == LogLevel::Warn || level == LogLevel::Error) {
        qWarning().noquote() << QStringLiteral("[%1] %2: %3 (%4)")
                                    .arg(levelName(level), component, what, corr);
    }
}

} // namespace cassette::logging

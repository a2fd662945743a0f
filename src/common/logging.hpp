#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace cassette::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

QString levelName(LogLevel level);
LogLevel levelFromName(const QString &name, LogLevel fallback);

// Initialize logging for the current process. Call early in main() or initTestCase().
// With trace enabled every level is written and mirrored to <process>-trace.log;
// otherwise CASSETTE_LOG_LEVEL (default info) sets the lowest level written.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();
LogLevel minimumLevel();

// Directory the log files are written to ($CASSETTE_LOG_DIR or under $HOME).
QString logsDirPath();

// Thread-local correlation support for linking the events of one scenario.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace cassette::logging

#define CLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::cassette::logging::logEvent(::cassette::logging::LogLevel::Debug, \
                                  ::cassette::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::cassette::logging::logEvent(::cassette::logging::LogLevel::Info, \
                                  ::cassette::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::cassette::logging::logEvent(::cassette::logging::LogLevel::Warn, \
                                  ::cassette::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::cassette::logging::logEvent(::cassette::logging::LogLevel::Error, \
                                  ::cassette::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

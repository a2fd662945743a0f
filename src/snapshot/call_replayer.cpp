#include "snapshot/call_replayer.hpp"

#include "common/logging.hpp"

namespace cassette {

CallReplayer::CallReplayer(const Snapshot &snapshot, MatchPolicy policy)
    : m_snapshot(snapshot)
    , m_policy(policy)
{
}

std::size_t CallReplayer::cursor() const
{
    return m_cursor;
}

std::size_t CallReplayer::remaining() const
{
    return m_snapshot.calls.size() - m_cursor;
}

MatchPolicy CallReplayer::policy() const
{
    return m_policy;
}

const ApiCall &CallReplayer::next(const std::string &operation)
{
    if (m_cursor >= m_snapshot.calls.size()) {
        CLOG_ERROR(QStringLiteral("CallReplayer"),
                   QStringLiteral("next"),
                   QStringLiteral("snapshot_exhausted"),
                   QStringLiteral("more_calls_than_recorded"),
                   QStringLiteral("replay"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"operation", operation},
                                   {"recorded", m_snapshot.calls.size()}}));
        throw HarnessError(ErrorKind::SnapshotExhausted,
                           "no more recorded calls available (call "
                               + std::to_string(m_cursor + 1) + ", " + operation
                               + ") in snapshot " + m_snapshot.testName);
    }

    const std::size_t index = m_cursor++;
    const ApiCall &call = m_snapshot.calls[index];
    if (call.method == kRecordedMethod && call.url == operation) {
        return call;
    }

    const nlohmann::json context{{"index", index},
                                 {"requested", operation},
                                 {"recordedMethod", call.method},
                                 {"recordedUrl", call.url}};
    if (m_policy == MatchPolicy::Strict) {
        CLOG_ERROR(QStringLiteral("CallReplayer"),
                   QStringLiteral("next"),
                   QStringLiteral("call_mismatch"),
                   QStringLiteral("strict_matching"),
                   QStringLiteral("replay"),
                   logging::defaultWho(),
                   QString(),
                   context);
        throw HarnessError(ErrorKind::CallMismatch,
                           "call " + std::to_string(index + 1) + ": requested "
                               + kRecordedMethod + " " + operation + " but snapshot recorded "
                               + call.method + " " + call.url);
    }

    CLOG_WARN(QStringLiteral("CallReplayer"),
              QStringLiteral("next"),
              QStringLiteral("replay_drift"),
              QStringLiteral("positional_matching"),
              QStringLiteral("replay"),
              logging::defaultWho(),
              QString(),
              context);
    return call;
}

HarnessError CallReplayer::decodeFailure(const std::string &operation,
                                         const std::string &reason) const
{
    return HarnessError(ErrorKind::ParseError,
                        "failed to decode recorded response of " + operation + " (call "
                            + std::to_string(m_cursor) + "): " + reason);
}

} // namespace cassette

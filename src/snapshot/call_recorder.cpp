#include "snapshot/call_recorder.hpp"

#include <chrono>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace cassette {

CallRecorder::CallRecorder(Snapshot &snapshot)
    : m_snapshot(snapshot)
{
}

std::size_t CallRecorder::recordedCount() const
{
    return m_snapshot.calls.size();
}

void CallRecorder::append(const std::string &operation,
                          const nlohmann::json &request,
                          int statusCode,
                          const std::string &response)
{
    ApiCall call;
    call.method = kRecordedMethod;
    call.url = operation;
    if (request.is_object() && !request.empty()) {
        call.requestBody = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    call.statusCode = statusCode;
    call.response = response;
    call.timestamp = truncateToMillis(std::chrono::system_clock::now());

    m_snapshot.calls.push_back(call);
    m_snapshot.updated = call.timestamp;

    CLOG_DEBUG(QStringLiteral("CallRecorder"),
               QStringLiteral("append"),
               QStringLiteral("call_recorded"),
               QStringLiteral("record_mode"),
               QStringLiteral("live_call"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"operation", operation},
                               {"status", statusCode},
                               {"index", m_snapshot.calls.size() - 1}}));
}

} // namespace cassette

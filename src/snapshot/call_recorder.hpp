#pragma once

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"
#include "snapshot/payload_codec.hpp"

namespace cassette {

// CallRecorder runs live calls and appends what happened to a Snapshot.
// It never persists; the owning SnapshotProjectsClient saves on close().
class CallRecorder {
public:
    explicit CallRecorder(Snapshot &snapshot);

    // Invokes thunk exactly once. The outcome is appended to the snapshot and
    // then handed back untouched: the result is returned, an error rethrown.
    template <typename Thunk, typename Encoder>
    auto record(const std::string &operation,
                const nlohmann::json &request,
                Thunk &&thunk,
                Encoder &&encode) -> decltype(thunk())
    {
        auto result = invoke(operation, request, thunk);
        std::string response;
        try {
            response = encode(result);
        } catch (const nlohmann::json::exception &ex) {
            throw HarnessError(ErrorKind::ParseError,
                               "failed to serialize result of " + operation + ": " + ex.what());
        }
        append(operation, request, kRecordedSuccessStatus, response);
        return result;
    }

    std::size_t recordedCount() const;

private:
    template <typename Thunk>
    auto invoke(const std::string &operation, const nlohmann::json &request, Thunk &thunk)
        -> decltype(thunk())
    {
        try {
            return thunk();
        } catch (const UpstreamError &error) {
            append(operation, request, recordedErrorStatus(error.statusCode()),
                   encodeErrorPayload(error.what(), error.statusCode()));
            throw;
        } catch (const std::exception &error) {
            append(operation, request, kRecordedFailureStatus,
                   encodeErrorPayload(error.what(), 0));
            throw;
        }
    }

    void append(const std::string &operation,
                const nlohmann::json &request,
                int statusCode,
                const std::string &response);

    Snapshot &m_snapshot;
};

} // namespace cassette

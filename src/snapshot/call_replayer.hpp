#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "common/errors.hpp"
#include "common/models.hpp"
#include "snapshot/payload_codec.hpp"

namespace cassette {

// CallReplayer serves recorded calls in file order without touching the network.
class CallReplayer {
public:
    CallReplayer(const Snapshot &snapshot, MatchPolicy policy);

    // Pops the call at the cursor. A recorded failure comes back as the
    // UpstreamError it was recorded from; a success payload is decoded.
    // Throws HarnessError SnapshotExhausted, CallMismatch (Strict only) or
    // ParseError when the payload does not decode.
    template <typename Decoder>
    auto replay(const std::string &operation, Decoder &&decode)
        -> decltype(decode(std::string()))
    {
        const ApiCall &call = next(operation);
        if (!isSuccessStatus(call.statusCode)) {
            throw decodeErrorPayload(call);
        }
        try {
            return decode(call.response);
        } catch (const nlohmann::json::exception &ex) {
            throw decodeFailure(operation, ex.what());
        }
    }

    std::size_t cursor() const;
    std::size_t remaining() const;
    MatchPolicy policy() const;

private:
    const ApiCall &next(const std::string &operation);
    HarnessError decodeFailure(const std::string &operation, const std::string &reason) const;

    const Snapshot &m_snapshot;
    MatchPolicy m_policy;
    std::size_t m_cursor = 0;
};

} // namespace cassette

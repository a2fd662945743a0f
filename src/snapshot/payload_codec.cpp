#include "snapshot/payload_codec.hpp"

#include "common/json_utils.hpp"

namespace cassette {

namespace {

std::string decodeStringOrMember(const std::string &response, const char *member)
{
    const nlohmann::json value = nlohmann::json::parse(response);
    if (value.is_object()) {
        return value.at(member).get<std::string>();
    }
    return value.get<std::string>();
}

// Live results are recorded even when they carry invalid UTF-8.
std::string dumpCompact(const nlohmann::json &value)
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

bool isSuccessStatus(int statusCode)
{
    return statusCode >= 200 && statusCode < 300;
}

std::string encodeErrorPayload(const std::string &message, int upstreamStatus)
{
    return dumpCompact(nlohmann::json{{"error", message}, {"status", upstreamStatus}});
}

int recordedErrorStatus(int upstreamStatus)
{
    return upstreamStatus >= 400 ? upstreamStatus : kRecordedFailureStatus;
}

UpstreamError decodeErrorPayload(const ApiCall &call)
{
    const auto parsed = nlohmann::json::parse(call.response, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()
        || !parsed.contains("error") || !parsed.at("error").is_string()) {
        return UpstreamError("API error (status " + std::to_string(call.statusCode) + ")",
                             call.statusCode);
    }

    int status = call.statusCode;
    if (parsed.contains("status") && parsed.at("status").is_number_integer()) {
        status = parsed.at("status").get<int>();
    }
    return UpstreamError(parsed.at("error").get<std::string>(), status);
}

namespace payload {

std::string encodeText(const std::string &value)
{
    return dumpCompact(nlohmann::json(value));
}

std::string encodeProject(const Project &project)
{
    return dumpCompact(nlohmann::json(project));
}

std::string encodeFields(const std::vector<ProjectField> &fields)
{
    return dumpCompact(nlohmann::json(fields));
}

std::string encodeContent(const nlohmann::json &content)
{
    return dumpCompact(content);
}

std::string encodeAck()
{
    return encodeText("success");
}

std::string decodeLogin(const std::string &response)
{
    return decodeStringOrMember(response, "login");
}

std::string decodeItemId(const std::string &response)
{
    return decodeStringOrMember(response, "id");
}

Project decodeProject(const std::string &response)
{
    return nlohmann::json::parse(response).get<Project>();
}

std::vector<ProjectField> decodeFields(const std::string &response)
{
    const nlohmann::json value = nlohmann::json::parse(response);
    if (value.is_null()) {
        return {};
    }
    return value.get<std::vector<ProjectField>>();
}

nlohmann::json decodeContent(const std::string &response)
{
    return nlohmann::json::parse(response);
}

void decodeAck(const std::string &response)
{
    // Acknowledgements carry no data; only the status of the call matters.
    (void)response;
}

} // namespace payload

} // namespace cassette

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace cassette {

// Method tag written for every recorded call; the target is the operation name.
inline constexpr const char *kRecordedMethod = "API";
inline constexpr int kRecordedSuccessStatus = 200;
inline constexpr int kRecordedFailureStatus = 500;

namespace operations {
inline constexpr const char *kGetUser = "GetUser";
inline constexpr const char *kFindProject = "FindProject";
inline constexpr const char *kGetProjectFields = "GetProjectFields";
inline constexpr const char *kCreateDraftIssue = "CreateDraftIssue";
inline constexpr const char *kCreateProjectItem = "CreateProjectItem";
inline constexpr const char *kGetIssueOrPr = "GetIssueOrPR";
inline constexpr const char *kSetProjectItemFieldValue = "SetProjectItemFieldValue";
inline constexpr const char *kDeleteProjectItem = "DeleteProjectItem";
inline constexpr const char *kCreateProject = "CreateProject";
inline constexpr const char *kDeleteProject = "DeleteProject";
} // namespace operations

bool isSuccessStatus(int statusCode);

// Error payloads are kept apart from success payloads: {"error": ..., "status": ...}.
std::string encodeErrorPayload(const std::string &message, int upstreamStatus);
int recordedErrorStatus(int upstreamStatus);
UpstreamError decodeErrorPayload(const ApiCall &call);

namespace payload {

// Success payload encoders. Output is compact JSON.
std::string encodeText(const std::string &value);
std::string encodeProject(const Project &project);
std::string encodeFields(const std::vector<ProjectField> &fields);
std::string encodeContent(const nlohmann::json &content);
std::string encodeAck();

// Decoders throw nlohmann::json::exception on a payload of the wrong shape.
// decodeLogin and decodeItemId also accept the object form ({"login": ...},
// {"id": ...}) of the raw API response.
std::string decodeLogin(const std::string &response);
std::string decodeItemId(const std::string &response);
Project decodeProject(const std::string &response);
std::vector<ProjectField> decodeFields(const std::string &response);
nlohmann::json decodeContent(const std::string &response);
void decodeAck(const std::string &response);

} // namespace payload

} // namespace cassette

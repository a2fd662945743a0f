#include "snapshot/recording_client.hpp"

#include <stdexcept>

#include "common/json_utils.hpp"

namespace cassette {

namespace {

const std::string kAck = "success";

std::string ackPayload(const std::string &)
{
    return payload::encodeAck();
}

} // namespace

RecordingProjectsClient::RecordingProjectsClient(std::unique_ptr<ProjectsClient> realClient,
                                                 Snapshot &snapshot)
    : m_real(std::move(realClient))
    , m_recorder(snapshot)
{
    if (!m_real) {
        throw std::invalid_argument("RecordingProjectsClient requires a live client");
    }
}

std::string RecordingProjectsClient::getUser()
{
    return m_recorder.record(operations::kGetUser,
                             nlohmann::json::object(),
                             [this] { return m_real->getUser(); },
                             payload::encodeText);
}

Project RecordingProjectsClient::findProject(const std::string &identifier)
{
    return m_recorder.record(operations::kFindProject,
                             nlohmann::json{{"identifier", identifier}},
                             [&] { return m_real->findProject(identifier); },
                             payload::encodeProject);
}

std::vector<ProjectField> RecordingProjectsClient::getProjectFields(const std::string &projectId)
{
    return m_recorder.record(operations::kGetProjectFields,
                             nlohmann::json{{"projectId", projectId}},
                             [&] { return m_real->getProjectFields(projectId); },
                             payload::encodeFields);
}

std::string RecordingProjectsClient::createDraftIssue(const std::string &projectId,
                                                      const std::string &title,
                                                      const std::string &body)
{
    return m_recorder.record(operations::kCreateDraftIssue,
                             nlohmann::json{{"projectId", projectId},
                                            {"title", title},
                                            {"body", body}},
                             [&] { return m_real->createDraftIssue(projectId, title, body); },
                             payload::encodeText);
}

std::string RecordingProjectsClient::createProjectItem(const std::string &projectId,
                                                       const std::string &contentId)
{
    return m_recorder.record(operations::kCreateProjectItem,
                             nlohmann::json{{"projectId", projectId},
                                            {"contentId", contentId}},
                             [&] { return m_real->createProjectItem(projectId, contentId); },
                             payload::encodeText);
}

nlohmann::json RecordingProjectsClient::getIssueOrPr(const std::string &url)
{
    return m_recorder.record(operations::kGetIssueOrPr,
                             nlohmann::json{{"url", url}},
                             [&] { return m_real->getIssueOrPr(url); },
                             payload::encodeContent);
}

void RecordingProjectsClient::setProjectItemFieldValue(const std::string &projectId,
                                                       const std::string &itemId,
                                                       const std::string &fieldId,
                                                       const nlohmann::json &value)
{
    m_recorder.record(operations::kSetProjectItemFieldValue,
                      nlohmann::json{{"projectId", projectId},
                                     {"itemId", itemId},
                                     {"fieldId", fieldId},
                                     {"value", value}},
                      [&] {
                          m_real->setProjectItemFieldValue(projectId, itemId, fieldId, value);
                          return kAck;
                      },
                      ackPayload);
}

void RecordingProjectsClient::deleteProjectItem(const std::string &projectId,
                                                const std::string &itemId)
{
    m_recorder.record(operations::kDeleteProjectItem,
                      nlohmann::json{{"projectId", projectId}, {"itemId", itemId}},
                      [&] {
                          m_real->deleteProjectItem(projectId, itemId);
                          return kAck;
                      },
                      ackPayload);
}

Project RecordingProjectsClient::createProject(const std::string &ownerType,
                                               const std::string &ownerLogin,
                                               const std::string &title,
                                               const std::string &description)
{
    return m_recorder.record(operations::kCreateProject,
                             nlohmann::json{{"ownerType", ownerType},
                                            {"ownerLogin", ownerLogin},
                                            {"title", title},
                                            {"description", description}},
                             [&] {
                                 return m_real->createProject(ownerType, ownerLogin,
                                                              title, description);
                             },
                             payload::encodeProject);
}

void RecordingProjectsClient::deleteProject(const std::string &projectId)
{
    m_recorder.record(operations::kDeleteProject,
                      nlohmann::json{{"projectId", projectId}},
                      [&] {
                          m_real->deleteProject(projectId);
                          return kAck;
                      },
                      ackPayload);
}

} // namespace cassette

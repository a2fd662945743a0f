#include "snapshot/replaying_client.hpp"

namespace cassette {

ReplayingProjectsClient::ReplayingProjectsClient(CallReplayer &replayer)
    : m_replayer(replayer)
{
}

std::string ReplayingProjectsClient::getUser()
{
    return m_replayer.replay(operations::kGetUser, payload::decodeLogin);
}

Project ReplayingProjectsClient::findProject(const std::string &)
{
    return m_replayer.replay(operations::kFindProject, payload::decodeProject);
}

std::vector<ProjectField> ReplayingProjectsClient::getProjectFields(const std::string &)
{
    return m_replayer.replay(operations::kGetProjectFields, payload::decodeFields);
}

std::string ReplayingProjectsClient::createDraftIssue(const std::string &,
                                                      const std::string &,
                                                      const std::string &)
{
    return m_replayer.replay(operations::kCreateDraftIssue, payload::decodeItemId);
}

std::string ReplayingProjectsClient::createProjectItem(const std::string &, const std::string &)
{
    return m_replayer.replay(operations::kCreateProjectItem, payload::decodeItemId);
}

nlohmann::json ReplayingProjectsClient::getIssueOrPr(const std::string &)
{
    return m_replayer.replay(operations::kGetIssueOrPr, payload::decodeContent);
}

void ReplayingProjectsClient::setProjectItemFieldValue(const std::string &,
                                                       const std::string &,
                                                       const std::string &,
                                                       const nlohmann::json &)
{
    m_replayer.replay(operations::kSetProjectItemFieldValue, payload::decodeAck);
}

void ReplayingProjectsClient::deleteProjectItem(const std::string &, const std::string &)
{
    m_replayer.replay(operations::kDeleteProjectItem, payload::decodeAck);
}

Project ReplayingProjectsClient::createProject(const std::string &,
                                               const std::string &,
                                               const std::string &,
                                               const std::string &)
{
    return m_replayer.replay(operations::kCreateProject, payload::decodeProject);
}

void ReplayingProjectsClient::deleteProject(const std::string &)
{
    m_replayer.replay(operations::kDeleteProject, payload::decodeAck);
}

} // namespace cassette

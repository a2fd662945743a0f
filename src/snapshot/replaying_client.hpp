#pragma once

#include "client/projects_client.hpp"
#include "snapshot/call_replayer.hpp"

namespace cassette {

// Decorator that answers every operation from the snapshot. Arguments are not
// consulted; the call sequence alone decides what comes back.
class ReplayingProjectsClient : public ProjectsClient {
public:
    explicit ReplayingProjectsClient(CallReplayer &replayer);

    std::string getUser() override;
    Project findProject(const std::string &identifier) override;
    std::vector<ProjectField> getProjectFields(const std::string &projectId) override;
    std::string createDraftIssue(const std::string &projectId,
                                 const std::string &title,
                                 const std::string &body) override;
    std::string createProjectItem(const std::string &projectId,
                                  const std::string &contentId) override;
    nlohmann::json getIssueOrPr(const std::string &url) override;
    void setProjectItemFieldValue(const std::string &projectId,
                                  const std::string &itemId,
                                  const std::string &fieldId,
                                  const nlohmann::json &value) override;
    void deleteProjectItem(const std::string &projectId,
                           const std::string &itemId) override;
    Project createProject(const std::string &ownerType,
                          const std::string &ownerLogin,
                          const std::string &title,
                          const std::string &description) override;
    void deleteProject(const std::string &projectId) override;

private:
    CallReplayer &m_replayer;
};

} // namespace cassette

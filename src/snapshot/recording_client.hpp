#pragma once

#include <memory>

#include "client/projects_client.hpp"
#include "snapshot/call_recorder.hpp"

namespace cassette {

// Decorator that forwards every operation to the live client through a
// CallRecorder, so each call and its outcome end up in the snapshot.
class RecordingProjectsClient : public ProjectsClient {
public:
    RecordingProjectsClient(std::unique_ptr<ProjectsClient> realClient, Snapshot &snapshot);

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
    std::unique_ptr<ProjectsClient> m_real;
    CallRecorder m_recorder;
};

} // namespace cassette

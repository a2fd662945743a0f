#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace cassette {

/**
 * ProjectsClient is the capability set of the GitHub Projects API used by the
 * importer. It is implemented by the live GitHubClient and by the recording
 * and replaying decorators that SnapshotProjectsClient selects between.
 *
 * Every operation reports failure by throwing UpstreamError.
 */
class ProjectsClient {
public:
    virtual ~ProjectsClient() = default;

    // Login of the authenticated user.
    virtual std::string getUser() = 0;

    // identifier is either a project number or "owner/project title".
    virtual Project findProject(const std::string &identifier) = 0;
    virtual std::vector<ProjectField> getProjectFields(const std::string &projectId) = 0;

    // Both return the id of the new project item.
    virtual std::string createDraftIssue(const std::string &projectId,
                                         const std::string &title,
                                         const std::string &body) = 0;
    virtual std::string createProjectItem(const std::string &projectId,
                                          const std::string &contentId) = 0;

    // Raw REST payload of the issue or pull request behind url.
    virtual nlohmann::json getIssueOrPr(const std::string &url) = 0;

    virtual void setProjectItemFieldValue(const std::string &projectId,
                                          const std::string &itemId,
                                          const std::string &fieldId,
                                          const nlohmann::json &value) = 0;
    virtual void deleteProjectItem(const std::string &projectId,
                                   const std::string &itemId) = 0;

    // ownerType is "user" or "organization".
    virtual Project createProject(const std::string &ownerType,
                                  const std::string &ownerLogin,
                                  const std::string &title,
                                  const std::string &description) = 0;
    virtual void deleteProject(const std::string &projectId) = 0;
};

} // namespace cassette

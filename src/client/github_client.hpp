#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>

#include <nlohmann/json.hpp>

#include "client/projects_client.hpp"

class QNetworkAccessManager;

namespace cassette {

struct GitHubClientOptions {
    QString apiBaseUrl = QStringLiteral("https://api.github.com");
    QString token;
    int timeoutMs = 30000;

    // GH_TOKEN (or GITHUB_TOKEN) and GITHUB_API_URL.
    static GitHubClientOptions fromEnvironment();
};

struct RepositoryRef {
    std::string owner;
    std::string repo;
};

// "owner/title" or a bare project number.
struct ProjectIdentifier {
    std::optional<int> number;
    std::string owner;
    std::string title;
};

std::optional<RepositoryRef> parseRepositoryUrl(const std::string &url);
std::optional<int> parseIssueNumber(const std::string &url);
std::optional<ProjectIdentifier> parseProjectIdentifier(const std::string &identifier);

// Nodes that are not objects or carry no id (unsupported field kinds) are skipped.
std::vector<ProjectField> parseProjectFieldNodes(const nlohmann::json &nodes);

// Live client for the GitHub REST and GraphQL v4 APIs. Requests are synchronous:
// each call spins a local event loop until its reply has finished.
class GitHubClient : public ProjectsClient {
public:
    explicit GitHubClient(GitHubClientOptions options = GitHubClientOptions::fromEnvironment());
    ~GitHubClient() override;

    GitHubClient(const GitHubClient &) = delete;
    GitHubClient &operator=(const GitHubClient &) = delete;

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
    bool isOrganization(const std::string &login);
    std::string ownerNodeId(const std::string &ownerType, const std::string &login);

    nlohmann::json restGet(const QString &path);
    nlohmann::json graphql(const std::string &query, const nlohmann::json &variables);
    nlohmann::json send(const QByteArray &verb, const QString &path, const QByteArray &body);

    GitHubClientOptions m_options;
    std::unique_ptr<QNetworkAccessManager> m_network;
};

} // namespace cassette

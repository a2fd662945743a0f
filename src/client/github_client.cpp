#include "client/github_client.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopedPointer>
#include <QUrl>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace cassette {

namespace {

constexpr const char *kFindProjectByNumberQuery =
    "query($number: Int!) {"
    "  viewer { projectV2(number: $number) { id number title url } }"
    "}";

constexpr const char *kProjectFieldsQuery =
    "query($id: ID!) {"
    "  node(id: $id) {"
    "    ... on ProjectV2 {"
    "      fields(first: 100) {"
    "        nodes {"
    "          ... on ProjectV2Field { id name dataType }"
    "          ... on ProjectV2SingleSelectField { id name dataType options { id name } }"
    "          ... on ProjectV2IterationField { id name dataType }"
    "        }"
    "      }"
    "    }"
    "  }"
    "}";

constexpr const char *kAddDraftIssueMutation =
    "mutation($projectId: ID!, $title: String!, $body: String) {"
    "  addProjectV2DraftIssue(input: {projectId: $projectId, title: $title, body: $body}) {"
    "    projectItem { id }"
    "  }"
    "}";

constexpr const char *kAddItemByIdMutation =
    "mutation($projectId: ID!, $contentId: ID!) {"
    "  addProjectV2ItemById(input: {projectId: $projectId, contentId: $contentId}) {"
    "    item { id }"
    "  }"
    "}";

constexpr const char *kUpdateFieldValueMutation =
    "mutation($projectId: ID!, $itemId: ID!, $fieldId: ID!, $value: ProjectV2FieldValue!) {"
    "  updateProjectV2ItemFieldValue(input: {"
    "    projectId: $projectId, itemId: $itemId, fieldId: $fieldId, value: $value"
    "  }) { projectV2Item { id } }"
    "}";

constexpr const char *kDeleteItemMutation =
    "mutation($projectId: ID!, $itemId: ID!) {"
    "  deleteProjectV2Item(input: {projectId: $projectId, itemId: $itemId}) { deletedItemId }"
    "}";

constexpr const char *kCreateProjectMutation =
    "mutation($ownerId: ID!, $title: String!) {"
    "  createProjectV2(input: {ownerId: $ownerId, title: $title}) {"
    "    projectV2 { id number title url }"
    "  }"
    "}";

constexpr const char *kDescribeProjectMutation =
    "mutation($projectId: ID!, $description: String!) {"
    "  updateProjectV2(input: {projectId: $projectId, shortDescription: $description}) {"
    "    projectV2 { id }"
    "  }"
    "}";

constexpr const char *kDeleteProjectMutation =
    "mutation($projectId: ID!) {"
    "  deleteProjectV2(input: {projectId: $projectId}) { projectV2 { id } }"
    "}";

std::string stringAt(const nlohmann::json &root, const char *pointer)
{
    const nlohmann::json::json_pointer ptr(pointer);
    if (!root.contains(ptr)) {
        return std::string();
    }
    const auto &value = root.at(ptr);
    return value.is_string() ? value.get<std::string>() : std::string();
}

const nlohmann::json &objectAt(const nlohmann::json &root, const std::string &pointer)
{
    static const nlohmann::json kNull;
    const nlohmann::json::json_pointer ptr(pointer);
    if (!root.contains(ptr)) {
        return kNull;
    }
    return root.at(ptr);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

GitHubClientOptions GitHubClientOptions::fromEnvironment()
{
    GitHubClientOptions options;
    options.token = qEnvironmentVariable("GH_TOKEN");
    if (options.token.isEmpty()) {
        options.token = qEnvironmentVariable("GITHUB_TOKEN");
    }
    const QString baseUrl = qEnvironmentVariable("GITHUB_API_URL");
    if (!baseUrl.isEmpty()) {
        options.apiBaseUrl = baseUrl;
    }
    return options;
}

std::optional<RepositoryRef> parseRepositoryUrl(const std::string &url)
{
    static const std::regex pattern(R"(github\.com/([^/]+)/([^/]+))");
    std::smatch match;
    if (!std::regex_search(url, match, pattern)) {
        return std::nullopt;
    }
    return RepositoryRef{match[1].str(), match[2].str()};
}

std::optional<int> parseIssueNumber(const std::string &url)
{
    static const std::regex pattern(R"(/(?:issues|pull)/(\d+))");
    std::smatch match;
    if (!std::regex_search(url, match, pattern)) {
        return std::nullopt;
    }
    try {
        return std::stoi(match[1].str());
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

std::optional<ProjectIdentifier> parseProjectIdentifier(const std::string &identifier)
{
    ProjectIdentifier parsed;
    if (!identifier.empty()
        && std::all_of(identifier.begin(), identifier.end(),
                       [](unsigned char c) { return std::isdigit(c); })) {
        try {
            parsed.number = std::stoi(identifier);
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
        return parsed;
    }

    // Everything after the first slash is the title, which may itself contain slashes.
    const auto slash = identifier.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= identifier.size()) {
        return std::nullopt;
    }
    parsed.owner = identifier.substr(0, slash);
    parsed.title = identifier.substr(slash + 1);
    return parsed;
}

std::vector<ProjectField> parseProjectFieldNodes(const nlohmann::json &nodes)
{
    std::vector<ProjectField> fields;
    if (!nodes.is_array()) {
        return fields;
    }
    for (const auto &node : nodes) {
        if (!node.is_object() || !node.contains("id") || !node.at("id").is_string()) {
            continue;
        }
        fields.push_back(node.get<ProjectField>());
    }
    return fields;
}

GitHubClient::GitHubClient(GitHubClientOptions options)
    : m_options(std::move(options))
    , m_network(std::make_unique<QNetworkAccessManager>())
{
    if (m_options.token.isEmpty()) {
        throw UpstreamError("no GitHub token available: set GH_TOKEN or GITHUB_TOKEN", 401);
    }
    while (m_options.apiBaseUrl.endsWith(QLatin1Char('/'))) {
        m_options.apiBaseUrl.chop(1);
    }
}

GitHubClient::~GitHubClient() = default;

std::string GitHubClient::getUser()
{
    const nlohmann::json user = restGet(QStringLiteral("user"));
    const std::string login = stringAt(user, "/login");
    if (login.empty()) {
        throw UpstreamError("failed to get user: response has no login");
    }
    return login;
}

Project GitHubClient::findProject(const std::string &identifier)
{
    const auto parsed = parseProjectIdentifier(identifier);
    if (!parsed) {
        throw UpstreamError("invalid project identifier format: " + identifier
                            + " (expected owner/project-name or project-number)");
    }

    if (parsed->number) {
        const nlohmann::json data = graphql(kFindProjectByNumberQuery,
                                            nlohmann::json{{"number", *parsed->number}});
        const nlohmann::json &node = objectAt(data, "/viewer/projectV2");
        if (!node.is_object()) {
            throw UpstreamError("project with number " + std::to_string(*parsed->number)
                                + " not found", 404);
        }
        return node.get<Project>();
    }

    const std::string root = isOrganization(parsed->owner) ? "organization" : "user";
    const std::string query =
        "query($login: String!, $search: String!) {"
        "  " + root + "(login: $login) {"
        "    projectsV2(first: 100, query: $search) { nodes { id number title url } }"
        "  }"
        "}";
    const nlohmann::json data = graphql(query, nlohmann::json{{"login", parsed->owner},
                                                              {"search", parsed->title}});

    const nlohmann::json &nodes = objectAt(data, "/" + root + "/projectsV2/nodes");
    if (nodes.is_array()) {
        for (const auto &node : nodes) {
            if (node.is_object() && node.value("title", "") == parsed->title) {
                return node.get<Project>();
            }
        }
    }
    throw UpstreamError("project " + parsed->owner + "/" + parsed->title + " not found", 404);
}

std::vector<ProjectField> GitHubClient::getProjectFields(const std::string &projectId)
{
    const nlohmann::json data = graphql(kProjectFieldsQuery, nlohmann::json{{"id", projectId}});
    return parseProjectFieldNodes(objectAt(data, "/node/fields/nodes"));
}

std::string GitHubClient::createDraftIssue(const std::string &projectId,
                                           const std::string &title,
                                           const std::string &body)
{
    const nlohmann::json data = graphql(kAddDraftIssueMutation,
                                        nlohmann::json{{"projectId", projectId},
                                                       {"title", title},
                                                       {"body", body}});
    const std::string itemId = stringAt(data, "/addProjectV2DraftIssue/projectItem/id");
    if (itemId.empty()) {
        throw UpstreamError("failed to create draft issue: unexpected response format");
    }
    return itemId;
}

std::string GitHubClient::createProjectItem(const std::string &projectId,
                                            const std::string &contentId)
{
    const nlohmann::json data = graphql(kAddItemByIdMutation,
                                        nlohmann::json{{"projectId", projectId},
                                                       {"contentId", contentId}});
    const std::string itemId = stringAt(data, "/addProjectV2ItemById/item/id");
    if (itemId.empty()) {
        throw UpstreamError("failed to create project item: unexpected response format");
    }
    return itemId;
}

nlohmann::json GitHubClient::getIssueOrPr(const std::string &url)
{
    const auto repository = parseRepositoryUrl(url);
    if (!repository) {
        throw UpstreamError("invalid GitHub URL format: " + url);
    }
    const auto number = parseIssueNumber(url);
    if (!number) {
        throw UpstreamError("could not extract issue/PR number from URL: " + url);
    }

    const QString base = QStringLiteral("repos/%1/%2/")
        .arg(QString::fromStdString(repository->owner),
             QString::fromStdString(repository->repo));
    try {
        return restGet(base + QStringLiteral("issues/%1").arg(*number));
    } catch (const UpstreamError &issueError) {
        CLOG_DEBUG(QStringLiteral("GitHubClient"),
                   QStringLiteral("getIssueOrPr"),
                   QStringLiteral("issue_lookup_failed"),
                   QStringLiteral("try_pull_request"),
                   QStringLiteral("rest"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"url", url}, {"error", issueError.what()}}));
    }

    try {
        return restGet(base + QStringLiteral("pulls/%1").arg(*number));
    } catch (const UpstreamError &error) {
        throw UpstreamError("failed to get issue/PR " + url + ": " + error.what(),
                            error.statusCode());
    }
}

void GitHubClient::setProjectItemFieldValue(const std::string &projectId,
                                            const std::string &itemId,
                                            const std::string &fieldId,
                                            const nlohmann::json &value)
{
    graphql(kUpdateFieldValueMutation, nlohmann::json{{"projectId", projectId},
                                                      {"itemId", itemId},
                                                      {"fieldId", fieldId},
                                                      {"value", value}});
}

void GitHubClient::deleteProjectItem(const std::string &projectId, const std::string &itemId)
{
    graphql(kDeleteItemMutation, nlohmann::json{{"projectId", projectId},
                                                {"itemId", itemId}});
}

Project GitHubClient::createProject(const std::string &ownerType,
                                    const std::string &ownerLogin,
                                    const std::string &title,
                                    const std::string &description)
{
    const std::string ownerId = ownerNodeId(ownerType, ownerLogin);
    const nlohmann::json data = graphql(kCreateProjectMutation,
                                        nlohmann::json{{"ownerId", ownerId},
                                                       {"title", title}});
    const nlohmann::json &node = objectAt(data, "/createProjectV2/projectV2");
    if (!node.is_object()) {
        throw UpstreamError("failed to create project: unexpected response format");
    }
    const Project project = node.get<Project>();

    if (!description.empty()) {
        graphql(kDescribeProjectMutation, nlohmann::json{{"projectId", project.id},
                                                         {"description", description}});
    }
    return project;
}

void GitHubClient::deleteProject(const std::string &projectId)
{
    graphql(kDeleteProjectMutation, nlohmann::json{{"projectId", projectId}});
}

bool GitHubClient::isOrganization(const std::string &login)
{
    const nlohmann::json owner = restGet(QStringLiteral("users/") + QString::fromStdString(login));
    return stringAt(owner, "/type") == "Organization";
}

std::string GitHubClient::ownerNodeId(const std::string &ownerType, const std::string &login)
{
    const std::string type = toLower(ownerType);
    const std::string root = (type == "organization" || type == "org") ? "organization" : "user";
    const std::string query =
        "query($login: String!) { " + root + "(login: $login) { id } }";
    const nlohmann::json data = graphql(query, nlohmann::json{{"login", login}});
    const std::string id = stringAt(data, ("/" + root + "/id").c_str());
    if (id.empty()) {
        throw UpstreamError(root + " " + login + " not found", 404);
    }
    return id;
}

nlohmann::json GitHubClient::restGet(const QString &path)
{
    return send(QByteArrayLiteral("GET"), path, QByteArray());
}

nlohmann::json GitHubClient::graphql(const std::string &query, const nlohmann::json &variables)
{
    nlohmann::json payload{{"query", query}};
    if (variables.is_object() && !variables.empty()) {
        payload["variables"] = variables;
    }

    const nlohmann::json response = send(QByteArrayLiteral("POST"),
                                         QStringLiteral("graphql"),
                                         QByteArray::fromStdString(payload.dump()));

    if (response.contains("errors") && response.at("errors").is_array()
        && !response.at("errors").empty()) {
        const auto &first = response.at("errors").front();
        const std::string message = first.is_object()
            ? first.value("message", "unknown error")
            : std::string("unknown error");
        throw UpstreamError("GraphQL error: " + message, 200);
    }
    if (!response.contains("data") || !response.at("data").is_object()) {
        return nlohmann::json::object();
    }
    return response.at("data");
}

nlohmann::json GitHubClient::send(const QByteArray &verb,
                                  const QString &path,
                                  const QByteArray &body)
{
    QNetworkRequest request(QUrl(m_options.apiBaseUrl + QLatin1Char('/') + path));
    request.setRawHeader("Authorization", "Bearer " + m_options.token.toUtf8());
    request.setRawHeader("Accept", "application/vnd.github+json");
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("cassette"));
    request.setTransferTimeout(m_options.timeoutMs);

    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply(
        m_network->sendCustomRequest(request, verb, body));
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray data = reply->readAll();
    const auto parsed = nlohmann::json::parse(data.toStdString(), nullptr, false);

    if (reply->error() != QNetworkReply::NoError) {
        std::string message = reply->errorString().toStdString();
        if (!parsed.is_discarded() && parsed.is_object()) {
            const std::string apiMessage = stringAt(parsed, "/message");
            if (!apiMessage.empty()) {
                message = apiMessage;
            }
        }
        CLOG_WARN(QStringLiteral("GitHubClient"),
                  QStringLiteral("send"),
                  QStringLiteral("request_failed"),
                  QStringLiteral("upstream_error"),
                  QStringLiteral("http"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"verb", verb.toStdString()},
                                  {"path", path.toStdString()},
                                  {"status", status},
                                  {"error", message}}));
        throw UpstreamError(verb.toStdString() + " " + path.toStdString() + ": " + message,
                            status);
    }

    if (parsed.is_discarded()) {
        throw UpstreamError("invalid JSON in response to " + verb.toStdString() + " "
                                + path.toStdString(),
                            status);
    }

    CLOG_DEBUG(QStringLiteral("GitHubClient"),
               QStringLiteral("send"),
               QStringLiteral("request_completed"),
               QStringLiteral("api_call"),
               QStringLiteral("http"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"verb", verb.toStdString()},
                               {"path", path.toStdString()},
                               {"status", status}}));
    return parsed;
}

} // namespace cassette

#include "snapshot/snapshot_client.hpp"

#include <chrono>
#include <stdexcept>

#include "client/github_client.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "snapshot/call_replayer.hpp"
#include "snapshot/payload_codec.hpp"
#include "snapshot/recording_client.hpp"
#include "snapshot/replaying_client.hpp"
#include "snapshot/snapshot_store.hpp"

namespace cassette {

namespace {

std::unique_ptr<ProjectsClient> createRealClient(const ClientFactory &factory)
{
    if (!factory) {
        throw std::invalid_argument("no client factory for a mode that needs the live client");
    }
    std::unique_ptr<ProjectsClient> client = factory();
    if (!client) {
        throw std::invalid_argument("client factory returned no client");
    }
    return client;
}

} // namespace

SnapshotProjectsClient::SnapshotProjectsClient(const QString &scenarioName,
                                               const SnapshotConfig &config,
                                               ClientFactory realClientFactory)
    : m_scenarioName(scenarioName)
    , m_mode(config.mode)
    , m_snapshotPath(SnapshotStore::derivePath(scenarioName, config.snapshotDirectory))
{
    logging::CorrelationScope scope(m_scenarioName);

    switch (m_mode) {
    case SnapshotMode::Replay:
        m_snapshot = SnapshotStore::load(m_snapshotPath);
        m_replayer = std::make_unique<CallReplayer>(*m_snapshot, config.matchPolicy);
        m_client = std::make_unique<ReplayingProjectsClient>(*m_replayer);
        break;
    case SnapshotMode::Record: {
        const auto now = truncateToMillis(std::chrono::system_clock::now());
        m_snapshot = Snapshot{m_scenarioName.toStdString(), {}, now, now};
        m_client = std::make_unique<RecordingProjectsClient>(
            createRealClient(realClientFactory), *m_snapshot);
        break;
    }
    case SnapshotMode::Bypass:
        m_client = createRealClient(realClientFactory);
        break;
    }

    m_state = FacadeState::Loaded;

    CLOG_INFO(QStringLiteral("SnapshotProjectsClient"),
              QStringLiteral("SnapshotProjectsClient"),
              QStringLiteral("scenario_opened"),
              QStringLiteral("test_setup"),
              snapshotModeName(m_mode),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"scenario", m_scenarioName.toStdString()},
                              {"path", m_snapshotPath.toStdString()},
                              {"calls", m_snapshot ? m_snapshot->calls.size() : 0}}));
}

SnapshotProjectsClient::~SnapshotProjectsClient()
{
    if (m_mode == SnapshotMode::Record && m_state == FacadeState::Loaded) {
        CLOG_WARN(QStringLiteral("SnapshotProjectsClient"),
                  QStringLiteral("~SnapshotProjectsClient"),
                  QStringLiteral("snapshot_discarded"),
                  QStringLiteral("close_not_called"),
                  snapshotModeName(m_mode),
                  logging::defaultWho(),
                  m_scenarioName,
                  (nlohmann::json{{"path", m_snapshotPath.toStdString()},
                                  {"calls", m_snapshot->calls.size()}}));
    }
}

ClientFactory SnapshotProjectsClient::defaultClientFactory()
{
    return [] { return std::make_unique<GitHubClient>(); };
}

void SnapshotProjectsClient::close()
{
    logging::CorrelationScope scope(m_scenarioName);

    const bool firstClose = m_state != FacadeState::Closed;
    m_state = FacadeState::Closed;
    if (m_mode == SnapshotMode::Record) {
        SnapshotStore::save(*m_snapshot, m_snapshotPath);
    }

    if (firstClose) {
        CLOG_INFO(QStringLiteral("SnapshotProjectsClient"),
                  QStringLiteral("close"),
                  QStringLiteral("scenario_closed"),
                  QStringLiteral("test_teardown"),
                  snapshotModeName(m_mode),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"scenario", m_scenarioName.toStdString()},
                                  {"cursor", cursor()},
                                  {"calls", m_snapshot ? m_snapshot->calls.size() : 0}}));
    }
}

SnapshotMode SnapshotProjectsClient::mode() const
{
    return m_mode;
}

FacadeState SnapshotProjectsClient::state() const
{
    return m_state;
}

const QString &SnapshotProjectsClient::scenarioName() const
{
    return m_scenarioName;
}

const QString &SnapshotProjectsClient::snapshotPath() const
{
    return m_snapshotPath;
}

std::size_t SnapshotProjectsClient::cursor() const
{
    return m_replayer ? m_replayer->cursor() : 0;
}

const Snapshot *SnapshotProjectsClient::snapshot() const
{
    return m_snapshot ? &*m_snapshot : nullptr;
}

ProjectsClient &SnapshotProjectsClient::active(const char *operation)
{
    if (m_state != FacadeState::Loaded) {
        throw HarnessError(ErrorKind::InvalidState,
                           std::string(operation) + " called on closed snapshot client for "
                               + m_scenarioName.toStdString());
    }
    return *m_client;
}

std::string SnapshotProjectsClient::getUser()
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kGetUser).getUser();
}

Project SnapshotProjectsClient::findProject(const std::string &identifier)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kFindProject).findProject(identifier);
}

std::vector<ProjectField> SnapshotProjectsClient::getProjectFields(const std::string &projectId)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kGetProjectFields).getProjectFields(projectId);
}

std::string SnapshotProjectsClient::createDraftIssue(const std::string &projectId,
                                                     const std::string &title,
                                                     const std::string &body)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kCreateDraftIssue).createDraftIssue(projectId, title, body);
}

std::string SnapshotProjectsClient::createProjectItem(const std::string &projectId,
                                                      const std::string &contentId)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kCreateProjectItem).createProjectItem(projectId, contentId);
}

nlohmann::json SnapshotProjectsClient::getIssueOrPr(const std::string &url)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kGetIssueOrPr).getIssueOrPr(url);
}

void SnapshotProjectsClient::setProjectItemFieldValue(const std::string &projectId,
                                                      const std::string &itemId,
                                                      const std::string &fieldId,
                                                      const nlohmann::json &value)
{
    logging::CorrelationScope scope(m_scenarioName);
    active(operations::kSetProjectItemFieldValue)
        .setProjectItemFieldValue(projectId, itemId, fieldId, value);
}

void SnapshotProjectsClient::deleteProjectItem(const std::string &projectId,
                                               const std::string &itemId)
{
    logging::CorrelationScope scope(m_scenarioName);
    active(operations::kDeleteProjectItem).deleteProjectItem(projectId, itemId);
}

Project SnapshotProjectsClient::createProject(const std::string &ownerType,
                                              const std::string &ownerLogin,
                                              const std::string &title,
                                              const std::string &description)
{
    logging::CorrelationScope scope(m_scenarioName);
    return active(operations::kCreateProject)
        .createProject(ownerType, ownerLogin, title, description);
}

void SnapshotProjectsClient::deleteProject(const std::string &projectId)
{
    logging::CorrelationScope scope(m_scenarioName);
    active(operations::kDeleteProject).deleteProject(projectId);
}

} // namespace cassette

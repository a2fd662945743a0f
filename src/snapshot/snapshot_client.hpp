#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

#include <QString>

#include "client/projects_client.hpp"
#include "common/enums.hpp"
#include "common/models.hpp"
#include "snapshot/mode_resolver.hpp"

namespace cassette {

class CallReplayer;

using ClientFactory = std::function<std::unique_ptr<ProjectsClient>()>;

/**
 * SnapshotProjectsClient is the single entry point tests use instead of the
 * live GitHubClient. The mode is fixed at construction and decides which of
 * three implementations serves every operation:
 *
 *  - Replay: answers from the snapshot file of the scenario, which must exist.
 *  - Record: calls the live client and captures each call; close() saves.
 *  - Bypass: calls the live client, nothing is captured or read.
 *
 * The live client is only created (through the factory) in Record and Bypass.
 * One instance serves one scenario and must be driven from one thread.
 */
class SnapshotProjectsClient : public ProjectsClient {
public:
    SnapshotProjectsClient(const QString &scenarioName,
                           const SnapshotConfig &config,
                           ClientFactory realClientFactory = defaultClientFactory());
    ~SnapshotProjectsClient() override;

    SnapshotProjectsClient(const SnapshotProjectsClient &) = delete;
    SnapshotProjectsClient &operator=(const SnapshotProjectsClient &) = delete;

    // GitHubClient configured from the environment.
    static ClientFactory defaultClientFactory();

    // Saves the snapshot in Record mode, no-op otherwise. May be called again;
    // a second save in Record mode writes the same content. Operations called
    // after close() throw HarnessError(InvalidState).
    void close();

    SnapshotMode mode() const;
    FacadeState state() const;
    const QString &scenarioName() const;
    const QString &snapshotPath() const;

    // Replay position; always 0 outside Replay mode.
    std::size_t cursor() const;

    // nullptr in Bypass mode.
    const Snapshot *snapshot() const;

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
    ProjectsClient &active(const char *operation);

    QString m_scenarioName;
    SnapshotMode m_mode;
    QString m_snapshotPath;
    FacadeState m_state = FacadeState::Uninitialized;

    std::optional<Snapshot> m_snapshot;
    std::unique_ptr<CallReplayer> m_replayer;
    std::unique_ptr<ProjectsClient> m_client;
};

} // namespace cassette

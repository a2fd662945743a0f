#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "client/github_client.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

using cassette::testing::captureUpstreamError;

class GitHubClientTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParseRepositoryUrl();
    void testParseIssueNumber();
    void testParseProjectIdentifier_data();
    void testParseProjectIdentifier();
    void testParseProjectFieldNodes();
    void testOptionsFromEnvironment();
    void testMissingTokenIsRejected();
    void testInvalidIdentifierFailsBeforeNetwork();
    void testUnreachableHostIsTransportFailure();

private:
    QTemporaryDir m_tempDir;
};

void GitHubClientTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("CASSETTE_LOG_DIR", m_tempDir.path().toUtf8());
}

void GitHubClientTests::testParseRepositoryUrl()
{
    const auto ref = cassette::parseRepositoryUrl("https://github.com/octocat/hello-world/issues/12");
    QVERIFY(ref.has_value());
    QCOMPARE(QString::fromStdString(ref->owner), QStringLiteral("octocat"));
    QCOMPARE(QString::fromStdString(ref->repo), QStringLiteral("hello-world"));

    QVERIFY(!cassette::parseRepositoryUrl("https://gitlab.com/octocat/hello").has_value());
    QVERIFY(!cassette::parseRepositoryUrl("github.com/octocat").has_value());
}

void GitHubClientTests::testParseIssueNumber()
{
    QCOMPARE(cassette::parseIssueNumber("https://github.com/o/r/issues/42").value_or(-1), 42);
    QCOMPARE(cassette::parseIssueNumber("https://github.com/o/r/pull/7").value_or(-1), 7);
    QVERIFY(!cassette::parseIssueNumber("https://github.com/o/r").has_value());
    QVERIFY(!cassette::parseIssueNumber("https://github.com/o/r/issues/99999999999999").has_value());
}

void GitHubClientTests::testParseProjectIdentifier_data()
{
    QTest::addColumn<QString>("identifier");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<int>("number");
    QTest::addColumn<QString>("owner");
    QTest::addColumn<QString>("title");

    QTest::newRow("number") << "12" << true << 12 << "" << "";
    QTest::newRow("owner/title") << "octocat/Roadmap" << true << 0 << "octocat" << "Roadmap";
    QTest::newRow("title with slash") << "octo-org/Q1/Q2 plan" << true << 0 << "octo-org" << "Q1/Q2 plan";
    QTest::newRow("empty") << "" << false << 0 << "" << "";
    QTest::newRow("no slash") << "Roadmap" << false << 0 << "" << "";
    QTest::newRow("leading slash") << "/Roadmap" << false << 0 << "" << "";
    QTest::newRow("trailing slash") << "octocat/" << false << 0 << "" << "";
}

void GitHubClientTests::testParseProjectIdentifier()
{
    QFETCH(QString, identifier);
    QFETCH(bool, valid);
    QFETCH(int, number);
    QFETCH(QString, owner);
    QFETCH(QString, title);

    const auto parsed = cassette::parseProjectIdentifier(identifier.toStdString());
    QCOMPARE(parsed.has_value(), valid);
    if (!parsed) {
        return;
    }
    QCOMPARE(parsed->number.value_or(0), number);
    QCOMPARE(QString::fromStdString(parsed->owner), owner);
    QCOMPARE(QString::fromStdString(parsed->title), title);
}

void GitHubClientTests::testParseProjectFieldNodes()
{
    const auto nodes = nlohmann::json::parse(R"([
        {"id": "PVTF_1", "name": "Title", "dataType": "TITLE"},
        {},
        {"id": "PVTSSF_2", "name": "Status", "dataType": "SINGLE_SELECT",
         "options": [{"id": "a", "name": "Todo"}, {"id": "b", "name": "Done"}]},
        "garbage"
    ])");

    const auto fields = cassette::parseProjectFieldNodes(nodes);
    QCOMPARE(fields.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(fields[0].id), QStringLiteral("PVTF_1"));
    QVERIFY(fields[0].options.empty());
    QCOMPARE(QString::fromStdString(fields[1].dataType), QStringLiteral("SINGLE_SELECT"));
    QCOMPARE(fields[1].options.size(), static_cast<std::size_t>(2));

    QVERIFY(cassette::parseProjectFieldNodes(nlohmann::json()).empty());
}

void GitHubClientTests::testOptionsFromEnvironment()
{
    const QByteArray prevGh = qgetenv("GH_TOKEN");
    const QByteArray prevGithub = qgetenv("GITHUB_TOKEN");
    const QByteArray prevUrl = qgetenv("GITHUB_API_URL");

    qunsetenv("GH_TOKEN");
    qputenv("GITHUB_TOKEN", "fallback-token");
    qputenv("GITHUB_API_URL", "https://ghe.example.com/api/v3");
    auto options = cassette::GitHubClientOptions::fromEnvironment();
    QCOMPARE(options.token, QStringLiteral("fallback-token"));
    QCOMPARE(options.apiBaseUrl, QStringLiteral("https://ghe.example.com/api/v3"));

    qputenv("GH_TOKEN", "primary-token");
    qunsetenv("GITHUB_API_URL");
    options = cassette::GitHubClientOptions::fromEnvironment();
    QCOMPARE(options.token, QStringLiteral("primary-token"));
    QCOMPARE(options.apiBaseUrl, QStringLiteral("https://api.github.com"));

    const auto restore = [](const char *name, const QByteArray &value) {
        if (value.isEmpty()) {
            qunsetenv(name);
        } else {
            qputenv(name, value);
        }
    };
    restore("GH_TOKEN", prevGh);
    restore("GITHUB_TOKEN", prevGithub);
    restore("GITHUB_API_URL", prevUrl);
}

void GitHubClientTests::testMissingTokenIsRejected()
{
    cassette::GitHubClientOptions options;
    const auto error = captureUpstreamError([&] { cassette::GitHubClient client(options); });
    QVERIFY(error.has_value());
    QCOMPARE(error->statusCode(), 401);
}

void GitHubClientTests::testInvalidIdentifierFailsBeforeNetwork()
{
    cassette::GitHubClientOptions options;
    options.token = QStringLiteral("test-token");
    options.apiBaseUrl = QStringLiteral("http://127.0.0.1:1");
    cassette::GitHubClient client(options);

    const auto error = captureUpstreamError([&] { client.findProject("not-an-identifier"); });
    QVERIFY(error.has_value());
    QVERIFY(QString::fromUtf8(error->what()).contains(QStringLiteral("invalid project identifier")));
}

void GitHubClientTests::testUnreachableHostIsTransportFailure()
{
    cassette::GitHubClientOptions options;
    options.token = QStringLiteral("test-token");
    options.apiBaseUrl = QStringLiteral("http://127.0.0.1:1/");
    options.timeoutMs = 2000;
    cassette::GitHubClient client(options);

    const auto error = captureUpstreamError([&] { client.getUser(); });
    QVERIFY(error.has_value());
    QCOMPARE(error->statusCode(), 0);
}

QTEST_MAIN(GitHubClientTests)
#include "test_github_client.moc"

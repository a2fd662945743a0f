#include <QtTest/QtTest>

#include <chrono>
#include <ratio>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "snapshot/payload_codec.hpp"

namespace {

constexpr bool kNanosecondClock =
    std::ratio_less_equal<std::chrono::system_clock::period, std::nano>::value;

} // namespace

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testTimestampFormat();
    void testTimestampParsing_data();
    void testTimestampParsing();
    void testProjectRoundTrip();
    void testFieldOptionsOmittedWhenEmpty();
    void testApiCallKeys();
    void testApiCallObjectResponse();
    void testSnapshotNullCalls();
    void testMissingFieldsDefaults();
    void testUnrepresentableTimestampsLoadAsEpoch();
    void testLoginPayloadForms();
    void testItemIdPayloadForms();
    void testFieldsPayloadNull();
    void testErrorPayloadStatus();
};

void ModelsJsonTests::testTimestampFormat()
{
    const auto parsed = cassette::parseIso8601("2024-02-29T23:59:59.042Z");
    QVERIFY(parsed.has_value());
    QCOMPARE(QString::fromStdString(cassette::toIso8601Utc(*parsed)),
             QStringLiteral("2024-02-29T23:59:59.042Z"));
    QCOMPARE(QString::fromStdString(cassette::toIso8601Utc(std::chrono::system_clock::time_point{})),
             QStringLiteral("1970-01-01T00:00:00.000Z"));
}

void ModelsJsonTests::testTimestampParsing_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");
    QTest::addColumn<bool>("nanosecondClockOnly");

    QTest::newRow("zulu") << "2025-06-01T12:00:00Z" << "2025-06-01T12:00:00.000Z" << false;
    QTest::newRow("fraction") << "2025-06-01T12:00:00.7Z" << "2025-06-01T12:00:00.700Z" << false;
    QTest::newRow("nanos") << "2025-06-01T12:00:00.123456789Z" << "2025-06-01T12:00:00.123Z" << false;
    QTest::newRow("positive offset") << "2025-06-01T14:30:00+02:30" << "2025-06-01T12:00:00.000Z" << false;
    QTest::newRow("negative offset") << "2025-06-01T07:00:00-05:00" << "2025-06-01T12:00:00.000Z" << false;
    QTest::newRow("garbage") << "yesterday" << "" << false;
    QTest::newRow("no zone") << "2025-06-01T12:00:00" << "" << false;
    QTest::newRow("empty") << "" << "" << false;
    QTest::newRow("year one") << "0001-01-01T00:00:00Z" << "" << true;
    QTest::newRow("year 2300") << "2300-01-01T00:00:00Z" << "" << true;
    QTest::newRow("year 9999 offset") << "9999-12-31T23:59:59.999-12:00" << "" << true;
}

void ModelsJsonTests::testTimestampParsing()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QFETCH(bool, nanosecondClockOnly);

    if (nanosecondClockOnly && !kNanosecondClock) {
        QSKIP("system_clock covers this year on this platform");
    }

    const auto parsed = cassette::parseIso8601(input.toStdString());
    if (expected.isEmpty()) {
        QVERIFY(!parsed.has_value());
        return;
    }
    QVERIFY(parsed.has_value());
    QCOMPARE(QString::fromStdString(cassette::toIso8601Utc(*parsed)), expected);
}

void ModelsJsonTests::testProjectRoundTrip()
{
    const cassette::Project project{"PVT_kwDO", 12, "Roadmap", "https://github.com/orgs/o/projects/12"};
    const nlohmann::json j = project;
    const auto parsed = j.get<cassette::Project>();

    QCOMPARE(QString::fromStdString(parsed.id), QStringLiteral("PVT_kwDO"));
    QCOMPARE(parsed.number, 12);
    QCOMPARE(QString::fromStdString(parsed.title), QStringLiteral("Roadmap"));
    QCOMPARE(QString::fromStdString(parsed.url), QString::fromStdString(project.url));
}

void ModelsJsonTests::testFieldOptionsOmittedWhenEmpty()
{
    const cassette::ProjectField plain{"PVTF_1", "Estimate", "NUMBER", {}};
    QVERIFY(!nlohmann::json(plain).contains("options"));

    const cassette::ProjectField select{"PVTSSF_1", "Status", "SINGLE_SELECT",
                                        {cassette::ProjectFieldOption{"o1", "Todo"}}};
    const nlohmann::json j = select;
    QVERIFY(j.at("options").is_array());
    const auto parsed = j.get<cassette::ProjectField>();
    QCOMPARE(parsed.options.size(), static_cast<std::size_t>(1));
    QCOMPARE(QString::fromStdString(parsed.options.front().name), QStringLiteral("Todo"));
}

void ModelsJsonTests::testApiCallKeys()
{
    cassette::ApiCall call;
    call.method = "API";
    call.url = "GetUser";
    call.statusCode = 200;
    call.response = "\"octocat\"";
    call.timestamp = *cassette::parseIso8601("2025-01-01T00:00:00.001Z");

    nlohmann::json j = call;
    QVERIFY(!j.contains("request_body"));
    QCOMPARE(j.at("status_code").get<int>(), 200);
    QCOMPARE(QString::fromStdString(j.at("timestamp").get<std::string>()),
             QStringLiteral("2025-01-01T00:00:00.001Z"));

    call.requestBody = R"({"identifier":"7"})";
    j = call;
    QCOMPARE(QString::fromStdString(j.at("request_body").get<std::string>()),
             QStringLiteral("{\"identifier\":\"7\"}"));
}

void ModelsJsonTests::testApiCallObjectResponse()
{
    // Hand-written logs sometimes inline the response instead of a string.
    const auto j = nlohmann::json::parse(
        R"({"method":"GET","url":"user","status_code":200,"response":{"login":"alice"}})");
    const auto call = j.get<cassette::ApiCall>();
    QCOMPARE(QString::fromStdString(cassette::payload::decodeLogin(call.response)),
             QStringLiteral("alice"));
}

void ModelsJsonTests::testSnapshotNullCalls()
{
    const auto j = nlohmann::json::parse(R"({"test_name":"n","calls":null})");
    const auto snapshot = j.get<cassette::Snapshot>();
    QVERIFY(snapshot.calls.empty());
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto snapshot = nlohmann::json::parse(R"({"calls":[{"status_code":404}]})")
                              .get<cassette::Snapshot>();
    QVERIFY(snapshot.testName.empty());
    QCOMPARE(snapshot.calls.size(), static_cast<std::size_t>(1));
    QVERIFY(snapshot.calls.front().method.empty());
    QVERIFY(snapshot.calls.front().response.empty());
    QCOMPARE(snapshot.calls.front().statusCode, 404);
    QVERIFY(snapshot.created == std::chrono::system_clock::time_point{});

    const auto project = nlohmann::json::object().get<cassette::Project>();
    QCOMPARE(project.number, 0);
    QVERIFY(project.id.empty());
}

void ModelsJsonTests::testUnrepresentableTimestampsLoadAsEpoch()
{
    if (!kNanosecondClock) {
        QSKIP("system_clock covers these years on this platform");
    }

    // Go writes "0001-01-01T00:00:00Z" for a zero time.Time.
    const auto snapshot = nlohmann::json::parse(R"({
        "test_name": "ZeroTimes",
        "calls": [{"method": "API", "url": "GetUser", "status_code": 200,
                   "response": "\"octocat\"", "timestamp": "0001-01-01T00:00:00Z"}],
        "created": "0001-01-01T00:00:00Z",
        "updated": "2500-06-01T00:00:00Z"
    })").get<cassette::Snapshot>();

    const std::chrono::system_clock::time_point epoch{};
    QVERIFY(snapshot.created == epoch);
    QVERIFY(snapshot.updated == epoch);
    QVERIFY(snapshot.calls.front().timestamp == epoch);
    QCOMPARE(QString::fromStdString(cassette::toIso8601Utc(snapshot.created)),
             QStringLiteral("1970-01-01T00:00:00.000Z"));

    // The last representable day still parses.
    QVERIFY(cassette::parseIso8601("2262-01-01T00:00:00Z").has_value());
    QVERIFY(cassette::parseIso8601("1678-01-01T00:00:00Z").has_value());
}

void ModelsJsonTests::testLoginPayloadForms()
{
    QCOMPARE(QString::fromStdString(cassette::payload::decodeLogin("\"octocat\"")),
             QStringLiteral("octocat"));
    QCOMPARE(QString::fromStdString(cassette::payload::decodeLogin("{\"login\":\"alice\",\"id\":1}")),
             QStringLiteral("alice"));

    bool threw = false;
    try {
        cassette::payload::decodeLogin("{\"name\":\"no login\"}");
    } catch (const nlohmann::json::exception &) {
        threw = true;
    }
    QVERIFY(threw);
}

void ModelsJsonTests::testItemIdPayloadForms()
{
    QCOMPARE(QString::fromStdString(cassette::payload::decodeItemId(
                 cassette::payload::encodeText("PVTI_1"))),
             QStringLiteral("PVTI_1"));
    QCOMPARE(QString::fromStdString(cassette::payload::decodeItemId("{\"id\":\"PVTI_2\"}")),
             QStringLiteral("PVTI_2"));
    QCOMPARE(QString::fromStdString(cassette::payload::encodeAck()), QStringLiteral("\"success\""));
}

void ModelsJsonTests::testFieldsPayloadNull()
{
    QVERIFY(cassette::payload::decodeFields("null").empty());
    QVERIFY(cassette::payload::decodeFields("[]").empty());
}

void ModelsJsonTests::testErrorPayloadStatus()
{
    QCOMPARE(cassette::recordedErrorStatus(0), 500);
    QCOMPARE(cassette::recordedErrorStatus(200), 500);
    QCOMPARE(cassette::recordedErrorStatus(422), 422);

    const auto payload = nlohmann::json::parse(cassette::encodeErrorPayload("quota", 403));
    QCOMPARE(QString::fromStdString(payload.at("error").get<std::string>()), QStringLiteral("quota"));
    QCOMPARE(payload.at("status").get<int>(), 403);

    cassette::ApiCall call;
    call.statusCode = 403;
    call.response = cassette::encodeErrorPayload("quota", 403);
    const cassette::UpstreamError error = cassette::decodeErrorPayload(call);
    QCOMPARE(QString::fromUtf8(error.what()), QStringLiteral("quota"));
    QCOMPARE(error.statusCode(), 403);

    QVERIFY(cassette::isSuccessStatus(204));
    QVERIFY(!cassette::isSuccessStatus(301));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"

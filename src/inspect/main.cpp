#include <QCoreApplication>
#include <QCommandLineParser>

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "snapshot/payload_codec.hpp"
#include "snapshot/snapshot_store.hpp"

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitNotFound = 2;
constexpr int kExitParseError = 3;

void renderMarkdown(const cassette::Snapshot &snapshot, const QString &path)
{
    std::cout << "# Snapshot " << snapshot.testName << "\n\n";
    std::cout << "File: " << path.toStdString() << "\n";
    std::cout << "Created: " << cassette::toIso8601Utc(snapshot.created) << "\n";
    std::cout << "Updated: " << cassette::toIso8601Utc(snapshot.updated) << "\n";
    std::cout << "Calls: " << snapshot.calls.size() << "\n\n";

    if (snapshot.calls.empty()) {
        std::cout << "No recorded calls.\n";
        return;
    }

    std::size_t index = 1;
    for (const auto &call : snapshot.calls) {
        std::cout << index++ << ". [" << call.statusCode << "] "
                  << call.method << " " << call.url;
        if (!cassette::isSuccessStatus(call.statusCode)) {
            std::cout << " -> " << cassette::decodeErrorPayload(call).what();
        }
        std::cout << "\n";
        if (!call.requestBody.empty()) {
            std::cout << "   request: " << call.requestBody << "\n";
        }
    }
}

void renderJson(const cassette::Snapshot &snapshot, const QString &path)
{
    nlohmann::json calls = nlohmann::json::array();
    for (const auto &call : snapshot.calls) {
        calls.push_back(nlohmann::json{{"method", call.method},
                                       {"url", call.url},
                                       {"status_code", call.statusCode},
                                       {"ok", cassette::isSuccessStatus(call.statusCode)},
                                       {"timestamp", cassette::toIso8601Utc(call.timestamp)}});
    }

    nlohmann::json payload;
    payload["path"] = path.toStdString();
    payload["test_name"] = snapshot.testName;
    payload["created"] = cassette::toIso8601Utc(snapshot.created);
    payload["updated"] = cassette::toIso8601Utc(snapshot.updated);
    payload["totalCalls"] = snapshot.calls.size();
    payload["calls"] = calls;

    std::cout << payload.dump(2) << std::endl;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("cassette-inspect"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Summarize a recorded API snapshot."));
    parser.addHelpOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption formatOption(QStringList() << "format",
                                    "Output format: markdown or json.",
                                    "format",
                                    QStringLiteral("markdown"));
    parser.addOption(traceOption);
    parser.addOption(formatOption);
    parser.addPositionalArgument("snapshot", "Path to a snapshot JSON file.");
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("CASSETTE_TRACE") == 1;
    cassette::logging::initLogging(QStringLiteral("cassette-inspect"), trace);

    const QStringList args = parser.positionalArguments();
    const QString format = parser.value(formatOption);
    if (args.size() != 1
        || (format != QStringLiteral("markdown") && format != QStringLiteral("json"))) {
        std::cerr << parser.helpText().toStdString();
        return kExitUsage;
    }

    const QString path = args.first();
    CLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("inspect_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              cassette::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", path.toStdString()},
                              {"format", format.toStdString()}}));

    cassette::Snapshot snapshot;
    try {
        snapshot = cassette::SnapshotStore::load(path);
    } catch (const cassette::HarnessError &ex) {
        std::cerr << cassette::errorKindName(ex.kind()) << ": " << ex.what() << "\n";
        return ex.kind() == cassette::ErrorKind::SnapshotNotFound ? kExitNotFound
                                                                   : kExitParseError;
    }

    if (format == QStringLiteral("json")) {
        renderJson(snapshot, path);
    } else {
        renderMarkdown(snapshot, path);
    }
    return 0;
}

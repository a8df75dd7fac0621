#include "ranker_cli.h"

#include "core/experiment/in_memory_experiment_store.h"
#include "core/experiment/sqlite_experiment_store.h"
#include "core/ranking/ranking_json.h"
#include "core/shared/logging.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>

#include <cstdio>

namespace sr {

int RankerCli::run(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Rank product candidates and evaluate ranking experiments."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Ranking configuration JSON file."), QStringLiteral("file"));
    const QCommandLineOption storeOption(
        {QStringLiteral("s"), QStringLiteral("store")},
        QStringLiteral("SQLite experiment database (in-memory when omitted)."),
        QStringLiteral("file"));
    parser.addOption(configOption);
    parser.addOption(storeOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("rank | record | report | validate | prune"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));

    if (!parser.parse(arguments)) {
        writeError(parser.errorText());
        return 1;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        std::fputs(qUtf8Printable(parser.helpText()), stdout);
        return 0;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        std::printf("%s %s\n", qUtf8Printable(QCoreApplication::applicationName()),
                    qUtf8Printable(QCoreApplication::applicationVersion()));
        return 0;
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        writeError(QStringLiteral("missing command; see --help"));
        return 1;
    }
    const QString command = positional.takeFirst();

    if (parser.isSet(configOption) && !loadConfig(parser.value(configOption))) {
        return 1;
    }
    if (command == QLatin1String("validate")) {
        return handleValidate();
    }

    if (!openService(parser.value(storeOption))) {
        return 1;
    }

    if (command == QLatin1String("rank")) {
        return handleRank(positional);
    }
    if (command == QLatin1String("record")) {
        return handleRecord(positional);
    }
    if (command == QLatin1String("report")) {
        return handleReport(positional);
    }
    if (command == QLatin1String("prune")) {
        return handlePrune();
    }

    writeError(QStringLiteral("unknown command '%1'").arg(command));
    return 1;
}

bool RankerCli::loadConfig(const QString& path)
{
    QString error;
    std::optional<RankingConfig> config = RankingConfig::loadFromFile(path, &error);
    if (!config) {
        writeError(QStringLiteral("invalid configuration %1: %2").arg(path, error));
        return false;
    }
    m_config = std::move(*config);
    return true;
}

bool RankerCli::openService(const QString& storePath)
{
    std::unique_ptr<ExperimentStore> store;
    QString error;
    if (storePath.isEmpty()) {
        store = std::make_unique<InMemoryExperimentStore>();
    } else {
        store = SqliteExperimentStore::open(storePath, &error);
        if (!store) {
            writeError(QStringLiteral("cannot open experiment store: %1").arg(error));
            return false;
        }
    }

    m_service = RankingService::create(m_config, std::move(store), &error);
    if (!m_service) {
        writeError(QStringLiteral("invalid configuration: %1").arg(error));
        return false;
    }
    return true;
}

int RankerCli::handleRank(const QStringList& args)
{
    if (args.size() != 1) {
        writeError(QStringLiteral("usage: rank <request.json>"));
        return 1;
    }
    const std::optional<QJsonDocument> doc = readJsonFile(args.front());
    if (!doc) {
        return 1;
    }
    if (!doc->isObject()) {
        writeError(QStringLiteral("request must be a JSON object"));
        return 1;
    }

    QString error;
    const std::optional<RankRequest> request = rankRequestFromJson(doc->object(), &error);
    if (!request) {
        writeError(QStringLiteral("invalid request: %1").arg(error));
        return 1;
    }

    const std::optional<RankResponse> response = m_service->rank(*request, &error);
    if (!response) {
        writeError(error);
        return 1;
    }
    writeJson(QJsonDocument(rankResponseToJson(*response)));
    return 0;
}

int RankerCli::handleRecord(const QStringList& args)
{
    if (args.size() != 1) {
        writeError(QStringLiteral("usage: record <events.json>"));
        return 1;
    }
    const std::optional<QJsonDocument> doc = readJsonFile(args.front());
    if (!doc) {
        return 1;
    }

    QJsonArray events;
    if (doc->isArray()) {
        events = doc->array();
    } else if (doc->isObject()) {
        events.append(doc->object());
    } else {
        writeError(QStringLiteral("events must be a JSON array or object"));
        return 1;
    }

    int rejected = 0;
    for (const QJsonValue& value : events) {
        QString error;
        const std::optional<ExperimentEvent> event =
            experimentEventFromJson(value.toObject(), &error);
        if (!event) {
            LOG_WARN(srExperiment, "Skipping event: %s", qUtf8Printable(error));
            ++rejected;
            continue;
        }
        m_service->recordInteraction(*event);
    }

    QJsonObject summary;
    summary[QStringLiteral("submitted")] = static_cast<int>(events.size());
    summary[QStringLiteral("rejected")] = rejected;
    summary[QStringLiteral("recorded")] =
        static_cast<double>(m_service->tracker().recordedCount());
    summary[QStringLiteral("dropped")] = static_cast<double>(m_service->tracker().droppedCount());
    writeJson(QJsonDocument(summary));
    return 0;
}

int RankerCli::handleReport(const QStringList& args)
{
    std::optional<QString> variant;
    if (!args.isEmpty()) {
        variant = args.front();
    }
    writeJson(QJsonDocument(m_service->getPerformance(variant)));
    return 0;
}

int RankerCli::handleValidate()
{
    QString error;
    if (!m_config.validate(&error)) {
        writeError(QStringLiteral("invalid configuration: %1").arg(error));
        return 1;
    }
    writeJson(QJsonDocument(m_config.toJson()));
    return 0;
}

int RankerCli::handlePrune()
{
    const int removed = m_service->pruneExpired();
    if (removed < 0) {
        writeError(QStringLiteral("pruning failed"));
        return 1;
    }
    QJsonObject summary;
    summary[QStringLiteral("removed")] = removed;
    writeJson(QJsonDocument(summary));
    return 0;
}

std::optional<QJsonDocument> RankerCli::readJsonFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        writeError(QStringLiteral("cannot open %1").arg(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        writeError(QStringLiteral("JSON parse error in %1: %2")
                       .arg(path, parseError.errorString()));
        return std::nullopt;
    }
    return doc;
}

void RankerCli::writeJson(const QJsonDocument& doc)
{
    const QByteArray bytes = doc.toJson(QJsonDocument::Indented);
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stdout);
    std::fflush(stdout);
}

void RankerCli::writeError(const QString& message)
{
    std::fprintf(stderr, "shoprank-cli: %s\n", qUtf8Printable(message));
    std::fflush(stderr);
}

} // namespace sr

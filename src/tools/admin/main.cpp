#include "services/recommender/recommendation_service.h"
#include "core/catalog/store_book_catalog.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/store/reward_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdio>

namespace {

int printJson(const QJsonObject& json, int exitCode = 0)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out.flush();
    return exitCode;
}

int printError(const QString& code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = code;
    error[QStringLiteral("message")] = message;
    QJsonObject json;
    json[QStringLiteral("ok")] = false;
    json[QStringLiteral("error")] = error;
    return printJson(json, 1);
}

int printError(const folio::ErrorInfo& error)
{
    return printError(error.code, error.message.isEmpty()
                                      ? folio::errorKindToString(error.kind)
                                      : error.message);
}

QString defaultDbPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/folio/folio.db");
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("folio-admin"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Batch operations on the Folio recommender database\n"
        "\n"
        "Commands:\n"
        "  attribute  Attribute recorded actions and apply pending rewards\n"
        "  stats      Arm statistics of --user, or of the anonymous scope\n"
        "  reindex    Catalog dry run: builds the similarity index from the stored\n"
        "             books and reports its size. The index is not saved; serving\n"
        "             processes build their own.\n"
        "  reset      Reset the arm models of --user, or of every scope\n"
        "  merge      Move --session history to --user"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("attribute | stats | reindex | reset | merge"));

    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("Database path."), QStringLiteral("path"));
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Settings JSON path."), QStringLiteral("path"));
    const QCommandLineOption windowOption(QStringLiteral("window-hours"),
                                          QStringLiteral("Attribution batch window in hours."),
                                          QStringLiteral("hours"));
    const QCommandLineOption userOption(QStringLiteral("user"),
                                        QStringLiteral("User id."), QStringLiteral("id"));
    const QCommandLineOption sessionOption(QStringLiteral("session"),
                                           QStringLiteral("Session id."), QStringLiteral("id"));
    parser.addOption(dbOption);
    parser.addOption(configOption);
    parser.addOption(windowOption);
    parser.addOption(userOption);
    parser.addOption(sessionOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }
    const QString command = positional.first();

    folio::Settings settings;
    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption) : folio::SettingsManager::settingsFilePath();
    if (QFileInfo::exists(configPath)) {
        const std::optional<folio::Settings> loaded = folio::SettingsManager::load(configPath);
        if (!loaded) {
            return printError(QStringLiteral("invalid_config"), configPath);
        }
        settings = *loaded;
    } else if (parser.isSet(configOption)) {
        return printError(QStringLiteral("config_not_found"), configPath);
    }

    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }
    QDir().mkpath(QFileInfo(settings.dbPath).absolutePath());

    folio::ErrorInfo error;
    std::optional<folio::RewardStore> store = folio::RewardStore::open(settings.dbPath, &error);
    if (!store) {
        return printError(error);
    }

    folio::RecommendationService service(*store, settings);
    const QString userId = parser.value(userOption);

    if (command == QLatin1String("attribute")) {
        double windowHours = settings.batchWindowHours;
        if (parser.isSet(windowOption)) {
            bool ok = false;
            windowHours = parser.value(windowOption).toDouble(&ok);
            if (!ok || windowHours <= 0.0) {
                return printError(QStringLiteral("invalid_window"), parser.value(windowOption));
            }
        }
        const folio::AttributionSummary summary = service.runAttributionBatch(windowHours);
        QJsonObject json = summary.toJson();
        json[QStringLiteral("ok")] = !summary.alreadyRunning;
        return printJson(json, summary.errors > 0 ? 3 : 0);
    }

    if (command == QLatin1String("stats")) {
        QJsonObject json = service.getArmStatistics(userId).toJson();
        json[QStringLiteral("ok")] = true;
        return printJson(json);
    }

    if (command == QLatin1String("reindex")) {
        folio::StoreBookCatalog catalog(*store);
        QJsonObject json = service.rebuildSimilarityIndex(catalog).toJson();
        json[QStringLiteral("ok")] = true;
        json[QStringLiteral("dryRun")] = true;
        return printJson(json);
    }

    if (command == QLatin1String("reset")) {
        if (!service.resetArms(userId, &error)) {
            return printError(error);
        }
        QJsonObject json;
        json[QStringLiteral("ok")] = true;
        json[QStringLiteral("scope")] = userId.isEmpty() ? QStringLiteral("all") : userId;
        return printJson(json);
    }

    if (command == QLatin1String("merge")) {
        const std::optional<folio::RewardStore::MergeCounts> counts =
            service.mergeIdentities(parser.value(sessionOption), userId, &error);
        if (!counts) {
            return printError(error);
        }
        QJsonObject json;
        json[QStringLiteral("ok")] = true;
        json[QStringLiteral("impressions")] = counts->impressions;
        json[QStringLiteral("actions")] = counts->actions;
        json[QStringLiteral("rewardEvents")] = counts->rewardEvents;
        return printJson(json);
    }

    LOG_WARN(folioCore, "Unknown command: %s", qUtf8Printable(command));
    return printError(QStringLiteral("unknown_command"), command);
}

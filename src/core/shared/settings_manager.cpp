#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <cmath>

namespace folio {

namespace {

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble() : fallback;
}

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(folioCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(folioCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    Settings settings = fromJson(doc.object());
    QString reason;
    if (!validate(settings, &reason)) {
        LOG_WARN(folioCore, "Rejected settings file %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(reason));
        return std::nullopt;
    }
    return settings;
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(folioCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(folioCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(folioCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("FOLIO_CONFIG");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/folio/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("alpha"), settings.alpha);
    json.insert(QStringLiteral("minInteractionsForActive"), settings.minInteractionsForActive);
    json.insert(QStringLiteral("maxCachedScopes"), settings.maxCachedScopes);
    json.insert(QStringLiteral("arms"), QJsonArray::fromStringList(settings.arms));
    json.insert(QStringLiteral("attributionWindowHours"), settings.attributionWindowHours);
    json.insert(QStringLiteral("decayLambdaPerHour"), settings.decayLambdaPerHour);
    json.insert(QStringLiteral("batchWindowHours"), settings.batchWindowHours);
    json.insert(QStringLiteral("clickPoints"), settings.clickPoints);
    json.insert(QStringLiteral("savePoints"), settings.savePoints);
    json.insert(QStringLiteral("unsavePoints"), settings.unsavePoints);
    json.insert(QStringLiteral("minSamplesForBest"), settings.minSamplesForBest);
    json.insert(QStringLiteral("confidenceZ"), settings.confidenceZ);
    json.insert(QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    json.insert(QStringLiteral("recommendationLimit"), settings.recommendationLimit);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.alpha = readDouble(json, "alpha", settings.alpha);
    settings.minInteractionsForActive =
        readInt(json, "minInteractionsForActive", settings.minInteractionsForActive);
    settings.maxCachedScopes = readInt(json, "maxCachedScopes", settings.maxCachedScopes);

    if (json.contains(QStringLiteral("arms"))) {
        const QJsonArray armsArray = json.value(QStringLiteral("arms")).toArray();
        QStringList arms;
        arms.reserve(armsArray.size());
        for (const QJsonValue& value : armsArray) {
            const QString armId = value.toString().trimmed();
            if (!armId.isEmpty() && !arms.contains(armId)) {
                arms.append(armId);
            }
        }
        if (!arms.isEmpty()) {
            settings.arms = arms;
        }
    }

    settings.attributionWindowHours =
        readDouble(json, "attributionWindowHours", settings.attributionWindowHours);
    settings.decayLambdaPerHour = readDouble(json, "decayLambdaPerHour", settings.decayLambdaPerHour);
    settings.batchWindowHours = readDouble(json, "batchWindowHours", settings.batchWindowHours);
    settings.clickPoints = readDouble(json, "clickPoints", settings.clickPoints);
    settings.savePoints = readDouble(json, "savePoints", settings.savePoints);
    settings.unsavePoints = readDouble(json, "unsavePoints", settings.unsavePoints);
    settings.minSamplesForBest = readInt(json, "minSamplesForBest", settings.minSamplesForBest);
    settings.confidenceZ = readDouble(json, "confidenceZ", settings.confidenceZ);
    settings.similarityThreshold =
        readDouble(json, "similarityThreshold", settings.similarityThreshold);
    settings.recommendationLimit =
        readInt(json, "recommendationLimit", settings.recommendationLimit);

    return settings;
}

bool SettingsManager::validate(const Settings& settings, QString* reasonOut)
{
    auto reject = [reasonOut](const char* reason) {
        if (reasonOut) {
            *reasonOut = QString::fromLatin1(reason);
        }
        return false;
    };

    if (!std::isfinite(settings.alpha) || settings.alpha <= 0.0) {
        return reject("alpha_must_be_positive");
    }
    if (!std::isfinite(settings.decayLambdaPerHour) || settings.decayLambdaPerHour < 0.0) {
        return reject("decay_lambda_must_be_non_negative");
    }
    if (!std::isfinite(settings.attributionWindowHours) || settings.attributionWindowHours <= 0.0) {
        return reject("attribution_window_must_be_positive");
    }
    if (!std::isfinite(settings.batchWindowHours) || settings.batchWindowHours <= 0.0) {
        return reject("batch_window_must_be_positive");
    }
    if (settings.arms.isEmpty()) {
        return reject("arms_must_not_be_empty");
    }
    if (settings.minSamplesForBest < 0 || settings.minInteractionsForActive < 1) {
        return reject("sample_thresholds_out_of_range");
    }
    if (settings.maxCachedScopes < 1) {
        return reject("max_cached_scopes_must_be_positive");
    }
    if (settings.confidenceZ <= 0.0) {
        return reject("confidence_z_must_be_positive");
    }
    if (settings.recommendationLimit < 1) {
        return reject("recommendation_limit_must_be_positive");
    }
    if (reasonOut) {
        reasonOut->clear();
    }
    return true;
}

} // namespace folio

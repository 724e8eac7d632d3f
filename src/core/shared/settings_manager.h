#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace folio {

// SettingsManager -- JSON save/load for the recommender configuration.
//
// Settings are stored as a JSON file at $FOLIO_CONFIG when set, otherwise at
//   <GenericDataLocation>/folio/settings.json
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file doesn't
    // exist, cannot be parsed, or fails validation.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);

    // Rejects values the bandit and attribution math cannot work with.
    static bool validate(const Settings& settings, QString* reasonOut = nullptr);
};

} // namespace folio

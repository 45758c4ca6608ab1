#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace pc {

// SettingsManager -- JSON save/load for retrieval settings.
//
// Settings are stored as a JSON file at $PDFCHAT_SETTINGS when set, else:
//   <GenericDataLocation>/pdfchat/settings.json
class SettingsManager {
public:
    static constexpr int kMaxSweepIntervalSeconds = 24 * 60 * 60;

    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<RetrievalSettings> load();
    static std::optional<RetrievalSettings> loadFrom(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const RetrievalSettings& settings);
    static bool saveTo(const RetrievalSettings& settings, const QString& filePath);

    // Returns the file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. Missing keys keep their defaults and
    // out-of-range values are clamped by sanitize().
    static QJsonObject toJson(const RetrievalSettings& settings);
    static RetrievalSettings fromJson(const QJsonObject& json);

    static RetrievalSettings sanitize(RetrievalSettings settings);
};

} // namespace pc

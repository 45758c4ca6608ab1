#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace pc {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

int64_t readInt64(const QJsonObject& json, const char* key, int64_t fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble()) {
        return fallback;
    }
    return static_cast<int64_t>(value.toVariant().toLongLong());
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble(fallback) : fallback;
}

QString readString(const QJsonObject& json, const char* key, const QString& fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isString() ? value.toString() : fallback;
}

} // anonymous namespace

std::optional<RetrievalSettings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<RetrievalSettings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(pcCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(pcCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const RetrievalSettings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const RetrievalSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(pcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(pcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(pcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("PDFCHAT_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/pdfchat/settings.json");
}

QJsonObject SettingsManager::toJson(const RetrievalSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("maxFileBytes"), static_cast<qint64>(settings.maxFileBytes));
    json.insert(QStringLiteral("maxSessionBytes"), static_cast<qint64>(settings.maxSessionBytes));
    json.insert(QStringLiteral("maxFilesPerSession"), settings.maxFilesPerSession);
    json.insert(QStringLiteral("maxPages"), settings.maxPages);
    json.insert(QStringLiteral("minCharsPerSquareInch"), settings.minCharsPerSquareInch);
    json.insert(QStringLiteral("chunkWindowTokens"), settings.chunkWindowTokens);
    json.insert(QStringLiteral("chunkMinTokens"), settings.chunkMinTokens);
    json.insert(QStringLiteral("chunkMaxTokens"), settings.chunkMaxTokens);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("embeddingProvider"), settings.embeddingProvider);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("embeddingMaxRetries"), settings.embeddingMaxRetries);
    json.insert(QStringLiteral("embeddingRetryBackoffMs"), settings.embeddingRetryBackoffMs);
    json.insert(QStringLiteral("modelDir"), settings.modelDir);
    json.insert(QStringLiteral("vectorBackend"), settings.vectorBackend);
    json.insert(QStringLiteral("vectorCandidates"), settings.vectorCandidates);
    json.insert(QStringLiteral("keywordCandidates"), settings.keywordCandidates);
    json.insert(QStringLiteral("maxResults"), settings.maxResults);
    json.insert(QStringLiteral("vectorWeight"), settings.vectorWeight);
    json.insert(QStringLiteral("keywordWeight"), settings.keywordWeight);
    json.insert(QStringLiteral("sessionTtlSeconds"), settings.sessionTtlSeconds);
    json.insert(QStringLiteral("sweepIntervalSeconds"), settings.sweepIntervalSeconds);
    return json;
}

RetrievalSettings SettingsManager::fromJson(const QJsonObject& json)
{
    RetrievalSettings s;

    s.maxFileBytes = readInt64(json, "maxFileBytes", s.maxFileBytes);
    s.maxSessionBytes = readInt64(json, "maxSessionBytes", s.maxSessionBytes);
    s.maxFilesPerSession = readInt(json, "maxFilesPerSession", s.maxFilesPerSession);
    s.maxPages = readInt(json, "maxPages", s.maxPages);
    s.minCharsPerSquareInch = readDouble(json, "minCharsPerSquareInch", s.minCharsPerSquareInch);
    s.chunkWindowTokens = readInt(json, "chunkWindowTokens", s.chunkWindowTokens);
    s.chunkMinTokens = readInt(json, "chunkMinTokens", s.chunkMinTokens);
    s.chunkMaxTokens = readInt(json, "chunkMaxTokens", s.chunkMaxTokens);
    s.chunkOverlap = readDouble(json, "chunkOverlap", s.chunkOverlap);
    s.embeddingProvider = readString(json, "embeddingProvider", s.embeddingProvider);
    s.embeddingDimensions = readInt(json, "embeddingDimensions", s.embeddingDimensions);
    s.embeddingBatchSize = readInt(json, "embeddingBatchSize", s.embeddingBatchSize);
    s.embeddingMaxRetries = readInt(json, "embeddingMaxRetries", s.embeddingMaxRetries);
    s.embeddingRetryBackoffMs = readInt(json, "embeddingRetryBackoffMs", s.embeddingRetryBackoffMs);
    s.modelDir = readString(json, "modelDir", s.modelDir);
    s.vectorBackend = readString(json, "vectorBackend", s.vectorBackend);
    s.vectorCandidates = readInt(json, "vectorCandidates", s.vectorCandidates);
    s.keywordCandidates = readInt(json, "keywordCandidates", s.keywordCandidates);
    s.maxResults = readInt(json, "maxResults", s.maxResults);
    s.vectorWeight = readDouble(json, "vectorWeight", s.vectorWeight);
    s.keywordWeight = readDouble(json, "keywordWeight", s.keywordWeight);
    s.sessionTtlSeconds = readInt(json, "sessionTtlSeconds", s.sessionTtlSeconds);
    s.sweepIntervalSeconds = readInt(json, "sweepIntervalSeconds", s.sweepIntervalSeconds);

    return sanitize(s);
}

RetrievalSettings SettingsManager::sanitize(RetrievalSettings s)
{
    const RetrievalSettings defaults;

    s.maxFileBytes = std::max<int64_t>(1, s.maxFileBytes);
    s.maxSessionBytes = std::max(s.maxFileBytes, s.maxSessionBytes);
    s.maxFilesPerSession = std::max(1, s.maxFilesPerSession);
    s.maxPages = std::max(1, s.maxPages);
    s.minCharsPerSquareInch = std::max(0.0, s.minCharsPerSquareInch);

    s.chunkMinTokens = std::max(1, s.chunkMinTokens);
    s.chunkMaxTokens = std::max(s.chunkMinTokens, s.chunkMaxTokens);
    s.chunkWindowTokens = std::clamp(s.chunkWindowTokens, s.chunkMinTokens, s.chunkMaxTokens);
    s.chunkOverlap = std::clamp(s.chunkOverlap, 0.0, 0.5);

    if (s.embeddingProvider != QLatin1String("hashing")
        && s.embeddingProvider != QLatin1String("onnx")) {
        LOG_WARN(pcCore, "Unknown embedding provider '%s', using hashing",
                 qUtf8Printable(s.embeddingProvider));
        s.embeddingProvider = defaults.embeddingProvider;
    }
    s.embeddingDimensions = std::max(8, s.embeddingDimensions);
    s.embeddingBatchSize = std::clamp(s.embeddingBatchSize, 1, 256);
    s.embeddingMaxRetries = std::max(0, s.embeddingMaxRetries);
    s.embeddingRetryBackoffMs = std::max(0, s.embeddingRetryBackoffMs);

    if (s.vectorBackend != QLatin1String("hnsw") && s.vectorBackend != QLatin1String("flat")) {
        LOG_WARN(pcCore, "Unknown vector backend '%s', using hnsw",
                 qUtf8Printable(s.vectorBackend));
        s.vectorBackend = defaults.vectorBackend;
    }
    s.vectorCandidates = std::max(1, s.vectorCandidates);
    s.keywordCandidates = std::max(1, s.keywordCandidates);
    s.maxResults = std::max(1, s.maxResults);
    s.vectorWeight = std::max(0.0, s.vectorWeight);
    s.keywordWeight = std::max(0.0, s.keywordWeight);
    if (s.vectorWeight + s.keywordWeight <= 0.0) {
        s.vectorWeight = defaults.vectorWeight;
        s.keywordWeight = defaults.keywordWeight;
    }

    s.sessionTtlSeconds = std::max(1, s.sessionTtlSeconds);
    // The sweep timer takes milliseconds in an int.
    s.sweepIntervalSeconds = std::clamp(s.sweepIntervalSeconds, 1, kMaxSweepIntervalSeconds);
    return s;
}

} // namespace pc

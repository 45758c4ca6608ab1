#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveAndLoadRoundtrip();
    void testMissingKeysKeepDefaults();
    void testWrongTypesKeepDefaults();
    void testSanitizeClampsChunking();
    void testSanitizeRejectsUnknownBackends();
    void testSanitizeRestoresZeroWeights();
    void testSanitizeBoundsSweepInterval();
    void testLoadMissingFile();
    void testLoadCorruptFile();
    void testSettingsPathOverride();
};

void TestSettingsManager::testDefaults()
{
    const pc::RetrievalSettings s;
    QCOMPARE(s.maxFileBytes, static_cast<int64_t>(50LL * 1024 * 1024));
    QCOMPARE(s.maxSessionBytes, static_cast<int64_t>(100LL * 1024 * 1024));
    QCOMPARE(s.maxFilesPerSession, 10);
    QCOMPARE(s.maxPages, 500);
    QCOMPARE(s.chunkMinTokens, 400);
    QCOMPARE(s.chunkMaxTokens, 600);
    QCOMPARE(s.chunkOverlap, 0.15);
    QCOMPARE(s.vectorCandidates, 20);
    QCOMPARE(s.keywordCandidates, 20);
    QCOMPARE(s.maxResults, 8);
    QCOMPARE(s.embeddingProvider, QStringLiteral("hashing"));
    QCOMPARE(s.vectorBackend, QStringLiteral("hnsw"));
}

void TestSettingsManager::testSaveAndLoadRoundtrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    pc::RetrievalSettings s;
    s.maxFilesPerSession = 4;
    s.maxFileBytes = 3LL * 1024 * 1024 * 1024;
    s.maxSessionBytes = 6LL * 1024 * 1024 * 1024;
    s.chunkWindowTokens = 120;
    s.chunkMinTokens = 100;
    s.chunkMaxTokens = 140;
    s.chunkOverlap = 0.2;
    s.vectorBackend = QStringLiteral("flat");
    s.embeddingDimensions = 128;
    s.modelDir = QStringLiteral("/opt/models");
    s.sessionTtlSeconds = 90;
    QVERIFY(pc::SettingsManager::saveTo(s, path));

    const std::optional<pc::RetrievalSettings> loaded = pc::SettingsManager::loadFrom(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->maxFilesPerSession, 4);
    QCOMPARE(loaded->maxFileBytes, static_cast<int64_t>(3LL * 1024 * 1024 * 1024));
    QCOMPARE(loaded->maxSessionBytes, static_cast<int64_t>(6LL * 1024 * 1024 * 1024));
    QCOMPARE(loaded->chunkWindowTokens, 120);
    QCOMPARE(loaded->chunkOverlap, 0.2);
    QCOMPARE(loaded->vectorBackend, QStringLiteral("flat"));
    QCOMPARE(loaded->embeddingDimensions, 128);
    QCOMPARE(loaded->modelDir, QStringLiteral("/opt/models"));
    QCOMPARE(loaded->sessionTtlSeconds, 90);
}

void TestSettingsManager::testMissingKeysKeepDefaults()
{
    const pc::RetrievalSettings s = pc::SettingsManager::fromJson(
        QJsonObject{{QStringLiteral("maxResults"), 3}});
    QCOMPARE(s.maxResults, 3);
    QCOMPARE(s.maxFilesPerSession, 10);
    QCOMPARE(s.vectorWeight, 0.4);
    QCOMPARE(s.keywordWeight, 0.6);
}

void TestSettingsManager::testWrongTypesKeepDefaults()
{
    const pc::RetrievalSettings s = pc::SettingsManager::fromJson(QJsonObject{
        {QStringLiteral("maxResults"), QStringLiteral("twelve")},
        {QStringLiteral("vectorBackend"), 7},
    });
    QCOMPARE(s.maxResults, 8);
    QCOMPARE(s.vectorBackend, QStringLiteral("hnsw"));
}

void TestSettingsManager::testSanitizeClampsChunking()
{
    pc::RetrievalSettings s;
    s.chunkMinTokens = 0;
    s.chunkMaxTokens = -5;
    s.chunkWindowTokens = 900;
    s.chunkOverlap = 0.9;
    s.maxFileBytes = 0;
    s.maxSessionBytes = -1;
    s.embeddingBatchSize = 10000;

    const pc::RetrievalSettings clean = pc::SettingsManager::sanitize(s);
    QCOMPARE(clean.chunkMinTokens, 1);
    QCOMPARE(clean.chunkMaxTokens, 1);
    QCOMPARE(clean.chunkWindowTokens, 1);
    QCOMPARE(clean.chunkOverlap, 0.5);
    QCOMPARE(clean.maxFileBytes, static_cast<int64_t>(1));
    QCOMPARE(clean.maxSessionBytes, static_cast<int64_t>(1));
    QCOMPARE(clean.embeddingBatchSize, 256);

    s = pc::RetrievalSettings();
    s.chunkWindowTokens = 50;
    QCOMPARE(pc::SettingsManager::sanitize(s).chunkWindowTokens, 400);
}

void TestSettingsManager::testSanitizeRejectsUnknownBackends()
{
    pc::RetrievalSettings s;
    s.embeddingProvider = QStringLiteral("remote-gpu");
    s.vectorBackend = QStringLiteral("faiss");
    s.embeddingDimensions = 2;

    const pc::RetrievalSettings clean = pc::SettingsManager::sanitize(s);
    QCOMPARE(clean.embeddingProvider, QStringLiteral("hashing"));
    QCOMPARE(clean.vectorBackend, QStringLiteral("hnsw"));
    QCOMPARE(clean.embeddingDimensions, 8);
}

void TestSettingsManager::testSanitizeRestoresZeroWeights()
{
    pc::RetrievalSettings s;
    s.vectorWeight = 0.0;
    s.keywordWeight = -1.0;
    const pc::RetrievalSettings clean = pc::SettingsManager::sanitize(s);
    QCOMPARE(clean.vectorWeight, 0.4);
    QCOMPARE(clean.keywordWeight, 0.6);

    s.vectorWeight = 1.0;
    s.keywordWeight = 0.0;
    const pc::RetrievalSettings vectorOnly = pc::SettingsManager::sanitize(s);
    QCOMPARE(vectorOnly.vectorWeight, 1.0);
    QCOMPARE(vectorOnly.keywordWeight, 0.0);
}

void TestSettingsManager::testSanitizeBoundsSweepInterval()
{
    pc::RetrievalSettings s;
    s.sweepIntervalSeconds = 3000000;
    QCOMPARE(pc::SettingsManager::sanitize(s).sweepIntervalSeconds, 86400);

    s.sweepIntervalSeconds = 0;
    QCOMPARE(pc::SettingsManager::sanitize(s).sweepIntervalSeconds, 1);

    // Read back from a settings file.
    QJsonObject json;
    json.insert(QStringLiteral("sweepIntervalSeconds"), 2147483);
    QCOMPARE(pc::SettingsManager::fromJson(json).sweepIntervalSeconds, 86400);
}

void TestSettingsManager::testLoadMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!pc::SettingsManager::loadFrom(dir.filePath(QStringLiteral("absent.json"))).has_value());
}

void TestSettingsManager::testLoadCorruptFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("settings.json"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"maxResults\": ");
    file.close();
    QVERIFY(!pc::SettingsManager::loadFrom(path).has_value());

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("[1, 2]");
    file.close();
    QVERIFY(!pc::SettingsManager::loadFrom(path).has_value());
}

void TestSettingsManager::testSettingsPathOverride()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("override.json"));
    const QByteArray previous = qgetenv("PDFCHAT_SETTINGS");
    qputenv("PDFCHAT_SETTINGS", path.toUtf8());

    QCOMPARE(pc::SettingsManager::settingsFilePath(), path);
    pc::RetrievalSettings s;
    s.maxResults = 5;
    QVERIFY(pc::SettingsManager::save(s));
    const std::optional<pc::RetrievalSettings> loaded = pc::SettingsManager::load();
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->maxResults, 5);

    qputenv("PDFCHAT_SETTINGS", previous);
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"

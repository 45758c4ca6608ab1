#include <QtTest/QtTest>

#include "core/shared/ipc_messages.h"
#include "core/shared/settings.h"
#include "Support/ipc_test_utils.h"
#include "Support/service_process_harness.h"
#include "Utils/pdf_fixture.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

class TestRetrievalServiceIpc : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testPing();
    void testUploadValidation();
    void testUploadIndexQueryTeardown();
    void testUploadFromPathAndUnreadableFile();
    void testUnknownMethod();

private:
    QJsonObject fileEntry(const QString& name, const QByteArray& bytes) const;
    QJsonObject waitForIndexingFinished(const QString& sessionId);

    QTemporaryDir m_workDir;
    std::unique_ptr<pc::test::ServiceProcessHarness> m_harness;
};

namespace {

constexpr int kIndexTimeoutMs = 20000;
constexpr int64_t kMaxFileBytes = 64 * 1024;

} // namespace

void TestRetrievalServiceIpc::initTestCase()
{
    QVERIFY(m_workDir.isValid());

    pc::RetrievalSettings settings;
    settings.chunkWindowTokens = 20;
    settings.chunkMinTokens = 16;
    settings.chunkMaxTokens = 24;
    settings.chunkOverlap = 0.2;
    settings.embeddingDimensions = 128;
    settings.vectorBackend = QStringLiteral("flat");
    settings.maxFileBytes = kMaxFileBytes;
    settings.maxSessionBytes = 4 * kMaxFileBytes;
    settings.maxFilesPerSession = 4;

    m_harness = std::make_unique<pc::test::ServiceProcessHarness>(
        QStringLiteral("retrieval"), QStringLiteral("pdfchat-retrieval"));
    pc::test::ServiceLaunchConfig launch;
    launch.settings = settings;
    launch.startTimeoutMs = 10000;
    QVERIFY2(m_harness->start(launch), "Failed to start retrieval service");
}

void TestRetrievalServiceIpc::cleanupTestCase()
{
    if (m_harness) {
        m_harness->stop();
        m_harness.reset();
    }
}

QJsonObject TestRetrievalServiceIpc::fileEntry(const QString& name, const QByteArray& bytes) const
{
    QJsonObject entry;
    entry[QStringLiteral("name")] = name;
    entry[QStringLiteral("data")] = QString::fromLatin1(bytes.toBase64());
    return entry;
}

QJsonObject TestRetrievalServiceIpc::waitForIndexingFinished(const QString& sessionId)
{
    return m_harness->waitForNotification(
        QStringLiteral("indexing_finished"),
        [&sessionId](const QJsonObject& params) {
            return params.value(QStringLiteral("session_id")).toString() == sessionId;
        },
        kIndexTimeoutMs);
}

void TestRetrievalServiceIpc::testPing()
{
    const QJsonObject response = m_harness->request(QStringLiteral("ping"));
    QVERIFY(pc::test::isResponse(response));
    const QJsonObject result = pc::test::resultPayload(response);
    QVERIFY(result.value(QStringLiteral("pong")).toBool());
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("retrieval"));
    QCOMPARE(result.value(QStringLiteral("embedding_provider")).toString(), QStringLiteral("hashing"));
    QCOMPARE(result.value(QStringLiteral("vector_backend")).toString(), QStringLiteral("flat"));

    const QJsonArray methods = result.value(QStringLiteral("methods")).toArray();
    for (const char* method : {"index_status", "ping", "query", "shutdown", "teardown", "upload"}) {
        QVERIFY2(methods.contains(QJsonValue(QString::fromLatin1(method))), method);
    }
}

void TestRetrievalServiceIpc::testUploadValidation()
{
    {
        QJsonObject params;
        params[QStringLiteral("files")] = QJsonArray();
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY(pc::test::isError(response));
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::InvalidParams));
    }
    {
        QJsonObject bad;
        bad[QStringLiteral("name")] = QStringLiteral("bad.pdf");
        bad[QStringLiteral("data")] = QStringLiteral("%%% not base64 %%%");
        QJsonObject params;
        params[QStringLiteral("files")] = QJsonArray{bad};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY(pc::test::isError(response));
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::InvalidParams));
    }
    {
        QJsonObject params;
        params[QStringLiteral("files")] = QJsonArray{
            fileEntry(QStringLiteral("huge.pdf"), QByteArray(kMaxFileBytes + 1, 'x'))};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY(pc::test::isError(response));
        QCOMPARE(pc::test::retrievalCode(response), QStringLiteral("UPLOAD_LIMIT_EXCEEDED"));
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::UploadLimitExceeded));
    }
    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = QStringLiteral("does-not-exist");
        params[QStringLiteral("files")] = QJsonArray{
            fileEntry(QStringLiteral("a.pdf"), pc::test::buildPdf({pc::test::fillerText(20)}))};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QCOMPARE(pc::test::retrievalCode(response), QStringLiteral("SESSION_NOT_FOUND"));
    }
}

void TestRetrievalServiceIpc::testUploadIndexQueryTeardown()
{
    const QByteArray pdf = pc::test::buildPdf({
        QStringLiteral("The capital of France is Paris. ") + pc::test::fillerText(40, 1),
        pc::test::fillerText(60, 2),
    });

    QString sessionId;
    {
        QJsonObject params;
        params[QStringLiteral("files")] = QJsonArray{fileEntry(QStringLiteral("geography.pdf"), pdf)};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY2(pc::test::isResponse(response),
                 qPrintable(pc::test::errorPayload(response).value(QStringLiteral("message")).toString()));
        const QJsonObject result = pc::test::resultPayload(response);
        sessionId = result.value(QStringLiteral("session_id")).toString();
        QCOMPARE(sessionId.size(), 32);
        QCOMPARE(result.value(QStringLiteral("total_files")).toInt(), 1);
        QCOMPARE(result.value(QStringLiteral("total_bytes")).toInteger(),
                 static_cast<qint64>(pdf.size()));
    }

    const QJsonObject finished = waitForIndexingFinished(sessionId);
    QVERIFY2(!finished.isEmpty(), "no indexing_finished notification");
    QCOMPARE(finished.value(QStringLiteral("status")).toString(), QStringLiteral("done"));
    QCOMPARE(finished.value(QStringLiteral("files_indexed")).toInt(), 1);
    QVERIFY(finished.value(QStringLiteral("chunk_count")).toInt() > 0);

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("include_documents")] = true;
        const QJsonObject response = m_harness->request(QStringLiteral("index_status"), params);
        QVERIFY(pc::test::isResponse(response));
        const QJsonObject result = pc::test::resultPayload(response);
        QCOMPARE(result.value(QStringLiteral("status")).toString(), QStringLiteral("done"));
        const QJsonArray documents = result.value(QStringLiteral("documents")).toArray();
        QCOMPARE(documents.size(), 1);
        const QJsonObject document = documents.at(0).toObject();
        QCOMPARE(document.value(QStringLiteral("document_id")).toString(), QStringLiteral("doc-1"));
        QCOMPARE(document.value(QStringLiteral("filename")).toString(), QStringLiteral("geography.pdf"));
        QCOMPARE(document.value(QStringLiteral("page_count")).toInt(), 2);
        QCOMPARE(document.value(QStringLiteral("outcome")).toString(), QStringLiteral("ok"));
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("query")] = QStringLiteral("What is the capital of France?");
        const QJsonObject response = m_harness->request(QStringLiteral("query"), params);
        QVERIFY(pc::test::isResponse(response));
        const QJsonObject result = pc::test::resultPayload(response);
        QVERIFY(result.value(QStringLiteral("vector_candidates")).toInt() > 0);
        QVERIFY(result.value(QStringLiteral("keyword_candidates")).toInt() > 0);

        const QJsonArray hits = result.value(QStringLiteral("results")).toArray();
        QVERIFY(!hits.isEmpty());
        QVERIFY(hits.size() <= 8);

        const QJsonObject top = hits.at(0).toObject();
        QCOMPARE(top.value(QStringLiteral("filename")).toString(), QStringLiteral("geography.pdf"));
        QCOMPARE(top.value(QStringLiteral("page_start")).toInt(), 1);
        QVERIFY(top.value(QStringLiteral("text")).toString().contains(QStringLiteral("Paris")));

        const QJsonObject breakdown = top.value(QStringLiteral("signals")).toObject();
        QVERIFY(breakdown.contains(QStringLiteral("vector")));
        QVERIFY(breakdown.contains(QStringLiteral("keyword")));
        QCOMPARE(breakdown.value(QStringLiteral("keyword_rank")).toInt(), 1);

        double previous = top.value(QStringLiteral("score")).toDouble();
        for (int i = 1; i < hits.size(); ++i) {
            const double score = hits.at(i).toObject().value(QStringLiteral("score")).toDouble();
            QVERIFY(score <= previous);
            previous = score;
        }
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("query")] = QStringLiteral("lantern meadow");
        params[QStringLiteral("max_results")] = 2;
        const QJsonObject response = m_harness->request(QStringLiteral("query"), params);
        QVERIFY(pc::test::isResponse(response));
        QCOMPARE(pc::test::resultPayload(response).value(QStringLiteral("results")).toArray().size(), 2);
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("query")] = QStringLiteral("   ");
        const QJsonObject response = m_harness->request(QStringLiteral("query"), params);
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::InvalidParams));
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        const QJsonObject response = m_harness->request(QStringLiteral("teardown"), params);
        QVERIFY(pc::test::isResponse(response));
        QVERIFY(pc::test::resultPayload(response).value(QStringLiteral("removed")).toBool());
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("query")] = QStringLiteral("capital");
        const QJsonObject response = m_harness->request(QStringLiteral("query"), params);
        QVERIFY(pc::test::isError(response));
        QCOMPARE(pc::test::retrievalCode(response), QStringLiteral("SESSION_NOT_FOUND"));
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::SessionNotFound));
    }
    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        const QJsonObject response = m_harness->request(QStringLiteral("teardown"), params);
        QCOMPARE(pc::test::retrievalCode(response), QStringLiteral("SESSION_NOT_FOUND"));
    }
}

void TestRetrievalServiceIpc::testUploadFromPathAndUnreadableFile()
{
    const QString pdfPath = QDir(m_workDir.path()).filePath(QStringLiteral("orchard-notes.pdf"));
    {
        QFile file(pdfPath);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(pc::test::buildPdf({pc::test::fillerText(50, 3)}));
        file.close();
    }

    QString sessionId;
    {
        QJsonObject entry;
        entry[QStringLiteral("path")] = pdfPath;
        QJsonObject params;
        params[QStringLiteral("files")] = QJsonArray{entry};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY(pc::test::isResponse(response));
        sessionId = pc::test::resultPayload(response).value(QStringLiteral("session_id")).toString();
        QVERIFY(!sessionId.isEmpty());
    }
    QCOMPARE(waitForIndexingFinished(sessionId).value(QStringLiteral("status")).toString(),
             QStringLiteral("done"));

    {
        QJsonObject entry;
        entry[QStringLiteral("path")] = QDir(m_workDir.path()).filePath(QStringLiteral("missing.pdf"));
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("files")] = QJsonArray{entry};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QCOMPARE(pc::test::errorCode(response),
                 static_cast<int>(pc::IpcErrorCode::NotFound));
    }

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("files")] = QJsonArray{
            fileEntry(QStringLiteral("broken.pdf"), pc::test::brokenPdf())};
        const QJsonObject response = m_harness->request(QStringLiteral("upload"), params);
        QVERIFY(pc::test::isResponse(response));
        QCOMPARE(pc::test::resultPayload(response).value(QStringLiteral("session_id")).toString(),
                 sessionId);
    }

    const QJsonObject finished = waitForIndexingFinished(sessionId);
    QCOMPARE(finished.value(QStringLiteral("status")).toString(), QStringLiteral("error"));
    QCOMPARE(finished.value(QStringLiteral("error_document")).toString(), QStringLiteral("broken.pdf"));
    QVERIFY(finished.value(QStringLiteral("error")).toString().startsWith(QStringLiteral("UNREADABLE_PDF")));
    QCOMPARE(finished.value(QStringLiteral("document_count")).toInt(), 2);

    {
        QJsonObject params;
        params[QStringLiteral("session_id")] = sessionId;
        params[QStringLiteral("query")] = QStringLiteral("orchard");
        const QJsonObject response = m_harness->request(QStringLiteral("query"), params);
        QCOMPARE(pc::test::retrievalCode(response), QStringLiteral("INDEX_NOT_READY"));
    }

    QJsonObject params;
    params[QStringLiteral("session_id")] = sessionId;
    QVERIFY(pc::test::isResponse(m_harness->request(QStringLiteral("teardown"), params)));
}

void TestRetrievalServiceIpc::testUnknownMethod()
{
    const QJsonObject response = m_harness->request(QStringLiteral("summarize"));
    QVERIFY(pc::test::isError(response));
    QCOMPARE(pc::test::errorCode(response),
             static_cast<int>(pc::IpcErrorCode::NotFound));
    QVERIFY(m_harness->isRunning());
}

QTEST_MAIN(TestRetrievalServiceIpc)
#include "test_retrieval_service_ipc.moc"

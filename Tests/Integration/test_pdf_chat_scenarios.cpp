#include <QtTest/QtTest>
#include "core/embedding/embedding_manager.h"
#include "core/embedding/hashing_embedding_provider.h"
#include "core/extraction/pdf_extractor.h"
#include "core/query/hybrid_query_engine.h"
#include "core/session/session_index_manager.h"
#include "Utils/pdf_fixture.h"

#include <memory>
#include <vector>

// End-to-end runs over real PDF bytes: Poppler extraction, chunking, hashing
// embeddings, both indexes and fusion.
class TestPdfChatScenarios : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testAnswerPageRanksFirst_data();
    void testAnswerPageRanksFirst();
    void testProvenanceAcrossDocuments();
    void testBlankPageInsideDocumentIsSkipped();
    void testUnreadableFileFailsTheBatch();
    void testScannedOnlyDocument();
    void testUnknownSession();
    void testTeardownReleasesSession();

private:
    void buildEngine(const QString& vectorBackend);
    QString uploadAndWait(std::vector<pc::UploadFile> files);
    pc::QueryResponse ask(const QString& sessionId, const QString& text) const;

    std::shared_ptr<pc::EmbeddingManager> m_embeddings;
    std::shared_ptr<pc::SessionIndexManager> m_sessions;
    std::unique_ptr<pc::HybridQueryEngine> m_engine;
};

namespace {

constexpr int kIndexTimeoutMs = 20000;

pc::UploadFile pdfFile(const QString& name, const QStringList& pages)
{
    return pc::UploadFile{name, pc::test::buildPdf(pages)};
}

} // namespace

void TestPdfChatScenarios::init()
{
    buildEngine(QStringLiteral("flat"));
}

void TestPdfChatScenarios::cleanup()
{
    m_engine.reset();
    m_sessions.reset();
    m_embeddings.reset();
}

void TestPdfChatScenarios::buildEngine(const QString& vectorBackend)
{
    m_engine.reset();
    m_sessions.reset();

    pc::RetrievalSettings settings;
    settings.chunkWindowTokens = 20;
    settings.chunkMinTokens = 16;
    settings.chunkMaxTokens = 24;
    settings.chunkOverlap = 0.2;
    settings.embeddingDimensions = 256;
    settings.vectorBackend = vectorBackend;

    pc::EmbeddingManagerConfig config;
    config.retryBackoffMs = 0;
    m_embeddings = std::make_shared<pc::EmbeddingManager>(
        std::make_shared<pc::HashingEmbeddingProvider>(settings.embeddingDimensions), config);

    pc::SessionIndexManager::Dependencies deps;
    deps.extractor = std::make_shared<pc::PdfExtractor>();
    deps.embeddings = m_embeddings;
    m_sessions = std::make_shared<pc::SessionIndexManager>(settings, std::move(deps));
    m_engine = std::make_unique<pc::HybridQueryEngine>(m_sessions, m_embeddings);
}

QString TestPdfChatScenarios::uploadAndWait(std::vector<pc::UploadFile> files)
{
    const pc::UploadResult upload = m_sessions->upload(QString(), std::move(files));
    if (!upload.ok()) {
        qWarning() << "upload rejected:" << upload.error->describe();
        return QString();
    }
    if (!m_sessions->waitForIndexing(upload.sessionId, kIndexTimeoutMs)) {
        qWarning() << "indexing did not finish for" << upload.sessionId;
        return QString();
    }
    return upload.sessionId;
}

pc::QueryResponse TestPdfChatScenarios::ask(const QString& sessionId, const QString& text) const
{
    pc::QueryRequest request;
    request.sessionId = sessionId;
    request.text = text;
    return m_engine->query(request);
}

void TestPdfChatScenarios::testAnswerPageRanksFirst_data()
{
    QTest::addColumn<QString>("backend");
    QTest::newRow("flat") << QStringLiteral("flat");
    QTest::newRow("hnsw") << QStringLiteral("hnsw");
}

void TestPdfChatScenarios::testAnswerPageRanksFirst()
{
    QFETCH(QString, backend);
    buildEngine(backend);

    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("geography.pdf"),
                            {QStringLiteral("The capital of France is Paris. ")
                                 + pc::test::fillerText(40, 1),
                             pc::test::fillerText(60, 2)}));
    const QString sessionId = uploadAndWait(std::move(files));
    QVERIFY(!sessionId.isEmpty());

    const pc::StatusResult status = m_sessions->status(sessionId);
    QVERIFY(status.ok());
    QCOMPARE(status.snapshot.status, pc::IndexingStatus::Done);
    QCOMPARE(status.snapshot.filesIndexed, 1);
    QVERIFY(status.snapshot.chunkCount > 3);

    const pc::QueryResponse response = ask(sessionId, QStringLiteral("What is the capital of France?"));
    QVERIFY(response.ok());
    QVERIFY(!response.hits.empty());

    const pc::QueryHit& top = response.hits.front();
    QCOMPARE(top.filename, QStringLiteral("geography.pdf"));
    QCOMPARE(top.pageStart, 1);
    QVERIFY(top.text.contains(QStringLiteral("Paris")));
    QCOMPARE(top.scores.keywordRank, 1);

    for (const pc::QueryHit& hit : response.hits) {
        if (hit.pageStart == 2) {
            QVERIFY2(top.scores.score > hit.scores.score,
                     qPrintable(QStringLiteral("page-2 chunk %1 scored %2")
                                    .arg(hit.chunkIndex)
                                    .arg(hit.scores.score)));
        }
    }
}

void TestPdfChatScenarios::testProvenanceAcrossDocuments()
{
    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("almanac.pdf"),
                            {pc::test::fillerText(50, 3)}));
    files.push_back(pdfFile(QStringLiteral("ledger.pdf"),
                            {pc::test::fillerText(30, 5),
                             pc::test::fillerText(20, 6)
                                 + QStringLiteral(" The lighthouse ledger mentions saltmarsh pilgrims. ")
                                 + pc::test::fillerText(20, 7)}));
    const QString sessionId = uploadAndWait(std::move(files));
    QVERIFY(!sessionId.isEmpty());

    const pc::QueryResponse response = ask(sessionId, QStringLiteral("saltmarsh pilgrims"));
    QVERIFY(response.ok());
    QVERIFY(!response.hits.empty());

    const pc::QueryHit& top = response.hits.front();
    QCOMPARE(top.filename, QStringLiteral("ledger.pdf"));
    QCOMPARE(top.documentId, QStringLiteral("doc-2"));
    QCOMPARE(top.documentOrder, 2);
    QCOMPARE(top.pageStart, 2);
    QVERIFY(top.text.contains(QStringLiteral("saltmarsh")));
    QVERIFY(top.startOffset < top.endOffset);

    const std::optional<std::vector<pc::DocumentRecord>> documents = m_sessions->documents(sessionId);
    QVERIFY(documents.has_value());
    QCOMPARE(documents->size(), size_t(2));
    QCOMPARE(documents->at(0).filename, QStringLiteral("almanac.pdf"));
    QCOMPARE(documents->at(0).pageCount, 1);
    QCOMPARE(documents->at(1).pageCount, 2);
    QCOMPARE(documents->at(1).outcome, pc::ExtractionOutcome::Ok);
}

void TestPdfChatScenarios::testBlankPageInsideDocumentIsSkipped()
{
    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("report.pdf"),
                            {QStringLiteral("Observatory telescope calibration notes. ")
                                 + pc::test::fillerText(30, 8),
                             QString(),
                             pc::test::fillerText(30, 9)}));
    const QString sessionId = uploadAndWait(std::move(files));
    QVERIFY(!sessionId.isEmpty());

    const pc::StatusResult status = m_sessions->status(sessionId);
    QCOMPARE(status.snapshot.status, pc::IndexingStatus::Done);

    const auto documents = m_sessions->documents(sessionId);
    QVERIFY(documents.has_value());
    QCOMPARE(documents->front().pageCount, 3);
    QCOMPARE(documents->front().scannedPageCount, 1);

    pc::QueryRequest request;
    request.sessionId = sessionId;
    request.text = QStringLiteral("observatory telescope");
    request.maxResults = 100;
    const pc::QueryResponse response = m_engine->query(request);
    QVERIFY(response.ok());
    QVERIFY(!response.hits.empty());
    QCOMPARE(response.hits.front().pageStart, 1);

    for (const pc::QueryHit& hit : response.hits) {
        QVERIFY(!(hit.pageStart == 2 && hit.pageEnd == 2));
    }
}

void TestPdfChatScenarios::testUnreadableFileFailsTheBatch()
{
    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("good.pdf"), {pc::test::fillerText(40, 4)}));
    files.push_back(pc::UploadFile{QStringLiteral("broken.pdf"), pc::test::brokenPdf()});
    const pc::UploadResult upload = m_sessions->upload(QString(), std::move(files));
    QVERIFY(upload.ok());
    QVERIFY(m_sessions->waitForIndexing(upload.sessionId, kIndexTimeoutMs));

    const pc::StatusResult status = m_sessions->status(upload.sessionId);
    QVERIFY(status.ok());
    QCOMPARE(status.snapshot.status, pc::IndexingStatus::Error);
    QVERIFY(status.snapshot.error.has_value());
    QVERIFY(status.snapshot.error->startsWith(QStringLiteral("UNREADABLE_PDF")));
    QCOMPARE(status.snapshot.errorDocument.value_or(QString()), QStringLiteral("broken.pdf"));
    QCOMPARE(status.snapshot.filesIndexed, 1);

    const auto documents = m_sessions->documents(upload.sessionId);
    QVERIFY(documents.has_value());
    QCOMPARE(documents->at(0).outcome, pc::ExtractionOutcome::Ok);
    QCOMPARE(documents->at(1).outcome, pc::ExtractionOutcome::Failed);

    const pc::QueryResponse response = ask(upload.sessionId, QStringLiteral("anything"));
    QVERIFY(!response.ok());
    QCOMPARE(response.error->code, pc::RetrievalErrorCode::IndexNotReady);
}

void TestPdfChatScenarios::testScannedOnlyDocument()
{
    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("scan.pdf"), {QString(), QString()}));
    const pc::UploadResult upload = m_sessions->upload(QString(), std::move(files));
    QVERIFY(upload.ok());
    QVERIFY(m_sessions->waitForIndexing(upload.sessionId, kIndexTimeoutMs));

    const pc::StatusResult status = m_sessions->status(upload.sessionId);
    QCOMPARE(status.snapshot.status, pc::IndexingStatus::Error);
    QVERIFY(status.snapshot.error->startsWith(QStringLiteral("UNREADABLE_PDF")));
    QCOMPARE(status.snapshot.chunkCount, 0);

    const auto documents = m_sessions->documents(upload.sessionId);
    QCOMPARE(documents->front().outcome, pc::ExtractionOutcome::Scanned);
    QCOMPARE(documents->front().scannedPageCount, 2);
}

void TestPdfChatScenarios::testUnknownSession()
{
    const pc::QueryResponse response = ask(QStringLiteral("no-such-session"),
                                           QStringLiteral("capital"));
    QVERIFY(!response.ok());
    QCOMPARE(response.error->code, pc::RetrievalErrorCode::SessionNotFound);
    QVERIFY(response.hits.empty());
}

void TestPdfChatScenarios::testTeardownReleasesSession()
{
    std::vector<pc::UploadFile> files;
    files.push_back(pdfFile(QStringLiteral("notes.pdf"), {pc::test::fillerText(40, 10)}));
    const QString sessionId = uploadAndWait(std::move(files));
    QVERIFY(!sessionId.isEmpty());
    QCOMPARE(m_sessions->sessionCount(), 1);

    QVERIFY(!m_sessions->teardown(sessionId).has_value());
    QCOMPARE(m_sessions->sessionCount(), 0);

    const pc::QueryResponse response = ask(sessionId, QStringLiteral("lantern"));
    QCOMPARE(response.error->code, pc::RetrievalErrorCode::SessionNotFound);
    QCOMPARE(m_sessions->status(sessionId).error->code, pc::RetrievalErrorCode::SessionNotFound);

    const std::optional<pc::RetrievalError> again = m_sessions->teardown(sessionId);
    QVERIFY(again.has_value());
    QCOMPARE(again->code, pc::RetrievalErrorCode::SessionNotFound);
}

QTEST_MAIN(TestPdfChatScenarios)
#include "test_pdf_chat_scenarios.moc"

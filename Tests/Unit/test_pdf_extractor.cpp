#include <QtTest/QtTest>

#include "core/extraction/pdf_extractor.h"
#include "Utils/pdf_fixture.h"

class TestPdfExtractor : public QObject {
    Q_OBJECT

private slots:
    // ── Scanned-page heuristic ───────────────────────────────────
    void testScannedPageDensity();

    // ── Real documents ───────────────────────────────────────────
    void testExtractsProgrammaticPdf();
    void testMultiPageNumbering();
    void testBlankPagesMarkedScanned();
    void testAllBlankPagesIsNoTextLayer();

    // ── Failures ─────────────────────────────────────────────────
    void testRejectsNonPdfBytes();
    void testRejectsBrokenBody();
    void testPageCeiling();
    void testExtractionErrorMapping();
};

// ── Scanned-page heuristic ───────────────────────────────────────

void TestPdfExtractor::testScannedPageDensity()
{
    // US Letter is 93.5 square inches; 0.1 chars/sq in needs 10 visible chars.
    QVERIFY(pc::PdfExtractor::isScannedPage(QString(), 612, 792, 0.1));
    QVERIFY(pc::PdfExtractor::isScannedPage(QStringLiteral("  \n\t "), 612, 792, 0.1));
    QVERIFY(pc::PdfExtractor::isScannedPage(QStringLiteral("abc def"), 612, 792, 0.1));
    QVERIFY(!pc::PdfExtractor::isScannedPage(QStringLiteral("abcdefghij"), 612, 792, 0.1));
    QVERIFY(!pc::PdfExtractor::isScannedPage(QStringLiteral("x"), 612, 792, 0.0));

    // Unknown page size: any visible text counts.
    QVERIFY(!pc::PdfExtractor::isScannedPage(QStringLiteral("x"), 0, 0, 0.1));
}

// ── Real documents ───────────────────────────────────────────────

void TestPdfExtractor::testExtractsProgrammaticPdf()
{
    const QByteArray pdf = pc::test::buildPdf(
        {QStringLiteral("The capital of France is Paris. pdfchat extractor contract.")});

    pc::PdfExtractor extractor;
    const pc::ExtractionResult result = extractor.extract(pdf, {});

    QCOMPARE(result.status, pc::ExtractionResult::Status::Success);
    QVERIFY(result.ok());
    QCOMPARE(result.pageCount, 1);
    QCOMPARE(result.scannedPageCount, 0);
    QCOMPARE(static_cast<int>(result.pages.size()), 1);
    QVERIFY(result.pages[0].text.contains(QStringLiteral("capital of France is Paris")));
    QVERIFY(!result.errorMessage.has_value());
    QVERIFY(!pc::extractionError(result, QStringLiteral("a.pdf")).has_value());
}

void TestPdfExtractor::testMultiPageNumbering()
{
    const QByteArray pdf = pc::test::buildPdf({
        QStringLiteral("First page mentions astronomy and telescopes."),
        QStringLiteral("Second page mentions botany and greenhouses."),
        QStringLiteral("Third page mentions geology and sediment layers."),
    });

    pc::PdfExtractor extractor;
    const pc::ExtractionResult result = extractor.extract(pdf, {});
    QCOMPARE(result.status, pc::ExtractionResult::Status::Success);
    QCOMPARE(result.pageCount, 3);
    QCOMPARE(static_cast<int>(result.pages.size()), 3);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(result.pages[static_cast<size_t>(i)].pageNumber, i + 1);
        QVERIFY(!result.pages[static_cast<size_t>(i)].scanned);
    }
    QVERIFY(result.pages[1].text.contains(QStringLiteral("botany")));
    QVERIFY(!result.pages[1].text.contains(QStringLiteral("astronomy")));
}

void TestPdfExtractor::testBlankPagesMarkedScanned()
{
    const QByteArray pdf = pc::test::buildPdf({
        QStringLiteral("Readable page with a proper text layer."),
        QString(),
    });

    pc::PdfExtractor extractor;
    const pc::ExtractionResult result = extractor.extract(pdf, {});
    QCOMPARE(result.status, pc::ExtractionResult::Status::Success);
    QCOMPARE(result.scannedPageCount, 1);
    QVERIFY(!result.pages[0].scanned);
    QVERIFY(result.pages[1].scanned);
}

void TestPdfExtractor::testAllBlankPagesIsNoTextLayer()
{
    const QByteArray pdf = pc::test::buildPdf({QString(), QString()});

    pc::PdfExtractor extractor;
    const pc::ExtractionResult result = extractor.extract(pdf, {});
    QCOMPARE(result.status, pc::ExtractionResult::Status::NoTextLayer);
    QCOMPARE(result.pageCount, 2);
    QCOMPARE(result.scannedPageCount, 2);

    const auto error = pc::extractionError(result, QStringLiteral("scan.pdf"));
    QVERIFY(error.has_value());
    QCOMPARE(error->code, pc::RetrievalErrorCode::UnreadablePdf);
    QVERIFY(error->message.contains(QStringLiteral("scan.pdf")));
    QVERIFY(error->message.contains(QStringLiteral("2 scanned")));
}

// ── Failures ─────────────────────────────────────────────────────

void TestPdfExtractor::testRejectsNonPdfBytes()
{
    pc::PdfExtractor extractor;

    const pc::ExtractionResult empty = extractor.extract(QByteArray(), {});
    QCOMPARE(empty.status, pc::ExtractionResult::Status::Unreadable);

    const pc::ExtractionResult text = extractor.extract(QByteArray("not a pdf file"), {});
    QCOMPARE(text.status, pc::ExtractionResult::Status::Unreadable);
    QVERIFY(text.errorMessage.has_value());
}

void TestPdfExtractor::testRejectsBrokenBody()
{
    pc::PdfExtractor extractor;
    const pc::ExtractionResult broken = extractor.extract(pc::test::brokenPdf(), {});
    QVERIFY(!broken.ok());

    // Poppler either refuses the file or recovers an empty document.
    QVERIFY(broken.status == pc::ExtractionResult::Status::Unreadable
            || broken.status == pc::ExtractionResult::Status::NoTextLayer);
    const auto error = pc::extractionError(broken, QStringLiteral("broken.pdf"));
    QVERIFY(error.has_value());
    QCOMPARE(error->code, pc::RetrievalErrorCode::UnreadablePdf);
}

void TestPdfExtractor::testPageCeiling()
{
    QStringList pages;
    for (int i = 0; i < 4; ++i) {
        pages.append(QStringLiteral("Page %1 has enough text to count as readable.").arg(i + 1));
    }
    const QByteArray pdf = pc::test::buildPdf(pages);

    pc::ExtractionLimits limits;
    limits.maxPages = 3;

    pc::PdfExtractor extractor;
    const pc::ExtractionResult result = extractor.extract(pdf, limits);
    QCOMPARE(result.status, pc::ExtractionResult::Status::PageLimitExceeded);
    QCOMPARE(result.pageCount, 4);
    QVERIFY(result.pages.empty());

    const auto error = pc::extractionError(result, QStringLiteral("long.pdf"));
    QVERIFY(error.has_value());
    QCOMPARE(error->code, pc::RetrievalErrorCode::PageLimitExceeded);

    limits.maxPages = 4;
    QCOMPARE(extractor.extract(pdf, limits).status, pc::ExtractionResult::Status::Success);
}

void TestPdfExtractor::testExtractionErrorMapping()
{
    pc::ExtractionResult locked;
    locked.status = pc::ExtractionResult::Status::Locked;
    locked.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
    const auto error = pc::extractionError(locked, QStringLiteral("secret.pdf"));
    QVERIFY(error.has_value());
    QCOMPARE(error->code, pc::RetrievalErrorCode::UnreadablePdf);
    QCOMPARE(error->message,
             QStringLiteral("secret.pdf: PDF is encrypted or password-protected"));
}

QTEST_MAIN(TestPdfExtractor)
#include "test_pdf_extractor.moc"

#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QSizeF>

#include <poppler/qt6/poppler-qt6.h>

#include <memory>

namespace pc {

namespace {

constexpr double kPointsPerSquareInch = 72.0 * 72.0;

// Any conforming PDF starts with "%PDF-" within the first kilobyte.
bool hasPdfHeader(const QByteArray& bytes)
{
    return bytes.left(1024).contains("%PDF-");
}

} // namespace

std::optional<RetrievalError> extractionError(const ExtractionResult& result,
                                              const QString& filename)
{
    const QString detail = result.errorMessage.value_or(QString());
    switch (result.status) {
    case ExtractionResult::Status::Success:
        return std::nullopt;
    case ExtractionResult::Status::PageLimitExceeded:
        return RetrievalError{RetrievalErrorCode::PageLimitExceeded,
                              QStringLiteral("%1: %2").arg(filename, detail)};
    case ExtractionResult::Status::NoTextLayer:
        return RetrievalError{RetrievalErrorCode::UnreadablePdf,
                              QStringLiteral("%1: no extractable text layer (%2 scanned page(s))")
                                  .arg(filename)
                                  .arg(result.scannedPageCount)};
    case ExtractionResult::Status::Unreadable:
    case ExtractionResult::Status::Locked:
        break;
    }
    return RetrievalError{RetrievalErrorCode::UnreadablePdf,
                          QStringLiteral("%1: %2").arg(filename, detail)};
}

bool PdfExtractor::isScannedPage(const QString& text, double widthPoints, double heightPoints,
                                 double minCharsPerSquareInch)
{
    int visible = 0;
    for (const QChar ch : text) {
        if (!ch.isSpace()) {
            ++visible;
        }
    }
    if (visible == 0) {
        return true;
    }

    const double areaSquareInches = (widthPoints * heightPoints) / kPointsPerSquareInch;
    if (areaSquareInches <= 0.0) {
        return false;
    }
    return (static_cast<double>(visible) / areaSquareInches) < minCharsPerSquareInch;
}

ExtractionResult PdfExtractor::extract(const QByteArray& pdfBytes, const ExtractionLimits& limits)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;

    if (pdfBytes.isEmpty() || !hasPdfHeader(pdfBytes)) {
        result.status = ExtractionResult::Status::Unreadable;
        result.errorMessage = QStringLiteral("not a PDF file");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(pdfBytes);
    if (!doc) {
        result.status = ExtractionResult::Status::Unreadable;
        result.errorMessage = QStringLiteral("failed to load PDF document");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(pcExtraction, "Poppler failed to load %lld bytes",
                 static_cast<long long>(pdfBytes.size()));
        return result;
    }

    // Reject encrypted/locked PDFs
    if (doc->isLocked()) {
        result.status = ExtractionResult::Status::Locked;
        result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(pcExtraction, "Rejecting encrypted PDF");
        return result;
    }

    const int pageCount = doc->numPages();
    result.pageCount = pageCount;
    if (pageCount > limits.maxPages) {
        result.status = ExtractionResult::Status::PageLimitExceeded;
        result.errorMessage = QStringLiteral("document has %1 pages, limit is %2")
                                  .arg(pageCount)
                                  .arg(limits.maxPages);
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(pcExtraction, "PDF has %d pages, over the %d page ceiling",
                 pageCount, limits.maxPages);
        return result;
    }

    result.pages.reserve(static_cast<size_t>(pageCount));
    for (int i = 0; i < pageCount; ++i) {
        PageText pageText;
        pageText.pageNumber = i + 1;

        std::unique_ptr<Poppler::Page> page = doc->page(i);
        if (!page) {
            LOG_DEBUG(pcExtraction, "Null page %d", i + 1);
            pageText.scanned = true;
            ++result.scannedPageCount;
            result.pages.push_back(std::move(pageText));
            continue;
        }

        const QSizeF size = page->pageSizeF();
        pageText.text = TextCleaner::clean(page->text(QRectF()));
        pageText.scanned = isScannedPage(pageText.text, size.width(), size.height(),
                                         limits.minCharsPerSquareInch);
        if (pageText.scanned) {
            ++result.scannedPageCount;
        }
        result.pages.push_back(std::move(pageText));
    }

    if (pageCount == 0 || result.scannedPageCount == pageCount) {
        result.status = ExtractionResult::Status::NoTextLayer;
        result.errorMessage = QStringLiteral("no extractable text layer");
    } else {
        result.status = ExtractionResult::Status::Success;
    }
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(pcExtraction, "Extracted %d pages (%d scanned) in %d ms",
              pageCount, result.scannedPageCount, result.durationMs);

    return result;
}

} // namespace pc

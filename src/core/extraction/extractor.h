#pragma once

#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>
#include <optional>
#include <vector>

namespace pc {

// Text of one PDF page, 1-based. A scanned page has no usable text layer;
// its text is kept (possibly empty) but never indexed.
struct PageText {
    int pageNumber = 1;
    QString text;
    bool scanned = false;
};

struct ExtractionLimits {
    int maxPages = 500;
    double minCharsPerSquareInch = 0.1;
};

// Result of a PDF extraction attempt.
// Pages are present on Success and on NoTextLayer (all pages scanned).
struct ExtractionResult {
    enum class Status {
        Success,
        Unreadable,          // not a loadable PDF container
        Locked,              // encrypted or password-protected
        PageLimitExceeded,
        NoTextLayer,         // every page is scanned
    };

    Status status = Status::Unreadable;
    std::vector<PageText> pages;
    int pageCount = 0;
    int scannedPageCount = 0;
    std::optional<QString> errorMessage;
    int durationMs = 0;

    bool ok() const { return status == Status::Success; }
};

// Maps a failed extraction to the retrieval error taxonomy. nullopt on Success.
std::optional<RetrievalError> extractionError(const ExtractionResult& result,
                                              const QString& filename);

// DocumentExtractor — abstract interface for PDF text backends.
//
// Implementations are stateless with respect to the caller: extract() may be
// invoked concurrently from several indexing tasks.
class DocumentExtractor {
public:
    virtual ~DocumentExtractor() = default;

    virtual ExtractionResult extract(const QByteArray& pdfBytes,
                                     const ExtractionLimits& limits) = 0;
};

} // namespace pc

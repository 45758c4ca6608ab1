#pragma once

#include "core/extraction/extractor.h"

namespace pc {

// PdfExtractor — extracts per-page text from in-memory PDF bytes using
// Poppler's Qt6 binding.
//
// Limits:
//   - documents with more than limits.maxPages pages are rejected outright
//   - encrypted PDFs are rejected (Locked status)
//   - a page whose non-whitespace character density is below
//     limits.minCharsPerSquareInch is flagged as scanned
class PdfExtractor : public DocumentExtractor {
public:
    ExtractionResult extract(const QByteArray& pdfBytes,
                             const ExtractionLimits& limits) override;

    // Page size in PDF points (1/72 inch).
    static bool isScannedPage(const QString& text, double widthPoints, double heightPoints,
                              double minCharsPerSquareInch);
};

} // namespace pc

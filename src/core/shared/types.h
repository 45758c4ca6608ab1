#pragma once

#include <QDateTime>
#include <QString>
#include <cstdint>
#include <optional>

namespace pc {

// Lifecycle of a session's background indexing.
enum class IndexingStatus {
    Pending,
    Indexing,
    Done,
    Error,
};

QString indexingStatusToString(IndexingStatus status);
IndexingStatus indexingStatusFromString(const QString& str);

// Outcome of text extraction for one uploaded document.
enum class ExtractionOutcome {
    Pending,
    Ok,
    Scanned,   // every page lacked a usable text layer
    Failed,    // unreadable container, locked, or over the page ceiling
};

QString extractionOutcomeToString(ExtractionOutcome outcome);

// One uploaded file. Immutable once extraction has run.
struct DocumentRecord {
    QString documentId;
    int uploadOrder = 0;
    QString filename;
    int64_t byteSize = 0;
    int pageCount = 0;
    int scannedPageCount = 0;
    int chunkCount = 0;
    ExtractionOutcome outcome = ExtractionOutcome::Pending;
    std::optional<QString> errorMessage;
};

// Point-in-time copy of a session's indexing state, cheap to hand out.
struct IndexingSnapshot {
    IndexingStatus status = IndexingStatus::Pending;
    int totalFiles = 0;
    int filesIndexed = 0;
    std::optional<QString> error;
    std::optional<QString> errorDocument;
    int documentCount = 0;
    int chunkCount = 0;
    int64_t totalBytes = 0;
    QDateTime createdAt;
};

} // namespace pc
